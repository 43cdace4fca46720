#include "ContrastCalculator.hpp"
#include <algorithm>

namespace ContrastAudit::Internal::Processing {

double ContrastCalculator::relativeLuminance(const Domain::Color& color) const {
    Types::ColorValue linear = colorConverter_.toLinear(color);
    return LUMINANCE_RED * linear[0] + LUMINANCE_GREEN * linear[1] + LUMINANCE_BLUE * linear[2];
}

double ContrastCalculator::contrastRatio(const Domain::Color& first,
                                         const Domain::Color& second) const {
    double firstLuminance = relativeLuminance(first);
    double secondLuminance = relativeLuminance(second);

    double lighter = std::max(firstLuminance, secondLuminance);
    double darker = std::min(firstLuminance, secondLuminance);

    return (lighter + FLARE_OFFSET) / (darker + FLARE_OFFSET);
}

Domain::ContrastResult ContrastCalculator::rate(double ratio) const {
    return Domain::ContrastResult::fromRatio(ratio);
}

Domain::ContrastResult ContrastCalculator::evaluate(const Domain::Color& foreground,
                                                    const Domain::Color& background) const {
    return rate(contrastRatio(foreground, background));
}

}  // namespace ContrastAudit::Internal::Processing
