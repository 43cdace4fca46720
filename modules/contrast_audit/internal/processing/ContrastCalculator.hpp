#pragma once

#include "ColorSpaceConverter.hpp"
#include "../domain/Color.hpp"
#include "../domain/ContrastResult.hpp"
#include <shared/types/Common.hpp>

namespace ContrastAudit::Internal::Processing {

// WCAG 2.x relative luminance and contrast ratio
class ContrastCalculator {
  public:
    // Rec. 709 luminance coefficients applied to linearized sRGB
    static constexpr double LUMINANCE_RED = 0.2126;
    static constexpr double LUMINANCE_GREEN = 0.7152;
    static constexpr double LUMINANCE_BLUE = 0.0722;

    static constexpr double FLARE_OFFSET = 0.05;

    double relativeLuminance(const Domain::Color& color) const;

    // Order-independent; result lies in [1, 21]
    double contrastRatio(const Domain::Color& first, const Domain::Color& second) const;

    Domain::ContrastResult rate(double ratio) const;

    Domain::ContrastResult evaluate(const Domain::Color& foreground,
                                    const Domain::Color& background) const;

  private:
    ColorSpaceConverter colorConverter_;
};

}  // namespace ContrastAudit::Internal::Processing
