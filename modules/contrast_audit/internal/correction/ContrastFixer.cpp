#include "ContrastFixer.hpp"
#include <cmath>

namespace ContrastAudit::Internal::Correction {

ContrastFixer::ContrastFixer(const FixerSettings& settings)
    : settings_(settings), colorConverter_(), contrastCalculator_() {
    LOG_DEBUG("Contrast fixer initialized (max iterations ", settings_.maxIterations,
              ", tolerance ", settings_.tolerance, ")");
}

Domain::FixSuggestion ContrastFixer::findFixedColor(const Domain::Color& color,
                                                    const Domain::Color& anchor,
                                                    double targetRatio) const {
    Types::ColorValue hsl = colorConverter_.toHSL(color);
    const double originalLightness = hsl[2];

    double currentRatio = contrastCalculator_.contrastRatio(color, anchor);
    if (currentRatio >= targetRatio) {
        Domain::FixSuggestion unchanged;
        unchanged.color = color;
        unchanged.achievedRatio = currentRatio;
        unchanged.targetRatio = targetRatio;
        return unchanged;
    }

    std::optional<Candidate> darker = searchDirection(hsl, anchor, targetRatio, 0.0);
    std::optional<Candidate> lighter = searchDirection(hsl, anchor, targetRatio, 100.0);

    if (!darker && !lighter) {
        LOG_DEBUG("No hue-preserving fix for ", color, " against ", anchor, " at ", targetRatio,
                  ":1, falling back to black/white");
        return fallbackToExtreme(anchor, targetRatio, originalLightness);
    }

    // Ties go to the darker candidate; distance is raw HSL lightness only
    const Candidate* chosen = nullptr;
    if (darker && (!lighter || std::abs(darker->lightness - originalLightness) <=
                                   std::abs(lighter->lightness - originalLightness))) {
        chosen = &*darker;
    } else {
        chosen = &*lighter;
    }

    Domain::FixSuggestion suggestion;
    suggestion.color = chosen->color;
    suggestion.achievedRatio = chosen->ratio;
    suggestion.targetRatio = targetRatio;
    suggestion.lightnessDelta = std::abs(chosen->lightness - originalLightness);

    LOG_DEBUG("Fixed ", color, " -> ", suggestion.color, " against ", anchor, " (",
              suggestion.achievedRatio, ":1, target ", targetRatio, ":1)");
    return suggestion;
}

std::optional<ContrastFixer::Candidate> ContrastFixer::searchDirection(
    const Types::ColorValue& hsl,
    const Domain::Color& anchor,
    double targetRatio,
    double extremeLightness) const {

    // Feasibility: the endpoint (black or white) must reach the target
    Candidate best;
    best.color = colorConverter_.fromHSL(Types::ColorValue(hsl[0], hsl[1], extremeLightness));
    best.lightness = extremeLightness;
    best.ratio = contrastCalculator_.contrastRatio(best.color, anchor);
    if (best.ratio < targetRatio) {
        return std::nullopt;
    }

    double nearBound = hsl[2];
    double farBound = extremeLightness;

    for (int iteration = 0; iteration < settings_.maxIterations; ++iteration) {
        double midpoint = (nearBound + farBound) / 2.0;
        Domain::Color candidate =
            colorConverter_.fromHSL(Types::ColorValue(hsl[0], hsl[1], midpoint));
        double ratio = contrastCalculator_.contrastRatio(candidate, anchor);

        if (std::abs(ratio - targetRatio) < settings_.tolerance) {
            best = {candidate, midpoint, ratio};
            break;
        }

        if (ratio >= targetRatio) {
            best = {candidate, midpoint, ratio};
            farBound = midpoint;
        } else {
            nearBound = midpoint;
        }
    }

    return best;
}

Domain::FixSuggestion ContrastFixer::fallbackToExtreme(const Domain::Color& anchor,
                                                       double targetRatio,
                                                       double originalLightness) const {
    const Domain::Color black = Domain::Color::black();
    const Domain::Color white = Domain::Color::white();
    double blackRatio = contrastCalculator_.contrastRatio(black, anchor);
    double whiteRatio = contrastCalculator_.contrastRatio(white, anchor);

    Domain::FixSuggestion suggestion;
    suggestion.targetRatio = targetRatio;
    suggestion.isFallback = true;

    if (blackRatio >= whiteRatio) {
        suggestion.color = black;
        suggestion.achievedRatio = blackRatio;
        suggestion.lightnessDelta = originalLightness;
    } else {
        suggestion.color = white;
        suggestion.achievedRatio = whiteRatio;
        suggestion.lightnessDelta = 100.0 - originalLightness;
    }

    return suggestion;
}

void ContrastFixer::setSettings(const FixerSettings& settings) {
    settings_ = settings;
}

ContrastFixer::FixerSettings ContrastFixer::getSettings() const {
    return settings_;
}

}  // namespace ContrastAudit::Internal::Correction
