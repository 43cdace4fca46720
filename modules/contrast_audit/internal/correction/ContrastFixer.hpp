#pragma once

#include "../domain/AnalysisResult.hpp"
#include "../domain/Color.hpp"
#include "../processing/ColorSpaceConverter.hpp"
#include "../processing/ContrastCalculator.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <optional>

namespace ContrastAudit::Internal::Correction {

// Searches HSL lightness for the closest color that reaches a target ratio
// against a fixed anchor, keeping hue and saturation.
class ContrastFixer {
  public:
    struct FixerSettings {
        int maxIterations;      // Per search direction
        double tolerance;       // Early exit once |ratio - target| < tolerance

        FixerSettings()
            : maxIterations(50)
            , tolerance(0.05) {}
    };

    explicit ContrastFixer(const FixerSettings& settings = FixerSettings{});

    Domain::FixSuggestion findFixedColor(const Domain::Color& color,
                                         const Domain::Color& anchor,
                                         double targetRatio) const;

    void setSettings(const FixerSettings& settings);
    FixerSettings getSettings() const;

  private:
    struct Candidate {
        Domain::Color color;
        double lightness = 0.0;
        double ratio = 0.0;
    };

    FixerSettings settings_;
    Processing::ColorSpaceConverter colorConverter_;
    Processing::ContrastCalculator contrastCalculator_;

    // extremeLightness is 0 (darken) or 100 (lighten)
    std::optional<Candidate> searchDirection(const Types::ColorValue& hsl,
                                             const Domain::Color& anchor,
                                             double targetRatio,
                                             double extremeLightness) const;

    Domain::FixSuggestion fallbackToExtreme(const Domain::Color& anchor, double targetRatio,
                                            double originalLightness) const;
};

}  // namespace ContrastAudit::Internal::Correction
