#pragma once

#include "ColorSpaceConverter.hpp"
#include "../domain/Color.hpp"
#include <shared/types/Common.hpp>
#include <string>
#include <vector>

namespace ContrastAudit::Internal::Processing {

// Static hue-band heuristics for color combinations known to be confused
// under color vision deficiency. Advisory only; independent of simulation.
class HueRiskClassifier {
  public:
    enum class HueBand { RED, GREEN, BLUE, PURPLE, YELLOW, BROWN };

    struct RiskyCombination {
        HueBand first;
        HueBand second;
        const char* warning;
    };

    static const std::vector<RiskyCombination>& riskyCombinations();

    static const char* bandName(HueBand band);

    // A color may fall into several bands (e.g. dark red is also brown)
    std::vector<HueBand> classify(const Domain::Color& color) const;

    // Each detected combination is reported once, whichever color carries which band
    std::vector<std::string> checkRiskyHues(const Domain::Color& foreground,
                                            const Domain::Color& background) const;

  private:
    ColorSpaceConverter colorConverter_;
};

}  // namespace ContrastAudit::Internal::Processing
