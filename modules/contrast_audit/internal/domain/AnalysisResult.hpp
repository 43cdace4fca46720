#pragma once

#include "Color.hpp"
#include "ContrastResult.hpp"
#include <shared/types/Common.hpp>
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace ContrastAudit::Domain {

struct FixSuggestion {
    Color color;
    double achievedRatio = Types::MIN_CONTRAST_RATIO;
    double targetRatio = Types::MIN_CONTRAST_RATIO;
    double lightnessDelta = 0.0;   // |L - L0| in HSL percent
    bool isFallback = false;       // best of black/white, target unreachable

    bool meetsTarget(double tolerance) const { return achievedRatio >= targetRatio - tolerance; }
};

struct CvdAnalysis {
    Types::DeficiencyType type = Types::DeficiencyType::PROTANOPIA;
    Color simulatedForeground;
    Color simulatedBackground;
    double simulatedRatio = Types::MIN_CONTRAST_RATIO;
    double deltaE = 0.0;
    Types::RiskLevel risk = Types::RiskLevel::OK;
};

struct AnalysisResult {
    Color textColor;
    Color backgroundColor;
    Types::PairRole role = Types::PairRole::TEXT;
    ContrastResult contrast;

    double requiredRatio = Types::WCAG_AA_BODY;
    bool passesRequired = false;

    std::optional<FixSuggestion> fixAA;
    std::optional<FixSuggestion> fixAAA;

    bool cvdIncluded = false;
    std::vector<CvdAnalysis> cvd;
    std::vector<std::string> hueWarnings;

    Types::RiskLevel worstCvdRisk() const {
        Types::RiskLevel worst = Types::RiskLevel::OK;
        for (const auto& entry : cvd) {
            worst = std::max(worst, entry.risk);
        }
        return worst;
    }
};

}  // namespace ContrastAudit::Domain
