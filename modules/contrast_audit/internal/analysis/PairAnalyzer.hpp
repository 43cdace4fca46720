#pragma once

#include "../correction/ContrastFixer.hpp"
#include "../domain/AnalysisResult.hpp"
#include "../domain/ColorPair.hpp"
#include "../processing/ColorParser.hpp"
#include "../processing/ContrastCalculator.hpp"
#include "../processing/CvdSimulator.hpp"
#include "../processing/HueRiskClassifier.hpp"
#include <shared/types/Common.hpp>
#include <optional>
#include <string>

namespace ContrastAudit::Internal::Analysis {

struct AnalysisOptions {
    bool includeCvd = false;
    bool includeAnomalousCvd = false;
    std::optional<double> minRatio;   // Overrides the role/level minimum
    Types::PairRole role = Types::PairRole::TEXT;
    Types::ComplianceLevel level = Types::ComplianceLevel::AA;
};

class PairAnalyzer {
  public:
    explicit PairAnalyzer(const Correction::ContrastFixer::FixerSettings& fixerSettings =
                              Correction::ContrastFixer::FixerSettings{});

    // Throws Domain::InvalidColorError when either literal cannot be normalized
    Domain::AnalysisResult analyzePair(const std::string& foreground,
                                       const std::string& background,
                                       const AnalysisOptions& options = {}) const;

    Domain::AnalysisResult analyze(const Domain::ColorPair& pair,
                                   const AnalysisOptions& options = {}) const;

  private:
    Processing::ColorParser parser_;
    Processing::ContrastCalculator contrastCalculator_;
    Correction::ContrastFixer fixer_;
    Processing::CvdSimulator cvdSimulator_;
    Processing::HueRiskClassifier hueClassifier_;

    static Domain::ColorPair makePair(const Domain::Color& foreground,
                                      const Domain::Color& background,
                                      const AnalysisOptions& options);
};

}  // namespace ContrastAudit::Internal::Analysis
