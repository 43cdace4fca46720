#include "PairAnalyzer.hpp"
#include <shared/utils/Logger.hpp>

namespace ContrastAudit::Internal::Analysis {

PairAnalyzer::PairAnalyzer(const Correction::ContrastFixer::FixerSettings& fixerSettings)
    : parser_(), contrastCalculator_(), fixer_(fixerSettings), cvdSimulator_(),
      hueClassifier_() {}

Domain::AnalysisResult PairAnalyzer::analyzePair(const std::string& foreground,
                                                 const std::string& background,
                                                 const AnalysisOptions& options) const {
    Domain::Color textColor = parser_.normalize(foreground);
    Domain::Color backgroundColor = parser_.normalize(background);

    return analyze(makePair(textColor, backgroundColor, options), options);
}

Domain::AnalysisResult PairAnalyzer::analyze(const Domain::ColorPair& pair,
                                             const AnalysisOptions& options) const {
    Domain::AnalysisResult result;
    result.textColor = pair.getForeground();
    result.backgroundColor = pair.getBackground();
    result.role = pair.getRole();
    result.contrast = contrastCalculator_.evaluate(result.textColor, result.backgroundColor);
    result.requiredRatio = pair.getMinimumRatio();
    result.passesRequired = result.contrast.meets(result.requiredRatio);

    // Suggestions recolor the foreground; the background stays the anchor
    if (!result.contrast.aaBody) {
        result.fixAA = fixer_.findFixedColor(result.textColor, result.backgroundColor,
                                             Types::WCAG_AA_BODY);
    }
    if (!result.contrast.aaaBody) {
        result.fixAAA = fixer_.findFixedColor(result.textColor, result.backgroundColor,
                                              Types::WCAG_AAA_BODY);
    }

    if (options.includeCvd) {
        result.cvdIncluded = true;
        result.cvd = cvdSimulator_.analyze(result.textColor, result.backgroundColor,
                                           result.contrast.ratio, options.includeAnomalousCvd);
        result.hueWarnings = hueClassifier_.checkRiskyHues(result.textColor,
                                                           result.backgroundColor);
    }

    LOG_DEBUG("Analyzed ", result.textColor, " on ", result.backgroundColor, ": ",
              result.contrast.ratio, ":1 (required ", result.requiredRatio, ":1, ",
              result.passesRequired ? "pass" : "fail", ")");
    return result;
}

Domain::ColorPair PairAnalyzer::makePair(const Domain::Color& foreground,
                                         const Domain::Color& background,
                                         const AnalysisOptions& options) {
    if (options.minRatio) {
        return Domain::ColorPair(foreground, background, options.role, *options.minRatio);
    }
    return Domain::ColorPair(foreground, background, options.role, options.level);
}

}  // namespace ContrastAudit::Internal::Analysis
