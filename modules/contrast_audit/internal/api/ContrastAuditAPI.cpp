#include "../../interface/ContrastAuditAPI.hpp"
#include "../correction/ContrastFixer.hpp"
#include "../processing/ColorParser.hpp"
#include "../processing/ContrastCalculator.hpp"

namespace ContrastAudit::SimpleAPI {

std::string normalizeColor(const std::string& color) {
    Internal::Processing::ColorParser parser;
    return parser.normalizeToHex(color);
}

double contrastRatio(const std::string& first, const std::string& second) {
    Internal::Processing::ColorParser parser;
    Internal::Processing::ContrastCalculator calculator;
    return calculator.contrastRatio(parser.normalize(first), parser.normalize(second));
}

Domain::FixSuggestion suggestFix(const std::string& color,
                                 const std::string& anchor,
                                 double targetRatio) {
    Internal::Processing::ColorParser parser;
    Internal::Correction::ContrastFixer fixer;
    return fixer.findFixedColor(parser.normalize(color), parser.normalize(anchor), targetRatio);
}

Domain::AnalysisResult analyzePair(const std::string& foreground,
                                   const std::string& background,
                                   const AnalysisOptions& options) {
    Internal::Analysis::PairAnalyzer analyzer;
    return analyzer.analyzePair(foreground, background, options);
}

Domain::AnalysisResult analyzePair(const std::string& foreground,
                                   const std::string& background,
                                   const Interface::IConfiguration& config) {
    AnalysisOptions options;
    options.includeCvd = config.isCvdAnalysisEnabled();
    options.includeAnomalousCvd = config.isAnomalousCvdEnabled();
    options.minRatio = config.getMinRatio();
    options.role = config.getPairRole();
    options.level = config.getComplianceLevel();

    Internal::Correction::ContrastFixer::FixerSettings fixerSettings;
    fixerSettings.tolerance = config.getFixerTolerance();
    fixerSettings.maxIterations = config.getFixerMaxIterations();

    Internal::Analysis::PairAnalyzer analyzer(fixerSettings);
    return analyzer.analyzePair(foreground, background, options);
}

}  // namespace ContrastAudit::SimpleAPI
