#include "CvdSimulator.hpp"
#include <shared/utils/Logger.hpp>
#include <map>

namespace ContrastAudit::Internal::Processing {

namespace {

// Machado, Oliveira & Fernandes (2009) linear-RGB matrices. Dichromacies at
// severity 1.0, anomalous trichromacies at severity 0.6.
const std::map<Types::DeficiencyType, Types::Matrix3x3>& deficiencyMatrices() {
    static const std::map<Types::DeficiencyType, Types::Matrix3x3> matrices = {
        {Types::DeficiencyType::PROTANOPIA,
         Types::Matrix3x3( 0.152286,  1.052583, -0.204868,
                           0.114503,  0.786281,  0.099216,
                          -0.003882, -0.048116,  1.051998)},
        {Types::DeficiencyType::DEUTERANOPIA,
         Types::Matrix3x3( 0.367322,  0.860646, -0.227968,
                           0.280085,  0.672501,  0.047413,
                          -0.011820,  0.042940,  0.968881)},
        {Types::DeficiencyType::TRITANOPIA,
         Types::Matrix3x3( 1.255528, -0.076749, -0.178779,
                          -0.078411,  0.930809,  0.147602,
                           0.004733,  0.691367,  0.303900)},
        {Types::DeficiencyType::PROTANOMALY,
         Types::Matrix3x3( 0.458064,  0.679578, -0.137642,
                           0.092785,  0.846313,  0.060902,
                          -0.007494, -0.016807,  1.024301)},
        {Types::DeficiencyType::DEUTERANOMALY,
         Types::Matrix3x3( 0.547494,  0.607765, -0.155259,
                           0.181692,  0.781742,  0.036566,
                          -0.010410,  0.027275,  0.983136)},
    };
    return matrices;
}

}  // namespace

const Types::Matrix3x3& CvdSimulator::matrixFor(Types::DeficiencyType type) {
    return deficiencyMatrices().at(type);
}

const std::vector<Types::DeficiencyType>& CvdSimulator::dichromaticTypes() {
    static const std::vector<Types::DeficiencyType> types = {
        Types::DeficiencyType::PROTANOPIA,
        Types::DeficiencyType::DEUTERANOPIA,
        Types::DeficiencyType::TRITANOPIA,
    };
    return types;
}

const std::vector<Types::DeficiencyType>& CvdSimulator::anomalousTypes() {
    static const std::vector<Types::DeficiencyType> types = {
        Types::DeficiencyType::PROTANOMALY,
        Types::DeficiencyType::DEUTERANOMALY,
    };
    return types;
}

Domain::Color CvdSimulator::simulate(const Domain::Color& color,
                                     Types::DeficiencyType type) const {
    Types::ColorValue linear = colorConverter_.toLinear(color);
    Types::ColorValue transformed = matrixFor(type) * linear;

    // fromLinear clamps each channel to [0,1] before gamma encoding
    return colorConverter_.fromLinear(transformed);
}

std::vector<Domain::CvdAnalysis> CvdSimulator::analyze(const Domain::Color& foreground,
                                                       const Domain::Color& background,
                                                       double originalRatio,
                                                       bool includeAnomalous) const {
    std::vector<Domain::CvdAnalysis> analyses;
    analyses.reserve(dichromaticTypes().size() + anomalousTypes().size());

    for (Types::DeficiencyType type : dichromaticTypes()) {
        analyses.push_back(analyzeType(foreground, background, originalRatio, type));
    }

    if (includeAnomalous) {
        for (Types::DeficiencyType type : anomalousTypes()) {
            analyses.push_back(analyzeType(foreground, background, originalRatio, type));
        }
    }

    return analyses;
}

Domain::CvdAnalysis CvdSimulator::analyzeType(const Domain::Color& foreground,
                                              const Domain::Color& background,
                                              double originalRatio,
                                              Types::DeficiencyType type) const {
    Domain::CvdAnalysis analysis;
    analysis.type = type;
    analysis.simulatedForeground = simulate(foreground, type);
    analysis.simulatedBackground = simulate(background, type);
    analysis.simulatedRatio = contrastCalculator_.contrastRatio(analysis.simulatedForeground,
                                                                analysis.simulatedBackground);
    analysis.deltaE = colorConverter_.deltaE(analysis.simulatedForeground,
                                             analysis.simulatedBackground);
    analysis.risk = classifyRisk(analysis.deltaE, analysis.simulatedRatio, originalRatio);

    LOG_DEBUG(Types::toString(type), ": ", analysis.simulatedForeground, " on ",
              analysis.simulatedBackground, " ratio ", analysis.simulatedRatio, " dE ",
              analysis.deltaE, " -> ", Types::toString(analysis.risk));
    return analysis;
}

Types::RiskLevel CvdSimulator::classifyRisk(double deltaE, double simulatedRatio,
                                            double originalRatio) {
    if (deltaE < CRITICAL_DELTA_E) {
        return Types::RiskLevel::CRITICAL;
    }
    if (deltaE < HIGH_DELTA_E) {
        return Types::RiskLevel::HIGH;
    }
    if (simulatedRatio < Types::WCAG_AA_LARGE) {
        return Types::RiskLevel::HIGH;
    }
    if (simulatedRatio < Types::WCAG_AA_BODY && originalRatio >= Types::WCAG_AA_BODY) {
        return Types::RiskLevel::WARNING;
    }
    return Types::RiskLevel::OK;
}

}  // namespace ContrastAudit::Internal::Processing
