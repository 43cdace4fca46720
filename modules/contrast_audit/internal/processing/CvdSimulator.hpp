#pragma once

#include "ColorSpaceConverter.hpp"
#include "ContrastCalculator.hpp"
#include "../domain/AnalysisResult.hpp"
#include "../domain/Color.hpp"
#include <shared/types/Common.hpp>
#include <vector>

namespace ContrastAudit::Internal::Processing {

// Color vision deficiency simulation in linear RGB
class CvdSimulator {
  public:
    // Risk thresholds
    static constexpr double CRITICAL_DELTA_E = 3.0;
    static constexpr double HIGH_DELTA_E = 10.0;

    static const Types::Matrix3x3& matrixFor(Types::DeficiencyType type);

    static const std::vector<Types::DeficiencyType>& dichromaticTypes();
    static const std::vector<Types::DeficiencyType>& anomalousTypes();

    Domain::Color simulate(const Domain::Color& color, Types::DeficiencyType type) const;

    // One entry per dichromatic type, plus the anomalous trichromacies when requested
    std::vector<Domain::CvdAnalysis> analyze(const Domain::Color& foreground,
                                             const Domain::Color& background,
                                             double originalRatio,
                                             bool includeAnomalous = false) const;

    Domain::CvdAnalysis analyzeType(const Domain::Color& foreground,
                                    const Domain::Color& background,
                                    double originalRatio,
                                    Types::DeficiencyType type) const;

    // Precedence: near-identical perception outranks any ratio check
    static Types::RiskLevel classifyRisk(double deltaE, double simulatedRatio, double originalRatio);

  private:
    ColorSpaceConverter colorConverter_;
    ContrastCalculator contrastCalculator_;
};

}  // namespace ContrastAudit::Internal::Processing
