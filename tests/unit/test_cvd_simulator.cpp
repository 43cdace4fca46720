#include <gtest/gtest.h>

#include <contrast_audit/internal/processing/CvdSimulator.hpp>

#include <cstdlib>

using namespace ContrastAudit;
using Internal::Processing::CvdSimulator;

namespace {

void expectNearColor(const Domain::Color& actual, const Domain::Color& expected)
{
    EXPECT_LE(std::abs(actual.red() - expected.red()), 1) << actual << " vs " << expected;
    EXPECT_LE(std::abs(actual.green() - expected.green()), 1) << actual << " vs " << expected;
    EXPECT_LE(std::abs(actual.blue() - expected.blue()), 1) << actual << " vs " << expected;
}

}  // namespace

TEST(CvdSimulator, NeutralColorsArePreserved)
{
    CvdSimulator simulator;
    const Domain::Color neutrals[] = {Domain::Color::black(), Domain::Color::white(),
                                      Domain::Color(128, 128, 128)};
    for (const auto& type : CvdSimulator::dichromaticTypes()) {
        for (const auto& color : neutrals) {
            expectNearColor(simulator.simulate(color, type), color);
        }
    }
}

TEST(CvdSimulator, ProtanopiaDarkensRed)
{
    CvdSimulator simulator;
    Domain::Color simulated = simulator.simulate(Domain::Color(255, 0, 0),
                                                 Types::DeficiencyType::PROTANOPIA);
    EXPECT_LT(simulated.red(), 128);
    EXPECT_GT(simulated.green(), 0);
}

TEST(CvdSimulator, SimulatedChannelsAreClamped)
{
    // Tritanopia maps pure red outside the gamut (red above 1, green below 0)
    CvdSimulator simulator;
    Domain::Color simulated = simulator.simulate(Domain::Color(255, 0, 0),
                                                 Types::DeficiencyType::TRITANOPIA);
    EXPECT_EQ(simulated.red(), 255);
    EXPECT_EQ(simulated.green(), 0);
}

TEST(CvdSimulator, AnalyzeReturnsDichromaciesByDefault)
{
    CvdSimulator simulator;
    auto analyses = simulator.analyze(Domain::Color(0xe5, 0x3e, 0x3e),
                                      Domain::Color(0x38, 0xa1, 0x69), 1.27);
    ASSERT_EQ(analyses.size(), 3u);
    EXPECT_EQ(analyses[0].type, Types::DeficiencyType::PROTANOPIA);
    EXPECT_EQ(analyses[1].type, Types::DeficiencyType::DEUTERANOPIA);
    EXPECT_EQ(analyses[2].type, Types::DeficiencyType::TRITANOPIA);
}

TEST(CvdSimulator, AnalyzeAddsAnomalousTypesOnRequest)
{
    CvdSimulator simulator;
    auto analyses = simulator.analyze(Domain::Color(0xe5, 0x3e, 0x3e),
                                      Domain::Color(0x38, 0xa1, 0x69), 1.27, true);
    ASSERT_EQ(analyses.size(), 5u);
    EXPECT_EQ(analyses[3].type, Types::DeficiencyType::PROTANOMALY);
    EXPECT_EQ(analyses[4].type, Types::DeficiencyType::DEUTERANOMALY);
}

TEST(CvdSimulator, BlackOnWhiteIsSafe)
{
    CvdSimulator simulator;
    auto analyses = simulator.analyze(Domain::Color::black(), Domain::Color::white(), 21.0);
    for (const auto& analysis : analyses) {
        EXPECT_NEAR(analysis.simulatedRatio, 21.0, 0.01);
        EXPECT_GT(analysis.deltaE, 99.0);
        EXPECT_EQ(analysis.risk, Types::RiskLevel::OK);
    }
}

TEST(CvdSimulator, RedGreenPairIsHighRiskForDeuteranopia)
{
    CvdSimulator simulator;
    auto analysis = simulator.analyzeType(Domain::Color(255, 0, 0), Domain::Color(0, 255, 0), 2.91,
                                          Types::DeficiencyType::DEUTERANOPIA);
    EXPECT_LT(analysis.simulatedRatio, 3.0);
    EXPECT_EQ(analysis.risk, Types::RiskLevel::HIGH);
}

TEST(CvdSimulator, ClassifyRiskPrecedence)
{
    // Perceptual distance outranks ratio checks
    EXPECT_EQ(CvdSimulator::classifyRisk(2.0, 15.0, 15.0), Types::RiskLevel::CRITICAL);
    EXPECT_EQ(CvdSimulator::classifyRisk(5.0, 15.0, 15.0), Types::RiskLevel::HIGH);
    EXPECT_EQ(CvdSimulator::classifyRisk(20.0, 2.5, 15.0), Types::RiskLevel::HIGH);
    EXPECT_EQ(CvdSimulator::classifyRisk(20.0, 4.0, 5.0), Types::RiskLevel::WARNING);
    EXPECT_EQ(CvdSimulator::classifyRisk(20.0, 4.0, 4.2), Types::RiskLevel::OK);
    EXPECT_EQ(CvdSimulator::classifyRisk(20.0, 6.0, 6.0), Types::RiskLevel::OK);
}

TEST(CvdSimulator, ClassifyRiskBoundaries)
{
    EXPECT_EQ(CvdSimulator::classifyRisk(3.0, 10.0, 10.0), Types::RiskLevel::HIGH);
    EXPECT_EQ(CvdSimulator::classifyRisk(10.0, 10.0, 10.0), Types::RiskLevel::OK);
    EXPECT_EQ(CvdSimulator::classifyRisk(20.0, 3.0, 3.0), Types::RiskLevel::OK);
    EXPECT_EQ(CvdSimulator::classifyRisk(20.0, 4.5, 10.0), Types::RiskLevel::OK);
}
