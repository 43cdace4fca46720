#include <gtest/gtest.h>

#include <contrast_audit/interface/ContrastAuditAPI.hpp>
#include <contrast_audit/internal/analysis/PairAnalyzer.hpp>
#include <contrast_audit/internal/config/AuditConfiguration.hpp>

using namespace ContrastAudit;
using Internal::Analysis::AnalysisOptions;
using Internal::Analysis::PairAnalyzer;

// ─── Reference pairs ─────────────────────────────────────────────────────────

TEST(PairAnalyzer, DarkGrayOnWhitePassesEverything)
{
    PairAnalyzer analyzer;
    Domain::AnalysisResult result = analyzer.analyzePair("#333333", "#ffffff");

    EXPECT_NEAR(result.contrast.ratio, 12.63, 0.01);
    EXPECT_TRUE(result.contrast.passesAll());
    EXPECT_TRUE(result.passesRequired);
    EXPECT_FALSE(result.fixAA.has_value());
    EXPECT_FALSE(result.fixAAA.has_value());
    EXPECT_FALSE(result.cvdIncluded);
    EXPECT_TRUE(result.cvd.empty());
}

TEST(PairAnalyzer, MidGraysFailAndGetFixes)
{
    PairAnalyzer analyzer;
    Domain::AnalysisResult result = analyzer.analyzePair("#777777", "#888888");

    EXPECT_NEAR(result.contrast.ratio, 1.26, 0.01);
    EXPECT_FALSE(result.contrast.aaBody);
    EXPECT_FALSE(result.contrast.aaLarge);
    EXPECT_FALSE(result.contrast.aaaBody);
    EXPECT_FALSE(result.contrast.aaaLarge);
    EXPECT_FALSE(result.passesRequired);

    ASSERT_TRUE(result.fixAA.has_value());
    EXPECT_GE(result.fixAA->achievedRatio, 4.45);
    EXPECT_FALSE(result.fixAA->isFallback);

    // 7:1 is out of reach against #888888; the best extreme is offered
    ASSERT_TRUE(result.fixAAA.has_value());
    EXPECT_TRUE(result.fixAAA->isFallback);
    EXPECT_EQ(result.fixAAA->color, Domain::Color::black());
}

TEST(PairAnalyzer, RedOnGreenWithCvd)
{
    PairAnalyzer analyzer;
    AnalysisOptions options;
    options.includeCvd = true;
    Domain::AnalysisResult result = analyzer.analyzePair("#e53e3e", "#38a169", options);

    EXPECT_TRUE(result.cvdIncluded);
    ASSERT_EQ(result.cvd.size(), 3u);
    EXPECT_EQ(result.cvd[0].type, Types::DeficiencyType::PROTANOPIA);
    EXPECT_EQ(result.cvd[1].type, Types::DeficiencyType::DEUTERANOPIA);
    EXPECT_EQ(result.cvd[2].type, Types::DeficiencyType::TRITANOPIA);
    for (const auto& entry : result.cvd) {
        EXPECT_NE(entry.risk, Types::RiskLevel::OK) << Types::toString(entry.type);
    }
    EXPECT_GE(result.worstCvdRisk(), Types::RiskLevel::HIGH);

    ASSERT_FALSE(result.hueWarnings.empty());
    EXPECT_NE(result.hueWarnings.front().find("Red/green"), std::string::npos);
}

TEST(PairAnalyzer, AnomalousCvdNeedsBothFlags)
{
    PairAnalyzer analyzer;
    AnalysisOptions options;
    options.includeAnomalousCvd = true;
    EXPECT_TRUE(analyzer.analyzePair("#e53e3e", "#38a169", options).cvd.empty());

    options.includeCvd = true;
    EXPECT_EQ(analyzer.analyzePair("#e53e3e", "#38a169", options).cvd.size(), 5u);
}

TEST(PairAnalyzer, InvalidColorNamesTheInput)
{
    PairAnalyzer analyzer;
    try {
        analyzer.analyzePair("notacolor", "#fff");
        FAIL() << "expected InvalidColorError";
    } catch (const Domain::InvalidColorError& e) {
        EXPECT_NE(std::string(e.what()).find("notacolor"), std::string::npos);
    }
}

// ─── Required ratio ──────────────────────────────────────────────────────────

TEST(PairAnalyzer, RoleSelectsRequiredRatio)
{
    PairAnalyzer analyzer;
    AnalysisOptions options;

    options.role = Types::PairRole::LARGE_TEXT;
    Domain::AnalysisResult large = analyzer.analyzePair("#777777", "#ffffff", options);
    EXPECT_DOUBLE_EQ(large.requiredRatio, 3.0);
    EXPECT_TRUE(large.passesRequired);
    // Fix suggestions always target body text
    EXPECT_TRUE(large.fixAA.has_value());

    options.role = Types::PairRole::BORDER;
    options.level = Types::ComplianceLevel::AAA;
    EXPECT_DOUBLE_EQ(analyzer.analyzePair("#777777", "#ffffff", options).requiredRatio, 3.0);

    options.role = Types::PairRole::TEXT;
    EXPECT_DOUBLE_EQ(analyzer.analyzePair("#777777", "#ffffff", options).requiredRatio, 7.0);
}

TEST(PairAnalyzer, MinRatioOverridesRole)
{
    PairAnalyzer analyzer;
    AnalysisOptions options;
    options.role = Types::PairRole::GRAPHIC;
    options.minRatio = 13.0;

    Domain::AnalysisResult result = analyzer.analyzePair("#333333", "#ffffff", options);
    EXPECT_DOUBLE_EQ(result.requiredRatio, 13.0);
    EXPECT_FALSE(result.passesRequired);
    EXPECT_TRUE(result.contrast.passesAll());
}

TEST(PairAnalyzer, AnalyzeTakesParsedPair)
{
    PairAnalyzer analyzer;
    Domain::ColorPair pair(Domain::Color::white(), Domain::Color::black(),
                           Types::PairRole::STROKE, Types::ComplianceLevel::AA);
    Domain::AnalysisResult result = analyzer.analyze(pair);
    EXPECT_EQ(result.role, Types::PairRole::STROKE);
    EXPECT_NEAR(result.contrast.ratio, 21.0, 1e-9);
    EXPECT_TRUE(result.passesRequired);
}

// ─── Simple API ──────────────────────────────────────────────────────────────

TEST(SimpleAPI, NormalizeAndRatio)
{
    EXPECT_EQ(SimpleAPI::normalizeColor("rgb(255, 255, 255)"), "#ffffff");
    EXPECT_NEAR(SimpleAPI::contrastRatio("black", "white"), 21.0, 1e-9);
    EXPECT_THROW(SimpleAPI::normalizeColor("#xyz"), InvalidColorError);
}

TEST(SimpleAPI, SuggestFix)
{
    Domain::FixSuggestion fix = SimpleAPI::suggestFix("#777777", "#ffffff", 4.5);
    EXPECT_TRUE(fix.meetsTarget(0.05));
    EXPECT_FALSE(fix.isFallback);
}

TEST(SimpleAPI, AnalyzeWithConfiguration)
{
    Internal::Config::AuditConfiguration config;
    config.setCvdAnalysisEnabled(true);
    config.setPairRole(Types::PairRole::LARGE_TEXT);

    Domain::AnalysisResult result = SimpleAPI::analyzePair("#e53e3e", "#38a169", config);
    EXPECT_TRUE(result.cvdIncluded);
    EXPECT_EQ(result.role, Types::PairRole::LARGE_TEXT);
    EXPECT_DOUBLE_EQ(result.requiredRatio, 3.0);
}
