#include <gtest/gtest.h>

#include <contrast_audit/internal/analysis/BatchProcessor.hpp>

#include <atomic>

using namespace ContrastAudit;
using Internal::Analysis::BatchProcessor;
using Internal::Analysis::PairRequest;

namespace {

PairRequest makeRequest(const std::string& foreground, const std::string& background,
                        Types::PairRole role = Types::PairRole::TEXT)
{
    PairRequest request;
    request.foreground = foreground;
    request.background = background;
    request.role = role;
    request.label = foreground + "/" + background;
    return request;
}

std::vector<PairRequest> sampleRequests()
{
    return {
        makeRequest("#333333", "#ffffff"),
        makeRequest("#777777", "#888888"),
        makeRequest("notacolor", "#fff"),
        makeRequest("#e53e3e", "#38a169"),
        makeRequest("navy", "white"),
        makeRequest("rgb(0, 0, 0)", "hsl(0, 0%, 100%)"),
    };
}

BatchProcessor::BatchSettings sequentialSettings()
{
    BatchProcessor::BatchSettings settings;
    settings.enableParallelProcessing = false;
    return settings;
}

}  // namespace

TEST(BatchProcessor, InvalidPairIsRecordedNotThrown)
{
    BatchProcessor processor(sequentialSettings());
    auto result = processor.processPairs(sampleRequests());

    ASSERT_EQ(result.outcomes.size(), 6u);
    EXPECT_EQ(result.totalPairs, 6);
    EXPECT_EQ(result.successfulPairs, 5);
    EXPECT_EQ(result.failedPairs, 1);
    EXPECT_EQ(result.skippedPairs, 0);
    EXPECT_TRUE(result.hasErrors());

    const auto& invalid = result.outcomes[2];
    EXPECT_FALSE(invalid.succeeded());
    EXPECT_FALSE(invalid.skipped);
    EXPECT_NE(invalid.errorMessage.find("notacolor"), std::string::npos);
}

TEST(BatchProcessor, CountsNonCompliantPairs)
{
    BatchProcessor processor(sequentialSettings());
    auto result = processor.processPairs(sampleRequests());
    // #777777/#888888 and #e53e3e/#38a169 fail 4.5:1
    EXPECT_EQ(result.nonCompliantPairs, 2);
}

TEST(BatchProcessor, ParallelMatchesSequential)
{
    BatchProcessor sequential(sequentialSettings());

    BatchProcessor::BatchSettings parallelSettings;
    parallelSettings.enableParallelProcessing = true;
    parallelSettings.numThreads = 4;
    BatchProcessor parallel(parallelSettings);

    auto requests = sampleRequests();
    auto expected = sequential.processPairs(requests);
    auto actual = parallel.processPairs(requests);

    EXPECT_EQ(actual.threadsUsed, 4u);
    ASSERT_EQ(actual.outcomes.size(), expected.outcomes.size());
    for (size_t i = 0; i < expected.outcomes.size(); ++i) {
        const auto& lhs = expected.outcomes[i];
        const auto& rhs = actual.outcomes[i];
        EXPECT_EQ(rhs.request.label, lhs.request.label);
        ASSERT_EQ(rhs.succeeded(), lhs.succeeded()) << lhs.request.label;
        if (lhs.succeeded()) {
            EXPECT_DOUBLE_EQ(rhs.result->contrast.ratio, lhs.result->contrast.ratio);
            EXPECT_EQ(rhs.result->passesRequired, lhs.result->passesRequired);
        } else {
            EXPECT_EQ(rhs.errorMessage, lhs.errorMessage);
        }
    }
    EXPECT_EQ(actual.nonCompliantPairs, expected.nonCompliantPairs);
}

TEST(BatchProcessor, RequestRoleOverridesOptions)
{
    BatchProcessor processor(sequentialSettings());
    std::vector<PairRequest> requests = {
        makeRequest("#777777", "#ffffff", Types::PairRole::TEXT),
        makeRequest("#777777", "#ffffff", Types::PairRole::LARGE_TEXT),
    };

    auto result = processor.processPairs(requests);
    ASSERT_EQ(result.successfulPairs, 2);
    EXPECT_FALSE(result.outcomes[0].result->passesRequired);
    EXPECT_TRUE(result.outcomes[1].result->passesRequired);
}

TEST(BatchProcessor, OptionsApplyToEveryPair)
{
    BatchProcessor processor(sequentialSettings());
    Internal::Analysis::AnalysisOptions options;
    options.includeCvd = true;

    auto result = processor.processPairs({makeRequest("#000", "#fff"), makeRequest("red", "green")},
                                         options);
    for (const auto& outcome : result.outcomes) {
        ASSERT_TRUE(outcome.succeeded());
        EXPECT_EQ(outcome.result->cvd.size(), 3u);
    }
}

TEST(BatchProcessor, StopOnFirstErrorSkipsTheRest)
{
    BatchProcessor::BatchSettings settings = sequentialSettings();
    settings.continueOnError = false;
    BatchProcessor processor(settings);

    auto result = processor.processPairs(sampleRequests());
    EXPECT_EQ(result.successfulPairs, 2);
    EXPECT_EQ(result.failedPairs, 1);
    EXPECT_EQ(result.skippedPairs, 3);
    EXPECT_TRUE(result.outcomes[5].skipped);
}

TEST(BatchProcessor, ProgressIsReportedPerPair)
{
    BatchProcessor::BatchSettings settings;
    settings.numThreads = 3;
    BatchProcessor processor(settings);

    std::atomic<int> calls(0);
    int lastTotal = 0;
    processor.setProgressCallback([&](int, int total, const std::string&) {
        calls++;
        lastTotal = total;
    });

    processor.processPairs(sampleRequests());
    EXPECT_EQ(calls.load(), 6);
    EXPECT_EQ(lastTotal, 6);
    EXPECT_FALSE(processor.isProcessing());
}

TEST(BatchProcessor, StopFromProgressCallbackSkipsRemainingPairs)
{
    BatchProcessor processor(sequentialSettings());
    processor.setProgressCallback([&](int completed, int, const std::string&) {
        if (completed == 2) {
            processor.stopProcessing();
        }
    });

    auto result = processor.processPairs(sampleRequests());
    EXPECT_EQ(result.successfulPairs, 2);
    EXPECT_EQ(result.skippedPairs, 4);
    EXPECT_TRUE(result.outcomes[2].skipped);
    EXPECT_FALSE(processor.isProcessing());

    // A new batch starts with the stop flag cleared
    processor.setProgressCallback(nullptr);
    auto rerun = processor.processPairs(sampleRequests());
    EXPECT_EQ(rerun.skippedPairs, 0);
    EXPECT_EQ(rerun.successfulPairs, 5);
}

TEST(BatchProcessor, EmptyBatch)
{
    BatchProcessor processor;
    auto result = processor.processPairs({});
    EXPECT_EQ(result.totalPairs, 0);
    EXPECT_TRUE(result.outcomes.empty());
    EXPECT_FALSE(result.hasErrors());
    EXPECT_NE(result.getSummary().find("Pairs: 0"), std::string::npos);
}
