#pragma once

#include "PairAnalyzer.hpp"
#include "../domain/AnalysisResult.hpp"
#include <shared/types/Common.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ContrastAudit::Internal::Analysis {

struct PairRequest {
    std::string foreground;
    std::string background;
    Types::PairRole role = Types::PairRole::TEXT;
    std::string label;   // Free-form origin, e.g. "styles.css:42"
};

struct PairOutcome {
    PairRequest request;
    std::optional<Domain::AnalysisResult> result;
    std::string errorMessage;
    bool skipped = false;

    bool succeeded() const { return result.has_value(); }
};

class BatchProcessor {
  public:
    // Progress callback: (completed_items, total_items, label)
    using ProgressCallback = std::function<void(int, int, const std::string&)>;

    struct BatchSettings {
        bool enableParallelProcessing;
        int numThreads;              // 0 = auto-detect
        bool continueOnError;        // Keep dispatching after an invalid pair

        BatchSettings();
    };

    struct BatchResult {
        std::vector<PairOutcome> outcomes;   // Same order as the requests

        int totalPairs = 0;
        int successfulPairs = 0;
        int failedPairs = 0;
        int skippedPairs = 0;
        int nonCompliantPairs = 0;

        float totalProcessingTimeMs = 0.0f;
        unsigned int threadsUsed = 1;

        bool hasErrors() const { return failedPairs > 0; }
        std::string getSummary() const;
    };

    explicit BatchProcessor(const BatchSettings& settings = BatchSettings{},
                            const Correction::ContrastFixer::FixerSettings& fixerSettings =
                                Correction::ContrastFixer::FixerSettings{});

    BatchResult processPairs(const std::vector<PairRequest>& requests,
                             const AnalysisOptions& options = {});

    // Checked between pairs
    void stopProcessing();
    bool isProcessing() const;

    void setProgressCallback(ProgressCallback callback);

    void setSettings(const BatchSettings& settings);
    BatchSettings getSettings() const;

  private:
    BatchSettings settings_;
    PairAnalyzer analyzer_;

    std::atomic<bool> isProcessing_;
    std::atomic<bool> shouldStop_;

    ProgressCallback progressCallback_;
    mutable std::mutex progressMutex_;

    unsigned int resolveThreadCount(size_t pairCount) const;
    void processSequential(const std::vector<PairRequest>& requests,
                           const AnalysisOptions& options,
                           std::vector<PairOutcome>& outcomes);
    void processParallel(const std::vector<PairRequest>& requests,
                         const AnalysisOptions& options,
                         std::vector<PairOutcome>& outcomes,
                         unsigned int threadCount);
    bool processSinglePair(const PairRequest& request, const AnalysisOptions& options,
                           PairOutcome& outcome) const;
    void updateProgress(int completed, int total, const std::string& label);
};

}  // namespace ContrastAudit::Internal::Analysis
