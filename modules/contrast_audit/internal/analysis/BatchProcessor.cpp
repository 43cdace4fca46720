#include "BatchProcessor.hpp"
#include "../domain/InvalidColorError.hpp"
#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <thread>

namespace ContrastAudit::Internal::Analysis {

BatchProcessor::BatchSettings::BatchSettings()
    : enableParallelProcessing(true)
    , numThreads(0)
    , continueOnError(true) {
}

std::string BatchProcessor::BatchResult::getSummary() const {
    std::ostringstream oss;
    oss << "Batch Summary:\n";
    oss << "  Pairs: " << totalPairs << "\n";
    oss << "  Analyzed: " << successfulPairs << "\n";
    oss << "  Invalid: " << failedPairs << "\n";
    oss << "  Skipped: " << skippedPairs << "\n";
    oss << "  Non-compliant: " << nonCompliantPairs << "\n";
    oss << "  Threads: " << threadsUsed << "\n";
    oss << "  Processing time: " << std::fixed << std::setprecision(2)
        << totalProcessingTimeMs << "ms\n";
    return oss.str();
}

BatchProcessor::BatchProcessor(const BatchSettings& settings,
                               const Correction::ContrastFixer::FixerSettings& fixerSettings)
    : settings_(settings), analyzer_(fixerSettings), isProcessing_(false), shouldStop_(false) {
    LOG_DEBUG("Batch processor initialized (parallel ",
              settings_.enableParallelProcessing ? "on" : "off", ")");
}

BatchProcessor::BatchResult BatchProcessor::processPairs(const std::vector<PairRequest>& requests,
                                                         const AnalysisOptions& options) {
    BatchResult result;
    result.totalPairs = static_cast<int>(requests.size());

    if (isProcessing_.exchange(true)) {
        LOG_ERROR("Batch processor is already running");
        return result;
    }
    shouldStop_ = false;

    auto startTime = std::chrono::high_resolution_clock::now();

    std::vector<PairOutcome> outcomes(requests.size());
    for (size_t i = 0; i < requests.size(); ++i) {
        outcomes[i].request = requests[i];
        outcomes[i].skipped = true;
    }

    unsigned int threadCount = resolveThreadCount(requests.size());
    result.threadsUsed = threadCount;

    LOG_INFO("Analyzing ", requests.size(), " color pair(s) with ", threadCount, " thread(s)");

    if (threadCount > 1) {
        processParallel(requests, options, outcomes, threadCount);
    } else {
        processSequential(requests, options, outcomes);
    }

    for (const auto& outcome : outcomes) {
        if (outcome.skipped) {
            result.skippedPairs++;
        } else if (outcome.succeeded()) {
            result.successfulPairs++;
            if (!outcome.result->passesRequired) {
                result.nonCompliantPairs++;
            }
        } else {
            result.failedPairs++;
        }
    }
    result.outcomes = std::move(outcomes);

    auto endTime = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime);
    result.totalProcessingTimeMs = duration.count() / 1000.0f;

    LOG_INFO("Batch complete: ", result.successfulPairs, " analyzed, ", result.failedPairs,
             " invalid, ", result.nonCompliantPairs, " non-compliant");

    isProcessing_ = false;
    return result;
}

void BatchProcessor::stopProcessing() {
    shouldStop_ = true;
}

bool BatchProcessor::isProcessing() const {
    return isProcessing_;
}

void BatchProcessor::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(progressMutex_);
    progressCallback_ = std::move(callback);
}

void BatchProcessor::setSettings(const BatchSettings& settings) {
    settings_ = settings;
}

BatchProcessor::BatchSettings BatchProcessor::getSettings() const {
    return settings_;
}

unsigned int BatchProcessor::resolveThreadCount(size_t pairCount) const {
    if (!settings_.enableParallelProcessing || pairCount < 2) {
        return 1;
    }

    unsigned int threads = settings_.numThreads > 0
                               ? static_cast<unsigned int>(settings_.numThreads)
                               : std::thread::hardware_concurrency();
    if (threads == 0) threads = 1;

    return std::min<unsigned int>(threads, static_cast<unsigned int>(pairCount));
}

void BatchProcessor::processSequential(const std::vector<PairRequest>& requests,
                                       const AnalysisOptions& options,
                                       std::vector<PairOutcome>& outcomes) {
    const int total = static_cast<int>(requests.size());

    for (size_t i = 0; i < requests.size(); ++i) {
        if (shouldStop_) {
            LOG_WARN("Batch stopped after ", i, " of ", total, " pairs");
            break;
        }

        bool ok = processSinglePair(requests[i], options, outcomes[i]);
        if (!ok && !settings_.continueOnError) {
            shouldStop_ = true;
        }
        updateProgress(static_cast<int>(i) + 1, total, requests[i].label);
    }
}

void BatchProcessor::processParallel(const std::vector<PairRequest>& requests,
                                     const AnalysisOptions& options,
                                     std::vector<PairOutcome>& outcomes,
                                     unsigned int threadCount) {
    const int total = static_cast<int>(requests.size());
    std::atomic<size_t> nextIndex(0);
    std::atomic<int> completed(0);

    // Each worker writes only the outcome slot it claimed
    auto worker = [&]() {
        while (!shouldStop_) {
            size_t index = nextIndex.fetch_add(1);
            if (index >= requests.size()) break;

            bool ok = processSinglePair(requests[index], options, outcomes[index]);
            if (!ok && !settings_.continueOnError) {
                shouldStop_ = true;
            }
            updateProgress(completed.fetch_add(1) + 1, total, requests[index].label);
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(threadCount);
    for (unsigned int t = 0; t < threadCount; ++t) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }
}

bool BatchProcessor::processSinglePair(const PairRequest& request, const AnalysisOptions& options,
                                       PairOutcome& outcome) const {
    outcome.skipped = false;

    AnalysisOptions pairOptions = options;
    pairOptions.role = request.role;

    try {
        outcome.result = analyzer_.analyzePair(request.foreground, request.background, pairOptions);
        return true;
    } catch (const Domain::InvalidColorError& e) {
        outcome.errorMessage = e.what();
        LOG_WARN(request.label.empty() ? std::string("pair") : request.label, ": ", e.what());
    } catch (const std::exception& e) {
        outcome.errorMessage = std::string("Analysis failed: ") + e.what();
        LOG_ERROR(outcome.errorMessage);
    }
    return false;
}

void BatchProcessor::updateProgress(int completed, int total, const std::string& label) {
    std::lock_guard<std::mutex> lock(progressMutex_);
    if (progressCallback_) {
        progressCallback_(completed, total, label);
    }
}

}  // namespace ContrastAudit::Internal::Analysis
