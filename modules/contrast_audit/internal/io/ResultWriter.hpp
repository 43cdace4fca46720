#pragma once

#include "../analysis/BatchProcessor.hpp"
#include "../domain/AnalysisResult.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace ContrastAudit::Internal::IO {

// Renders analysis results as JSON/YAML (cv::FileStorage) or plain text.
// Ratios are rounded to 2 decimals for display only.
class ResultWriter {
  public:
    enum class Format { JSON, YAML, TEXT };

    static bool parseFormat(const std::string& name, Format& format);

    explicit ResultWriter(Format format = Format::JSON);

    std::string write(const Domain::AnalysisResult& result) const;
    std::string write(const Analysis::BatchProcessor::BatchResult& batch) const;

  private:
    Format format_;

    void openMemoryStorage(cv::FileStorage& fs) const;

    static void writeAnalysis(cv::FileStorage& fs, const Domain::AnalysisResult& result);
    static void writeFix(cv::FileStorage& fs, const char* key, const char* ratioKey,
                         const Domain::FixSuggestion& fix);
    static void writeOutcome(cv::FileStorage& fs, const Analysis::PairOutcome& outcome);

    static std::string toText(const Domain::AnalysisResult& result);
    static std::string toText(const Analysis::BatchProcessor::BatchResult& batch);
};

}  // namespace ContrastAudit::Internal::IO
