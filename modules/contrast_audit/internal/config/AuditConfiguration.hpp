#pragma once

#include "../../interface/IConfiguration.hpp"
#include "../analysis/BatchProcessor.hpp"
#include "../analysis/PairAnalyzer.hpp"
#include "../correction/ContrastFixer.hpp"
#include <shared/types/Common.hpp>
#include <opencv2/core.hpp>
#include <map>
#include <optional>
#include <string>

namespace ContrastAudit::Internal::Config {

class AuditConfiguration : public Interface::IConfiguration {
  public:
    static constexpr double DEFAULT_FIXER_TOLERANCE = 0.05;
    static constexpr int DEFAULT_FIXER_MAX_ITERATIONS = 50;
    static constexpr int MAX_FIXER_ITERATIONS = 1000;

    AuditConfiguration();

    bool isCvdAnalysisEnabled() const override { return includeCvd_; }
    void setCvdAnalysisEnabled(bool enabled) override { includeCvd_ = enabled; }

    bool isAnomalousCvdEnabled() const override { return includeAnomalousCvd_; }
    void setAnomalousCvdEnabled(bool enabled) override { includeAnomalousCvd_ = enabled; }

    std::optional<double> getMinRatio() const override { return minRatio_; }
    void setMinRatio(std::optional<double> ratio) override { minRatio_ = ratio; }

    Types::PairRole getPairRole() const override { return role_; }
    void setPairRole(Types::PairRole role) override { role_ = role; }

    Types::ComplianceLevel getComplianceLevel() const override { return level_; }
    void setComplianceLevel(Types::ComplianceLevel level) override { level_ = level; }

    double getFixerTolerance() const override { return fixerTolerance_; }
    void setFixerTolerance(double tolerance) override { fixerTolerance_ = tolerance; }

    int getFixerMaxIterations() const override { return fixerMaxIterations_; }
    void setFixerMaxIterations(int iterations) override { fixerMaxIterations_ = iterations; }

    bool isParallelProcessingEnabled() const override { return parallelProcessing_; }
    void setParallelProcessingEnabled(bool enabled) override { parallelProcessing_ = enabled; }

    int getThreadCount() const override { return threadCount_; }
    void setThreadCount(int count) override { threadCount_ = count; }

    std::string getLogLevel() const override { return logLevel_; }
    void setLogLevel(const std::string& level) override { logLevel_ = level; }

    std::string getOutputFormat() const override { return outputFormat_; }
    void setOutputFormat(const std::string& format) override { outputFormat_ = format; }

    bool loadFromFile(const std::string& filename) override;
    bool loadFromString(const std::string& configString) override;

    bool setParameter(const std::string& key, const std::string& value) override;
    std::string getParameter(const std::string& key) const override;
    std::map<std::string, std::string> getAllParameters() const override;

    bool isValid() const override;
    void reset() override;
    void validate() override;

    // Conversions into the engine's settings structs
    Analysis::AnalysisOptions toAnalysisOptions() const;
    Correction::ContrastFixer::FixerSettings toFixerSettings() const;
    Analysis::BatchProcessor::BatchSettings toBatchSettings() const;

  private:
    bool includeCvd_;
    bool includeAnomalousCvd_;
    std::optional<double> minRatio_;
    Types::PairRole role_;
    Types::ComplianceLevel level_;
    double fixerTolerance_;
    int fixerMaxIterations_;
    bool parallelProcessing_;
    int threadCount_;
    std::string logLevel_;
    std::string outputFormat_;

    bool applyDocument(const cv::FileStorage& fs, const std::string& source);
    static bool nodeToString(const cv::FileNode& node, std::string& value);
};

}  // namespace ContrastAudit::Internal::Config
