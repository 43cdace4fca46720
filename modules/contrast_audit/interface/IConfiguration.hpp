#pragma once

#include <shared/types/Common.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ContrastAudit::Interface {

class IConfiguration {
  public:
    virtual ~IConfiguration() = default;

    // Analysis settings
    virtual bool isCvdAnalysisEnabled() const = 0;
    virtual void setCvdAnalysisEnabled(bool enabled) = 0;

    virtual bool isAnomalousCvdEnabled() const = 0;
    virtual void setAnomalousCvdEnabled(bool enabled) = 0;

    virtual std::optional<double> getMinRatio() const = 0;
    virtual void setMinRatio(std::optional<double> ratio) = 0;

    virtual Types::PairRole getPairRole() const = 0;
    virtual void setPairRole(Types::PairRole role) = 0;

    virtual Types::ComplianceLevel getComplianceLevel() const = 0;
    virtual void setComplianceLevel(Types::ComplianceLevel level) = 0;

    // Fixer settings
    virtual double getFixerTolerance() const = 0;
    virtual void setFixerTolerance(double tolerance) = 0;

    virtual int getFixerMaxIterations() const = 0;
    virtual void setFixerMaxIterations(int iterations) = 0;

    // Batch settings
    virtual bool isParallelProcessingEnabled() const = 0;
    virtual void setParallelProcessingEnabled(bool enabled) = 0;

    virtual int getThreadCount() const = 0;
    virtual void setThreadCount(int count) = 0;

    // Output settings
    virtual std::string getLogLevel() const = 0;
    virtual void setLogLevel(const std::string& level) = 0;

    virtual std::string getOutputFormat() const = 0;
    virtual void setOutputFormat(const std::string& format) = 0;

    // YAML or JSON documents; absent keys keep their current value
    virtual bool loadFromFile(const std::string& filename) = 0;
    virtual bool loadFromString(const std::string& configString) = 0;

    // Runtime configuration
    virtual bool setParameter(const std::string& key, const std::string& value) = 0;
    virtual std::string getParameter(const std::string& key) const = 0;
    virtual std::map<std::string, std::string> getAllParameters() const = 0;

    virtual bool isValid() const = 0;
    virtual void reset() = 0;
    virtual void validate() = 0;
};

// Factory function for creating default configuration
std::unique_ptr<IConfiguration> createDefaultConfiguration();

}  // namespace ContrastAudit::Interface
