#include "AuditConfiguration.hpp"
#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace ContrastAudit::Internal::Config {

namespace {

const char* const KEY_INCLUDE_CVD = "include_cvd";
const char* const KEY_INCLUDE_ANOMALOUS_CVD = "include_anomalous_cvd";
const char* const KEY_MIN_RATIO = "min_ratio";
const char* const KEY_ROLE = "role";
const char* const KEY_COMPLIANCE_LEVEL = "compliance_level";
const char* const KEY_FIXER_TOLERANCE = "fixer_tolerance";
const char* const KEY_FIXER_MAX_ITERATIONS = "fixer_max_iterations";
const char* const KEY_PARALLEL_PROCESSING = "parallel_processing";
const char* const KEY_THREAD_COUNT = "thread_count";
const char* const KEY_LOG_LEVEL = "log_level";
const char* const KEY_OUTPUT_FORMAT = "output_format";

const std::vector<std::string>& knownKeys() {
    static const std::vector<std::string> keys = {
        KEY_INCLUDE_CVD, KEY_INCLUDE_ANOMALOUS_CVD, KEY_MIN_RATIO, KEY_ROLE,
        KEY_COMPLIANCE_LEVEL, KEY_FIXER_TOLERANCE, KEY_FIXER_MAX_ITERATIONS,
        KEY_PARALLEL_PROCESSING, KEY_THREAD_COUNT, KEY_LOG_LEVEL, KEY_OUTPUT_FORMAT,
    };
    return keys;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parseBool(const std::string& text, bool& value) {
    std::string lowered = toLower(text);
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        value = true;
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        value = false;
        return true;
    }
    return false;
}

bool parseDouble(const std::string& text, double& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(parsed)) return false;
    value = parsed;
    return true;
}

bool parseInt(const std::string& text, int& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (end != text.c_str() + text.size() || errno == ERANGE) return false;
    if (parsed < INT_MIN || parsed > INT_MAX) return false;
    value = static_cast<int>(parsed);
    return true;
}

std::string formatDouble(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

bool isKnownOutputFormat(const std::string& format) {
    return format == "json" || format == "yaml" || format == "text";
}

}  // namespace

AuditConfiguration::AuditConfiguration() {
    reset();
}

bool AuditConfiguration::loadFromFile(const std::string& filename) {
    try {
        cv::FileStorage fs(filename, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            LOG_ERROR("Cannot open configuration file for reading: ", filename);
            return false;
        }

        bool loaded = applyDocument(fs, filename);
        fs.release();
        return loaded;

    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error while loading configuration ", filename, ": ", e.what());
        return false;
    }
}

bool AuditConfiguration::loadFromString(const std::string& configString) {
    try {
        cv::FileStorage fs(configString, cv::FileStorage::READ | cv::FileStorage::MEMORY);
        if (!fs.isOpened()) {
            LOG_ERROR("Cannot parse configuration string");
            return false;
        }

        bool loaded = applyDocument(fs, "<string>");
        fs.release();
        return loaded;

    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error while parsing configuration string: ", e.what());
        return false;
    }
}

bool AuditConfiguration::applyDocument(const cv::FileStorage& fs, const std::string& source) {
    cv::FileNode root = fs.root();
    if (!root.isMap()) {
        LOG_ERROR("Configuration ", source, " is not a key/value document");
        return false;
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
        std::string key = (*it).name();
        if (std::find(knownKeys().begin(), knownKeys().end(), key) == knownKeys().end()) {
            LOG_WARN("Ignoring unknown configuration key '", key, "' in ", source);
        }
    }

    bool allApplied = true;
    for (const auto& key : knownKeys()) {
        cv::FileNode node = root[key];
        if (node.empty() || node.isNone()) continue;

        std::string value;
        if (!nodeToString(node, value) || !setParameter(key, value)) {
            LOG_ERROR("Invalid value for '", key, "' in ", source);
            allApplied = false;
        }
    }

    if (!isValid()) {
        validate();
    }

    LOG_DEBUG("Configuration loaded from ", source);
    return allApplied;
}

bool AuditConfiguration::nodeToString(const cv::FileNode& node, std::string& value) {
    if (node.isInt()) {
        value = std::to_string(static_cast<int>(node));
    } else if (node.isReal()) {
        value = formatDouble(static_cast<double>(node));
    } else if (node.isString()) {
        value = static_cast<std::string>(node);
    } else {
        return false;
    }
    return true;
}

bool AuditConfiguration::setParameter(const std::string& key, const std::string& value) {
    bool parsed = false;

    if (key == KEY_INCLUDE_CVD) {
        parsed = parseBool(value, includeCvd_);
    } else if (key == KEY_INCLUDE_ANOMALOUS_CVD) {
        parsed = parseBool(value, includeAnomalousCvd_);
    } else if (key == KEY_MIN_RATIO) {
        double ratio = 0.0;
        if (value.empty() || toLower(value) == "none") {
            minRatio_.reset();
            parsed = true;
        } else if (parseDouble(value, ratio)) {
            minRatio_ = ratio;
            parsed = true;
        }
    } else if (key == KEY_ROLE) {
        parsed = Types::parsePairRole(toLower(value), role_);
    } else if (key == KEY_COMPLIANCE_LEVEL) {
        parsed = Types::parseComplianceLevel(value, level_);
    } else if (key == KEY_FIXER_TOLERANCE) {
        parsed = parseDouble(value, fixerTolerance_);
    } else if (key == KEY_FIXER_MAX_ITERATIONS) {
        parsed = parseInt(value, fixerMaxIterations_);
    } else if (key == KEY_PARALLEL_PROCESSING) {
        parsed = parseBool(value, parallelProcessing_);
    } else if (key == KEY_THREAD_COUNT) {
        parsed = parseInt(value, threadCount_);
    } else if (key == KEY_LOG_LEVEL) {
        Shared::LogLevel level;
        std::string lowered = toLower(value);
        if (Shared::Logger::parseLevel(lowered, level)) {
            logLevel_ = Shared::Logger::levelName(level);
            parsed = true;
        }
    } else if (key == KEY_OUTPUT_FORMAT) {
        std::string lowered = toLower(value);
        if (isKnownOutputFormat(lowered)) {
            outputFormat_ = lowered;
            parsed = true;
        }
    } else {
        LOG_WARN("Unknown configuration parameter: ", key);
        return false;
    }

    if (!parsed) {
        LOG_WARN("Cannot parse value '", value, "' for parameter ", key);
    }
    return parsed;
}

std::string AuditConfiguration::getParameter(const std::string& key) const {
    auto parameters = getAllParameters();
    auto it = parameters.find(key);
    if (it == parameters.end()) {
        LOG_WARN("Unknown configuration parameter: ", key);
        return std::string();
    }
    return it->second;
}

std::map<std::string, std::string> AuditConfiguration::getAllParameters() const {
    std::map<std::string, std::string> parameters;
    parameters[KEY_INCLUDE_CVD] = includeCvd_ ? "true" : "false";
    parameters[KEY_INCLUDE_ANOMALOUS_CVD] = includeAnomalousCvd_ ? "true" : "false";
    parameters[KEY_MIN_RATIO] = minRatio_ ? formatDouble(*minRatio_) : "none";
    parameters[KEY_ROLE] = Types::toString(role_);
    parameters[KEY_COMPLIANCE_LEVEL] = Types::toString(level_);
    parameters[KEY_FIXER_TOLERANCE] = formatDouble(fixerTolerance_);
    parameters[KEY_FIXER_MAX_ITERATIONS] = std::to_string(fixerMaxIterations_);
    parameters[KEY_PARALLEL_PROCESSING] = parallelProcessing_ ? "true" : "false";
    parameters[KEY_THREAD_COUNT] = std::to_string(threadCount_);
    parameters[KEY_LOG_LEVEL] = logLevel_;
    parameters[KEY_OUTPUT_FORMAT] = outputFormat_;
    return parameters;
}

bool AuditConfiguration::isValid() const {
    if (minRatio_ && (*minRatio_ < Types::MIN_CONTRAST_RATIO ||
                      *minRatio_ > Types::MAX_CONTRAST_RATIO)) {
        return false;
    }
    Shared::LogLevel level;
    return fixerTolerance_ > 0.0 && fixerTolerance_ <= 1.0 &&
           fixerMaxIterations_ >= 1 && fixerMaxIterations_ <= MAX_FIXER_ITERATIONS &&
           threadCount_ >= 0 &&
           Shared::Logger::parseLevel(logLevel_, level) &&
           isKnownOutputFormat(outputFormat_);
}

void AuditConfiguration::reset() {
    includeCvd_ = false;
    includeAnomalousCvd_ = false;
    minRatio_.reset();
    role_ = Types::PairRole::TEXT;
    level_ = Types::ComplianceLevel::AA;
    fixerTolerance_ = DEFAULT_FIXER_TOLERANCE;
    fixerMaxIterations_ = DEFAULT_FIXER_MAX_ITERATIONS;
    parallelProcessing_ = true;
    threadCount_ = 0;
    logLevel_ = "info";
    outputFormat_ = "json";
}

void AuditConfiguration::validate() {
    if (minRatio_ && (*minRatio_ < Types::MIN_CONTRAST_RATIO ||
                      *minRatio_ > Types::MAX_CONTRAST_RATIO)) {
        LOG_WARN("min_ratio ", *minRatio_, " outside [1, 21]; ignoring it");
        minRatio_.reset();
    }
    if (fixerTolerance_ <= 0.0 || fixerTolerance_ > 1.0) {
        LOG_WARN("fixer_tolerance ", fixerTolerance_, " outside (0, 1]; using ",
                 DEFAULT_FIXER_TOLERANCE);
        fixerTolerance_ = DEFAULT_FIXER_TOLERANCE;
    }
    if (fixerMaxIterations_ < 1 || fixerMaxIterations_ > MAX_FIXER_ITERATIONS) {
        LOG_WARN("fixer_max_iterations ", fixerMaxIterations_, " outside [1, ",
                 MAX_FIXER_ITERATIONS, "]; using ", DEFAULT_FIXER_MAX_ITERATIONS);
        fixerMaxIterations_ = DEFAULT_FIXER_MAX_ITERATIONS;
    }
    if (threadCount_ < 0) {
        LOG_WARN("thread_count ", threadCount_, " is negative; using auto-detect");
        threadCount_ = 0;
    }
    Shared::LogLevel level;
    if (!Shared::Logger::parseLevel(logLevel_, level)) {
        logLevel_ = "info";
    }
    if (!isKnownOutputFormat(outputFormat_)) {
        outputFormat_ = "json";
    }
}

Analysis::AnalysisOptions AuditConfiguration::toAnalysisOptions() const {
    Analysis::AnalysisOptions options;
    options.includeCvd = includeCvd_;
    options.includeAnomalousCvd = includeAnomalousCvd_;
    options.minRatio = minRatio_;
    options.role = role_;
    options.level = level_;
    return options;
}

Correction::ContrastFixer::FixerSettings AuditConfiguration::toFixerSettings() const {
    Correction::ContrastFixer::FixerSettings settings;
    settings.tolerance = fixerTolerance_;
    settings.maxIterations = fixerMaxIterations_;
    return settings;
}

Analysis::BatchProcessor::BatchSettings AuditConfiguration::toBatchSettings() const {
    Analysis::BatchProcessor::BatchSettings settings;
    settings.enableParallelProcessing = parallelProcessing_;
    settings.numThreads = threadCount_;
    return settings;
}

}  // namespace ContrastAudit::Internal::Config

namespace ContrastAudit::Interface {

std::unique_ptr<IConfiguration> createDefaultConfiguration() {
    return std::make_unique<Internal::Config::AuditConfiguration>();
}

}  // namespace ContrastAudit::Interface
