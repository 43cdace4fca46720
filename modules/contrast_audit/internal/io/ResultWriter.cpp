#include "ResultWriter.hpp"
#include <shared/utils/Logger.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ContrastAudit::Internal::IO {

namespace {

double displayRound(double value) {
    return std::round(value * 100.0) / 100.0;
}

const char* passFail(bool passed) {
    return passed ? "PASS" : "FAIL";
}

}  // namespace

bool ResultWriter::parseFormat(const std::string& name, Format& format) {
    if (name == "json") {
        format = Format::JSON;
    } else if (name == "yaml" || name == "yml") {
        format = Format::YAML;
    } else if (name == "text" || name == "txt") {
        format = Format::TEXT;
    } else {
        return false;
    }
    return true;
}

ResultWriter::ResultWriter(Format format) : format_(format) {}

std::string ResultWriter::write(const Domain::AnalysisResult& result) const {
    if (format_ == Format::TEXT) {
        return toText(result);
    }

    try {
        cv::FileStorage fs;
        openMemoryStorage(fs);
        writeAnalysis(fs, result);
        return fs.releaseAndGetString();
    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error while writing analysis result: ", e.what());
        return std::string();
    }
}

std::string ResultWriter::write(const Analysis::BatchProcessor::BatchResult& batch) const {
    if (format_ == Format::TEXT) {
        return toText(batch);
    }

    try {
        cv::FileStorage fs;
        openMemoryStorage(fs);

        fs << "results" << "[";
        for (const auto& outcome : batch.outcomes) {
            fs << "{";
            writeOutcome(fs, outcome);
            fs << "}";
        }
        fs << "]";

        fs << "summary" << "{";
        fs << "total" << batch.totalPairs;
        fs << "analyzed" << batch.successfulPairs;
        fs << "invalid" << batch.failedPairs;
        fs << "skipped" << batch.skippedPairs;
        fs << "non_compliant" << batch.nonCompliantPairs;
        fs << "processing_time_ms" << static_cast<double>(batch.totalProcessingTimeMs);
        fs << "}";

        return fs.releaseAndGetString();
    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error while writing batch result: ", e.what());
        return std::string();
    }
}

void ResultWriter::openMemoryStorage(cv::FileStorage& fs) const {
    if (format_ == Format::YAML) {
        fs.open(".yml", cv::FileStorage::WRITE | cv::FileStorage::MEMORY |
                            cv::FileStorage::FORMAT_YAML);
    } else {
        fs.open(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY |
                             cv::FileStorage::FORMAT_JSON);
    }
}

void ResultWriter::writeAnalysis(cv::FileStorage& fs, const Domain::AnalysisResult& result) {
    fs << "text_color" << result.textColor.toHex();
    fs << "background_color" << result.backgroundColor.toHex();
    fs << "role" << Types::toString(result.role);
    fs << "ratio" << displayRound(result.contrast.ratio);
    fs << "aa_body_text" << static_cast<int>(result.contrast.aaBody);
    fs << "aa_large_text" << static_cast<int>(result.contrast.aaLarge);
    fs << "aaa_body_text" << static_cast<int>(result.contrast.aaaBody);
    fs << "aaa_large_text" << static_cast<int>(result.contrast.aaaLarge);
    fs << "required_ratio" << result.requiredRatio;
    fs << "passes_required" << static_cast<int>(result.passesRequired);

    if (result.fixAA) {
        writeFix(fs, "fix_aa", "fix_aa_ratio", *result.fixAA);
    }
    if (result.fixAAA) {
        writeFix(fs, "fix_aaa", "fix_aaa_ratio", *result.fixAAA);
    }

    if (!result.cvdIncluded) return;

    fs << "cvd" << "[";
    for (const auto& entry : result.cvd) {
        fs << "{";
        fs << "type" << Types::toString(entry.type);
        fs << "simulated_text" << entry.simulatedForeground.toHex();
        fs << "simulated_bg" << entry.simulatedBackground.toHex();
        fs << "simulated_ratio" << displayRound(entry.simulatedRatio);
        fs << "delta_e" << displayRound(entry.deltaE);
        fs << "risk" << Types::toString(entry.risk);
        fs << "}";
    }
    fs << "]";

    fs << "hue_warnings" << "[";
    for (const auto& warning : result.hueWarnings) {
        fs << warning;
    }
    fs << "]";
}

void ResultWriter::writeFix(cv::FileStorage& fs, const char* key, const char* ratioKey,
                            const Domain::FixSuggestion& fix) {
    fs << key << fix.color.toHex();
    fs << ratioKey << displayRound(fix.achievedRatio);
}

void ResultWriter::writeOutcome(cv::FileStorage& fs, const Analysis::PairOutcome& outcome) {
    if (outcome.succeeded()) {
        writeAnalysis(fs, *outcome.result);
        if (!outcome.request.label.empty()) {
            fs << "label" << outcome.request.label;
        }
        return;
    }

    fs << "foreground" << outcome.request.foreground;
    fs << "background" << outcome.request.background;
    if (!outcome.request.label.empty()) {
        fs << "label" << outcome.request.label;
    }
    fs << "error" << (outcome.skipped ? std::string("skipped") : outcome.errorMessage);
}

std::string ResultWriter::toText(const Domain::AnalysisResult& result) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << result.textColor << " on " << result.backgroundColor << "  "
        << displayRound(result.contrast.ratio) << ":1\n";
    oss << "  AA body text:    " << passFail(result.contrast.aaBody) << "\n";
    oss << "  AA large text:   " << passFail(result.contrast.aaLarge) << "\n";
    oss << "  AAA body text:   " << passFail(result.contrast.aaaBody) << "\n";
    oss << "  AAA large text:  " << passFail(result.contrast.aaaLarge) << "\n";
    oss << "  Required (" << Types::toString(result.role) << "): " << result.requiredRatio
        << ":1 " << passFail(result.passesRequired) << "\n";

    if (result.fixAA) {
        oss << "  Suggested AA fix:  " << result.fixAA->color << " ("
            << displayRound(result.fixAA->achievedRatio) << ":1)"
            << (result.fixAA->isFallback ? " [best available]" : "") << "\n";
    }
    if (result.fixAAA) {
        oss << "  Suggested AAA fix: " << result.fixAAA->color << " ("
            << displayRound(result.fixAAA->achievedRatio) << ":1)"
            << (result.fixAAA->isFallback ? " [best available]" : "") << "\n";
    }

    if (result.cvdIncluded) {
        oss << "  Color vision deficiency:\n";
        for (const auto& entry : result.cvd) {
            oss << "    " << std::left << std::setw(14) << Types::toString(entry.type)
                << std::right << entry.simulatedForeground << " on " << entry.simulatedBackground
                << "  " << displayRound(entry.simulatedRatio) << ":1  dE "
                << displayRound(entry.deltaE) << "  " << Types::toString(entry.risk) << "\n";
        }
        for (const auto& warning : result.hueWarnings) {
            oss << "  Warning: " << warning << "\n";
        }
    }

    return oss.str();
}

std::string ResultWriter::toText(const Analysis::BatchProcessor::BatchResult& batch) {
    std::ostringstream oss;
    for (const auto& outcome : batch.outcomes) {
        if (!outcome.request.label.empty()) {
            oss << "[" << outcome.request.label << "] ";
        }
        if (outcome.succeeded()) {
            oss << toText(*outcome.result);
        } else if (outcome.skipped) {
            oss << outcome.request.foreground << " on " << outcome.request.background
                << "  skipped\n";
        } else {
            oss << "Error: " << outcome.errorMessage << "\n";
        }
        oss << "\n";
    }
    oss << batch.getSummary();
    return oss.str();
}

}  // namespace ContrastAudit::Internal::IO
