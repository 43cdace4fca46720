#pragma once

#include <opencv2/core.hpp>
#include <array>
#include <string>
#include <vector>
#include <algorithm>

namespace ContrastAudit::Types {

using Matrix3x3 = cv::Matx33d;
using ColorValue = cv::Vec3d;  // unit RGB, linear RGB, HSL, XYZ or Lab
using Channels = cv::Vec3b;

// WCAG 2.x contrast thresholds
constexpr double WCAG_AA_BODY = 4.5;
constexpr double WCAG_AA_LARGE = 3.0;
constexpr double WCAG_AAA_BODY = 7.0;
constexpr double WCAG_AAA_LARGE = 4.5;
constexpr double WCAG_NON_TEXT = 3.0;

constexpr double MIN_CONTRAST_RATIO = 1.0;
constexpr double MAX_CONTRAST_RATIO = 21.0;

enum class PairRole { TEXT, LARGE_TEXT, GRAPHIC, STROKE, BORDER };

enum class ComplianceLevel { AA, AAA };

enum class DeficiencyType { PROTANOPIA, DEUTERANOPIA, TRITANOPIA, PROTANOMALY, DEUTERANOMALY };

enum class RiskLevel { OK, WARNING, HIGH, CRITICAL };

inline const char* toString(PairRole role) {
    switch (role) {
        case PairRole::TEXT: return "text";
        case PairRole::LARGE_TEXT: return "large_text";
        case PairRole::GRAPHIC: return "graphic";
        case PairRole::STROKE: return "stroke";
        case PairRole::BORDER: return "border";
    }
    return "text";
}

inline const char* toString(ComplianceLevel level) {
    return level == ComplianceLevel::AAA ? "AAA" : "AA";
}

inline const char* toString(DeficiencyType type) {
    switch (type) {
        case DeficiencyType::PROTANOPIA: return "protanopia";
        case DeficiencyType::DEUTERANOPIA: return "deuteranopia";
        case DeficiencyType::TRITANOPIA: return "tritanopia";
        case DeficiencyType::PROTANOMALY: return "protanomaly";
        case DeficiencyType::DEUTERANOMALY: return "deuteranomaly";
    }
    return "unknown";
}

inline const char* toString(RiskLevel risk) {
    switch (risk) {
        case RiskLevel::OK: return "ok";
        case RiskLevel::WARNING: return "warning";
        case RiskLevel::HIGH: return "high";
        case RiskLevel::CRITICAL: return "critical";
    }
    return "ok";
}

// Returns false and leaves `role` untouched for unknown names
inline bool parsePairRole(const std::string& name, PairRole& role) {
    static const std::array<PairRole, 5> roles = {
        PairRole::TEXT, PairRole::LARGE_TEXT, PairRole::GRAPHIC, PairRole::STROKE, PairRole::BORDER
    };
    for (PairRole candidate : roles) {
        if (name == toString(candidate)) {
            role = candidate;
            return true;
        }
    }
    return false;
}

inline bool parseComplianceLevel(const std::string& name, ComplianceLevel& level) {
    if (name == "AA" || name == "aa") {
        level = ComplianceLevel::AA;
        return true;
    }
    if (name == "AAA" || name == "aaa") {
        level = ComplianceLevel::AAA;
        return true;
    }
    return false;
}

}  // namespace ContrastAudit::Types
