#pragma once

#include <shared/types/Common.hpp>
#include <cmath>

namespace ContrastAudit::Domain {

struct ContrastResult {
    double ratio = Types::MIN_CONTRAST_RATIO;
    bool aaBody = false;
    bool aaLarge = false;
    bool aaaBody = false;
    bool aaaLarge = false;

    // Thresholds are exact cutoffs; no rounding before comparison
    static ContrastResult fromRatio(double ratio) {
        ContrastResult result;
        result.ratio = ratio;
        result.aaBody = ratio >= Types::WCAG_AA_BODY;
        result.aaLarge = ratio >= Types::WCAG_AA_LARGE;
        result.aaaBody = ratio >= Types::WCAG_AAA_BODY;
        result.aaaLarge = ratio >= Types::WCAG_AAA_LARGE;
        return result;
    }

    bool passesAll() const { return aaBody && aaLarge && aaaBody && aaaLarge; }
    bool meets(double minRatio) const { return ratio >= minRatio; }

    // Display value only
    double roundedRatio() const { return std::round(ratio * 100.0) / 100.0; }
};

}  // namespace ContrastAudit::Domain
