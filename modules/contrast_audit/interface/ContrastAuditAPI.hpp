#pragma once

// Main public API header
#include "IConfiguration.hpp"
#include "../internal/analysis/PairAnalyzer.hpp"
#include "../internal/domain/AnalysisResult.hpp"
#include "../internal/domain/InvalidColorError.hpp"

// Common types for public API
#include <shared/types/Common.hpp>

#include <string>

// Version information
namespace ContrastAudit {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

using Domain::InvalidColorError;
using Internal::Analysis::AnalysisOptions;

// Simplified API for common use cases. Every function taking color literals
// throws InvalidColorError for input that cannot be normalized.
namespace SimpleAPI {

// "#abc", "white", "rgb(0 0 0)" ... -> "#rrggbb"
std::string normalizeColor(const std::string& color);

double contrastRatio(const std::string& first, const std::string& second);

// Recolors `color` (hue and saturation kept) to reach `targetRatio` against `anchor`
Domain::FixSuggestion suggestFix(const std::string& color,
                                 const std::string& anchor,
                                 double targetRatio);

Domain::AnalysisResult analyzePair(const std::string& foreground,
                                   const std::string& background,
                                   const AnalysisOptions& options = {});

// Same as analyzePair, using the configuration's analysis and fixer settings
Domain::AnalysisResult analyzePair(const std::string& foreground,
                                   const std::string& background,
                                   const Interface::IConfiguration& config);

}  // namespace SimpleAPI

}  // namespace ContrastAudit
