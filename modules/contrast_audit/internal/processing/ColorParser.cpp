#include "ColorParser.hpp"
#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace ContrastAudit::Internal::Processing {

namespace {

std::string trimAndLower(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(input.rbegin(), input.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return std::string();

    std::string value(begin, end);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool startsWith(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

// Parses a full token as a finite number, with an optional unit suffix stripped
bool parseNumber(std::string token, const std::string& suffix, double& number, bool& hadSuffix) {
    hadSuffix = false;
    if (!suffix.empty() && token.size() > suffix.size() &&
        token.compare(token.size() - suffix.size(), suffix.size(), suffix) == 0) {
        token.erase(token.size() - suffix.size());
        hadSuffix = true;
    }
    if (token.empty()) return false;

    char* end = nullptr;
    number = std::strtod(token.c_str(), &end);
    return end == token.c_str() + token.size() && std::isfinite(number);
}

}  // namespace

const std::map<std::string, std::string>& ColorParser::namedColors() {
    static const std::map<std::string, std::string> colors = {
        {"black", "#000000"},     {"white", "#ffffff"},     {"red", "#ff0000"},
        {"green", "#008000"},     {"blue", "#0000ff"},      {"yellow", "#ffff00"},
        {"orange", "#ffa500"},    {"purple", "#800080"},    {"pink", "#ffc0cb"},
        {"gray", "#808080"},      {"grey", "#808080"},      {"brown", "#a52a2a"},
        {"cyan", "#00ffff"},      {"magenta", "#ff00ff"},   {"lime", "#00ff00"},
        {"navy", "#000080"},      {"teal", "#008080"},      {"maroon", "#800000"},
        {"olive", "#808000"},     {"silver", "#c0c0c0"},    {"aqua", "#00ffff"},
        {"fuchsia", "#ff00ff"},   {"indigo", "#4b0082"},    {"violet", "#ee82ee"},
        {"gold", "#ffd700"},      {"coral", "#ff7f50"},     {"salmon", "#fa8072"},
        {"crimson", "#dc143c"},   {"turquoise", "#40e0d0"}, {"tan", "#d2b48c"},
        {"beige", "#f5f5dc"},     {"khaki", "#f0e68c"},     {"lavender", "#e6e6fa"},
        {"darkgray", "#a9a9a9"},  {"lightgray", "#d3d3d3"}, {"darkblue", "#00008b"},
        {"darkgreen", "#006400"}, {"darkred", "#8b0000"},
    };
    return colors;
}

Domain::Color ColorParser::normalize(const std::string& input) const {
    std::string value = trimAndLower(input);
    if (value.empty()) {
        throw Domain::InvalidColorError(input);
    }

    const auto& named = namedColors();
    auto namedIt = named.find(value);
    if (namedIt != named.end()) {
        value = namedIt->second;
    }

    if (auto expanded = expandFunctional(value)) {
        value = *expanded;
    }

    std::string digits = value;
    if (!digits.empty() && digits[0] == '#') {
        digits.erase(0, 1);
    }

    // Reported value is the literal after trimming and named-color substitution
    std::optional<Domain::Color> color = parseHexDigits(digits);
    if (!color) {
        throw Domain::InvalidColorError(value);
    }
    return *color;
}

std::string ColorParser::normalizeToHex(const std::string& input) const {
    return normalize(input).toHex();
}

bool ColorParser::isValid(const std::string& input) const {
    try {
        normalize(input);
        return true;
    } catch (const Domain::InvalidColorError& e) {
        LOG_DEBUG("Rejected color literal: ", e.value());
        return false;
    }
}

std::optional<std::string> ColorParser::expandFunctional(const std::string& value) const {
    const bool isRgb = startsWith(value, "rgb(") || startsWith(value, "rgba(");
    const bool isHsl = startsWith(value, "hsl(") || startsWith(value, "hsla(");
    if (!isRgb && !isHsl) {
        return std::nullopt;
    }

    size_t open = value.find('(');
    if (value.back() != ')' || open == std::string::npos) {
        throw Domain::InvalidColorError(value);
    }

    std::string arguments = value.substr(open + 1, value.size() - open - 2);
    std::replace(arguments.begin(), arguments.end(), ',', ' ');
    std::replace(arguments.begin(), arguments.end(), '/', ' ');

    std::vector<std::string> tokens;
    std::istringstream stream(arguments);
    for (std::string token; stream >> token;) {
        tokens.push_back(token);
    }

    // A fourth token is alpha and is discarded
    if (tokens.size() != 3 && tokens.size() != 4) {
        throw Domain::InvalidColorError(value);
    }

    double components[3];
    bool percent = false;

    if (isRgb) {
        for (int i = 0; i < 3; ++i) {
            if (!parseNumber(tokens[i], "%", components[i], percent)) {
                throw Domain::InvalidColorError(value);
            }
            double channel = percent ? components[i] * 2.55 : components[i];
            components[i] = std::clamp(channel, 0.0, 255.0) / 255.0;
        }
        return Domain::Color::fromUnit(
                   Types::ColorValue(components[0], components[1], components[2]))
            .toHex().substr(1);
    }

    if (!parseNumber(tokens[0], "deg", components[0], percent) ||
        !parseNumber(tokens[1], "%", components[1], percent) ||
        !parseNumber(tokens[2], "%", components[2], percent)) {
        throw Domain::InvalidColorError(value);
    }

    return colorConverter_.fromHSL(Types::ColorValue(components[0], components[1], components[2]))
        .toHex().substr(1);
}

std::optional<Domain::Color> ColorParser::parseHexDigits(const std::string& digits) {
    const size_t length = digits.size();
    if (length != 3 && length != 4 && length != 6 && length != 8) {
        return std::nullopt;
    }

    std::vector<int> values;
    values.reserve(length);
    for (char c : digits) {
        int digit = hexDigit(c);
        if (digit < 0) {
            return std::nullopt;
        }
        values.push_back(digit);
    }

    // Short form: each digit is duplicated ("3" -> "33")
    if (length == 3 || length == 4) {
        return Domain::Color(values[0] * 17, values[1] * 17, values[2] * 17);
    }

    return Domain::Color(values[0] * 16 + values[1], values[2] * 16 + values[3],
                         values[4] * 16 + values[5]);
}

}  // namespace ContrastAudit::Internal::Processing
