#pragma once

#include "ColorSpaceConverter.hpp"
#include "../domain/Color.hpp"
#include "../domain/InvalidColorError.hpp"
#include <shared/types/Common.hpp>
#include <map>
#include <optional>
#include <string>

namespace ContrastAudit::Internal::Processing {

class ColorParser {
  public:
    // Accepts named colors, #rgb, #rgba, #rrggbb, #rrggbbaa (hash optional,
    // case-insensitive) and rgb()/rgba()/hsl()/hsla() literals. Alpha is dropped.
    // Throws Domain::InvalidColorError.
    Domain::Color normalize(const std::string& input) const;

    // Same as normalize() but returns the canonical "#rrggbb" string
    std::string normalizeToHex(const std::string& input) const;

    bool isValid(const std::string& input) const;

    static const std::map<std::string, std::string>& namedColors();

  private:
    ColorSpaceConverter colorConverter_;

    // Returns hex digits without '#', or nullopt when the literal is not functional notation
    std::optional<std::string> expandFunctional(const std::string& value) const;

    static std::optional<Domain::Color> parseHexDigits(const std::string& digits);
};

}  // namespace ContrastAudit::Internal::Processing
