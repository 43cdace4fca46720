#pragma once

#include <shared/types/Common.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ostream>
#include <string>

namespace ContrastAudit::Domain {

// Opaque sRGB color with 8-bit channels. Alpha is never carried.
class Color {
  public:
    Color() : channels_(0, 0, 0) {}

    Color(int red, int green, int blue)
        : channels_(cv::saturate_cast<uchar>(red), cv::saturate_cast<uchar>(green),
                    cv::saturate_cast<uchar>(blue)) {}

    explicit Color(const Types::Channels& channels) : channels_(channels) {}

    static Color black() { return Color(0, 0, 0); }
    static Color white() { return Color(255, 255, 255); }

    // Rounds and clamps unit-range channels
    static Color fromUnit(const Types::ColorValue& rgb) {
        return Color(static_cast<int>(std::lround(std::clamp(rgb[0], 0.0, 1.0) * 255.0)),
                     static_cast<int>(std::lround(std::clamp(rgb[1], 0.0, 1.0) * 255.0)),
                     static_cast<int>(std::lround(std::clamp(rgb[2], 0.0, 1.0) * 255.0)));
    }

    int red() const { return channels_[0]; }
    int green() const { return channels_[1]; }
    int blue() const { return channels_[2]; }

    Types::ColorValue toUnit() const {
        return Types::ColorValue(channels_[0] / 255.0, channels_[1] / 255.0, channels_[2] / 255.0);
    }

    std::string toHex() const {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", static_cast<unsigned>(channels_[0]),
                      static_cast<unsigned>(channels_[1]), static_cast<unsigned>(channels_[2]));
        return std::string(buffer);
    }

    bool operator==(const Color& other) const { return channels_ == other.channels_; }
    bool operator!=(const Color& other) const { return !(*this == other); }

  private:
    Types::Channels channels_;
};

inline std::ostream& operator<<(std::ostream& os, const Color& color) {
    return os << color.toHex();
}

}  // namespace ContrastAudit::Domain
