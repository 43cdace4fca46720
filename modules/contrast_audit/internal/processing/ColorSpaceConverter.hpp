#pragma once

#include "../domain/Color.hpp"
#include <shared/types/Common.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>

namespace ContrastAudit::Internal::Processing {

class ColorSpaceConverter {
  public:
    // Standard sRGB gamma correction parameters
    static constexpr double SRGB_GAMMA = 2.4;
    static constexpr double SRGB_ALPHA = 1.055;
    static constexpr double SRGB_OFFSET = 0.055;
    static constexpr double SRGB_BETA = 0.04045;
    static constexpr double SRGB_LINEAR_THRESHOLD = 0.0031308;
    static constexpr double SRGB_LINEAR_SLOPE = 12.92;

    // CIE illuminants (D65 white point)
    static constexpr double D65_X = 0.95047;
    static constexpr double D65_Y = 1.00000;
    static constexpr double D65_Z = 1.08883;

    static constexpr double LAB_EPSILON = 0.008856;
    static constexpr double LAB_KAPPA_SLOPE = 7.787;

    // sRGB channel in [0,1] to linear light
    double linearize(double component) const {
        if (component <= SRGB_BETA) {
            return component / SRGB_LINEAR_SLOPE;
        }
        return std::pow((component + SRGB_OFFSET) / SRGB_ALPHA, SRGB_GAMMA);
    }

    double delinearize(double component) const {
        if (component <= SRGB_LINEAR_THRESHOLD) {
            return component * SRGB_LINEAR_SLOPE;
        }
        return SRGB_ALPHA * std::pow(component, 1.0 / SRGB_GAMMA) - SRGB_OFFSET;
    }

    // sRGB to Linear RGB conversion
    Types::ColorValue sRGBToLinear(const Types::ColorValue& srgb) const {
        Types::ColorValue linear;
        for (int i = 0; i < 3; ++i) {
            linear[i] = linearize(srgb[i]);
        }
        return linear;
    }

    // Linear RGB to sRGB conversion
    Types::ColorValue linearToSRGB(const Types::ColorValue& linear) const {
        Types::ColorValue srgb;
        for (int i = 0; i < 3; ++i) {
            srgb[i] = delinearize(linear[i]);
        }
        return srgb;
    }

    Types::ColorValue toLinear(const Domain::Color& color) const {
        return sRGBToLinear(color.toUnit());
    }

    // Out-of-gamut linear values are clamped before gamma encoding
    Domain::Color fromLinear(const Types::ColorValue& linear) const {
        Types::ColorValue clamped;
        for (int i = 0; i < 3; ++i) {
            clamped[i] = std::clamp(linear[i], 0.0, 1.0);
        }
        return Domain::Color::fromUnit(linearToSRGB(clamped));
    }

    // Returns (hue [0,360), saturation [0,100], lightness [0,100])
    Types::ColorValue toHSL(const Domain::Color& color) const {
        Types::ColorValue rgb = color.toUnit();
        double r = rgb[0], g = rgb[1], b = rgb[2];

        double cmax = std::max({r, g, b});
        double cmin = std::min({r, g, b});
        double delta = cmax - cmin;

        double lightness = (cmax + cmin) / 2.0;
        double hue = 0.0;
        double saturation = 0.0;

        if (delta > 0.0) {
            saturation = lightness < 0.5 ? delta / (cmax + cmin) : delta / (2.0 - cmax - cmin);

            if (cmax == r) {
                hue = std::fmod((g - b) / delta, 6.0);
            } else if (cmax == g) {
                hue = (b - r) / delta + 2.0;
            } else {
                hue = (r - g) / delta + 4.0;
            }

            hue *= 60.0;
            if (hue < 0.0) hue += 360.0;
            if (hue >= 360.0) hue -= 360.0;
        }

        return Types::ColorValue(hue, saturation * 100.0, lightness * 100.0);
    }

    // Inverse of toHSL; hue wraps, saturation and lightness clamp to [0,100]
    Domain::Color fromHSL(const Types::ColorValue& hsl) const {
        double hue = std::fmod(hsl[0], 360.0);
        if (hue < 0.0) hue += 360.0;
        double saturation = std::clamp(hsl[1], 0.0, 100.0) / 100.0;
        double lightness = std::clamp(hsl[2], 0.0, 100.0) / 100.0;

        if (saturation == 0.0) {
            return Domain::Color::fromUnit(Types::ColorValue(lightness, lightness, lightness));
        }

        double q = lightness < 0.5 ? lightness * (1.0 + saturation)
                                   : lightness + saturation - lightness * saturation;
        double p = 2.0 * lightness - q;
        double h = hue / 360.0;

        return Domain::Color::fromUnit(Types::ColorValue(hueToChannel(p, q, h + 1.0 / 3.0),
                                                         hueToChannel(p, q, h),
                                                         hueToChannel(p, q, h - 1.0 / 3.0)));
    }

    // Linear RGB to XYZ conversion (using sRGB matrix)
    Types::ColorValue linearRGBToXYZ(const Types::ColorValue& rgb) const {
        // sRGB to XYZ matrix (D65 illuminant)
        static const Types::Matrix3x3 rgbToXyzMatrix(
            0.4124564, 0.3575761, 0.1804375,
            0.2126729, 0.7151522, 0.0721750,
            0.0193339, 0.1191920, 0.9503041
        );

        return rgbToXyzMatrix * rgb;
    }

    // XYZ to LAB conversion
    Types::ColorValue xyzToLab(const Types::ColorValue& xyz) const {
        double x = labF(xyz[0] / D65_X);
        double y = labF(xyz[1] / D65_Y);
        double z = labF(xyz[2] / D65_Z);

        double L = 116.0 * y - 16.0;
        double a = 500.0 * (x - y);
        double b = 200.0 * (y - z);

        return Types::ColorValue(L, a, b);
    }

    Types::ColorValue toXYZ(const Domain::Color& color) const {
        return linearRGBToXYZ(toLinear(color));
    }

    Types::ColorValue toLab(const Domain::Color& color) const {
        return xyzToLab(toXYZ(color));
    }

    // CIE76: Euclidean distance in Lab
    double deltaE(const Domain::Color& first, const Domain::Color& second) const {
        if (first == second) return 0.0;
        return cv::norm(toLab(first) - toLab(second), cv::NORM_L2);
    }

  private:
    static double labF(double t) {
        return t > LAB_EPSILON ? std::cbrt(t) : LAB_KAPPA_SLOPE * t + 16.0 / 116.0;
    }

    static double hueToChannel(double p, double q, double t) {
        if (t < 0.0) t += 1.0;
        if (t > 1.0) t -= 1.0;
        if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
        if (t < 1.0 / 2.0) return q;
        if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
        return p;
    }
};

}  // namespace ContrastAudit::Internal::Processing
