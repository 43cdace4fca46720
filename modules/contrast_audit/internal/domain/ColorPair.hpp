#pragma once

#include "Color.hpp"
#include <shared/types/Common.hpp>

namespace ContrastAudit::Domain {

class ColorPair {
  public:
    ColorPair(const Color& foreground, const Color& background,
              Types::PairRole role = Types::PairRole::TEXT,
              Types::ComplianceLevel level = Types::ComplianceLevel::AA)
        : foreground_(foreground), background_(background), role_(role),
          minimumRatio_(minimumRatioFor(role, level)) {}

    ColorPair(const Color& foreground, const Color& background, Types::PairRole role,
              double minimumRatio)
        : foreground_(foreground), background_(background), role_(role),
          minimumRatio_(minimumRatio) {}

    const Color& getForeground() const { return foreground_; }
    const Color& getBackground() const { return background_; }
    Types::PairRole getRole() const { return role_; }
    double getMinimumRatio() const { return minimumRatio_; }

    // WCAG 1.4.3 / 1.4.6 for text, 1.4.11 for non-text content (no AAA tier)
    static double minimumRatioFor(Types::PairRole role, Types::ComplianceLevel level) {
        const bool aaa = level == Types::ComplianceLevel::AAA;
        switch (role) {
            case Types::PairRole::TEXT:
                return aaa ? Types::WCAG_AAA_BODY : Types::WCAG_AA_BODY;
            case Types::PairRole::LARGE_TEXT:
                return aaa ? Types::WCAG_AAA_LARGE : Types::WCAG_AA_LARGE;
            case Types::PairRole::GRAPHIC:
            case Types::PairRole::STROKE:
            case Types::PairRole::BORDER:
                return Types::WCAG_NON_TEXT;
        }
        return Types::WCAG_AA_BODY;
    }

  private:
    Color foreground_;
    Color background_;
    Types::PairRole role_;
    double minimumRatio_;
};

}  // namespace ContrastAudit::Domain
