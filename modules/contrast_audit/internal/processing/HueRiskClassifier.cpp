#include "HueRiskClassifier.hpp"
#include <shared/utils/Logger.hpp>
#include <algorithm>

namespace ContrastAudit::Internal::Processing {

namespace {

bool hasBand(const std::vector<HueRiskClassifier::HueBand>& bands,
             HueRiskClassifier::HueBand band) {
    return std::find(bands.begin(), bands.end(), band) != bands.end();
}

}  // namespace

const std::vector<HueRiskClassifier::RiskyCombination>& HueRiskClassifier::riskyCombinations() {
    static const std::vector<RiskyCombination> combinations = {
        {HueBand::RED, HueBand::GREEN,
         "Red/green combination is difficult to distinguish for protanopia and deuteranopia"},
        {HueBand::RED, HueBand::BROWN,
         "Red/brown combination may be indistinguishable for protanopia"},
        {HueBand::BLUE, HueBand::PURPLE,
         "Blue/purple combination is difficult to distinguish for protanopia"},
        {HueBand::GREEN, HueBand::YELLOW,
         "Green/yellow combination may be confused with deuteranopia or tritanopia"},
    };
    return combinations;
}

const char* HueRiskClassifier::bandName(HueBand band) {
    switch (band) {
        case HueBand::RED: return "red";
        case HueBand::GREEN: return "green";
        case HueBand::BLUE: return "blue";
        case HueBand::PURPLE: return "purple";
        case HueBand::YELLOW: return "yellow";
        case HueBand::BROWN: return "brown";
    }
    return "unknown";
}

std::vector<HueRiskClassifier::HueBand> HueRiskClassifier::classify(
    const Domain::Color& color) const {
    Types::ColorValue hsl = colorConverter_.toHSL(color);
    const double hue = hsl[0];
    const double saturation = hsl[1];
    const double lightness = hsl[2];

    std::vector<HueBand> bands;

    if ((hue < 20.0 || hue > 340.0) && saturation > 30.0) {
        bands.push_back(HueBand::RED);
    }
    if (hue >= 80.0 && hue <= 170.0) {
        bands.push_back(HueBand::GREEN);
    }
    if (hue >= 200.0 && hue <= 260.0) {
        bands.push_back(HueBand::BLUE);
    }
    if (hue >= 260.0 && hue <= 320.0) {
        bands.push_back(HueBand::PURPLE);
    }
    if (hue >= 40.0 && hue <= 70.0) {
        bands.push_back(HueBand::YELLOW);
    }
    if ((hue < 40.0 || hue > 350.0) && saturation > 15.0 && lightness < 50.0) {
        bands.push_back(HueBand::BROWN);
    }

    return bands;
}

std::vector<std::string> HueRiskClassifier::checkRiskyHues(
    const Domain::Color& foreground, const Domain::Color& background) const {
    std::vector<HueBand> foregroundBands = classify(foreground);
    std::vector<HueBand> backgroundBands = classify(background);

    std::vector<std::string> warnings;
    for (const auto& combination : riskyCombinations()) {
        bool forward = hasBand(foregroundBands, combination.first) &&
                       hasBand(backgroundBands, combination.second);
        bool reverse = hasBand(foregroundBands, combination.second) &&
                       hasBand(backgroundBands, combination.first);
        if (forward || reverse) {
            warnings.emplace_back(combination.warning);
        }
    }

    if (!warnings.empty()) {
        LOG_DEBUG(warnings.size(), " risky hue combination(s) for ", foreground, " on ",
                  background);
    }
    return warnings;
}

}  // namespace ContrastAudit::Internal::Processing
