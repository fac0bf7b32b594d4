#pragma once
// =============================================================================
// ManaAnalyzer - mana bar fill from an HSV range mask
// =============================================================================

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "vision/image.hpp"

namespace rampart::vision {

struct ManaReading {
    int current = 0;
    int max = 0;
    float percentage = 0.0f;    // [0,100]
    float confidence = 0.0f;    // min(percentage / 50, 1)

    nlohmann::json toJson() const {
        return {{"current_mana", current}, {"max_mana", max},
                {"percentage", percentage}, {"confidence", confidence}};
    }
};

class ManaAnalyzer {
public:
    explicit ManaAnalyzer(const config::ManaConfig& cfg) : cfg_(cfg) {}

    ManaReading analyze(const RgbImage& screen) const;

    bool inRange(const Hsv& px) const;
    const config::ManaConfig& config() const { return cfg_; }

private:
    config::ManaConfig cfg_;
};

} // namespace rampart::vision
