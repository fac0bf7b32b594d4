#include "vision/mana_analyzer.hpp"
#include "rampart_log.hpp"

#include <algorithm>
#include <cmath>

namespace rampart::vision {

bool ManaAnalyzer::inRange(const Hsv& px) const {
    return px.h >= cfg_.lower_hsv[0] && px.h <= cfg_.upper_hsv[0] &&
           px.s >= cfg_.lower_hsv[1] && px.s <= cfg_.upper_hsv[1] &&
           px.v >= cfg_.lower_hsv[2] && px.v <= cfg_.upper_hsv[2];
}

ManaReading ManaAnalyzer::analyze(const RgbImage& screen) const {
    ManaReading reading;
    reading.max = cfg_.max_mana;

    RgbImage region = crop(screen, cfg_.region.x, cfg_.region.y, cfg_.region.w, cfg_.region.h);
    if (region.empty()) {
        RLOG_DEBUG("mana", "mana region (%d,%d %dx%d) outside %dx%d frame",
                   cfg_.region.x, cfg_.region.y, cfg_.region.w, cfg_.region.h, screen.w, screen.h);
        return reading;
    }

    const int64_t total = static_cast<int64_t>(region.w) * region.h;
    int64_t matched = 0;
    for (int64_t i = 0; i < total; ++i) {
        const uint8_t* p = &region.pix[static_cast<size_t>(i) * 3];
        if (inRange(rgbToHsv(p[0], p[1], p[2]))) matched++;
    }

    // floor(fraction * max) in integers
    reading.current = static_cast<int>(matched * cfg_.max_mana / total);
    reading.percentage = static_cast<float>(100.0 * matched / total);
    reading.confidence = std::min(reading.percentage / 50.0f, 1.0f);
    return reading;
}

} // namespace rampart::vision
