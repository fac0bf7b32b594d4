#include "vision/color_matcher.hpp"
#include "rampart_log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <tuple>
#include <unordered_map>

namespace fs = std::filesystem;

static constexpr const char* TAG = "color";

namespace rampart::vision {

std::vector<ColorCount> dominantColors(const RgbImage& img, int bucket, int top_n) {
    std::vector<ColorCount> out;
    if (img.empty() || bucket <= 0 || top_n <= 0) return out;

    std::unordered_map<int, int> counts;
    const size_t n = static_cast<size_t>(img.w) * img.h;
    for (size_t i = 0; i < n; ++i) {
        int r = img.pix[i * 3 + 0] / bucket * bucket;
        int g = img.pix[i * 3 + 1] / bucket * bucket;
        int b = img.pix[i * 3 + 2] / bucket * bucket;
        counts[(r << 16) | (g << 8) | b]++;
    }

    out.reserve(counts.size());
    for (const auto& [key, count] : counts) {
        out.push_back({{(key >> 16) & 0xff, (key >> 8) & 0xff, key & 0xff}, count});
    }
    std::sort(out.begin(), out.end(), [](const ColorCount& a, const ColorCount& b) {
        if (a.count != b.count) return a.count > b.count;
        return std::tie(a.color.r, a.color.g, a.color.b) < std::tie(b.color.r, b.color.g, b.color.b);
    });
    if (out.size() > static_cast<size_t>(top_n)) out.resize(top_n);
    return out;
}

Result<size_t> ColorMatcher::loadReferenceDir(const std::string& dir, int bucket) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Err<size_t>("reference directory not found: " + dir, ErrorCode::IoError);
    }

    std::vector<UnitSignature> refs;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext != ".png" && ext != ".jpg" && ext != ".jpeg") continue;

        auto img = loadImageFile(entry.path().string());
        if (!img) continue;
        auto colors = dominantColors(img.value(), bucket, 1);
        if (colors.empty()) continue;

        refs.push_back({entry.path().stem().string(), colors.front().color});
        RLOG_DEBUG(TAG, "reference %s = (%d,%d,%d)", refs.back().label.c_str(),
                   refs.back().reference_color.r, refs.back().reference_color.g,
                   refs.back().reference_color.b);
    }
    if (ec) {
        return Err<size_t>("cannot read " + dir + ": " + ec.message(), ErrorCode::IoError);
    }

    std::sort(refs.begin(), refs.end(),
              [](const UnitSignature& a, const UnitSignature& b) { return a.label < b.label; });
    refs_ = std::move(refs);
    RLOG_INFO(TAG, "Loaded %zu unit reference(s) from %s", refs_.size(), dir.c_str());
    return refs_.size();
}

std::optional<ColorMatcher::Match> ColorMatcher::match(const std::vector<ColorCount>& candidates) const {
    if (refs_.empty()) return std::nullopt;

    for (const auto& cand : candidates) {
        const UnitSignature* best = nullptr;
        int best_d = 0;
        for (const auto& ref : refs_) {
            int d = squaredDistance(cand.color, ref.reference_color);
            if (!best || d < best_d) {
                best = &ref;
                best_d = d;
            }
        }
        if (best && best_d <= max_distance_) {
            Match m;
            m.label = best->label;
            m.distance = best_d;
            m.confidence = std::max(0.1f, 1.0f - static_cast<float>(best_d) / max_distance_);
            return m;
        }
    }
    return std::nullopt;
}

} // namespace rampart::vision
