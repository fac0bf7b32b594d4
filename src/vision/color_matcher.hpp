#pragma once
// =============================================================================
// ColorMatcher - unit identity by dominant colour signature
// =============================================================================
// Reference table: one signature per unit image (label = file stem, colour =
// its most frequent quantized colour). Immutable once loaded.
// =============================================================================

#include <optional>
#include <string>
#include <vector>

#include "result.hpp"
#include "vision/image.hpp"

namespace rampart::vision {

struct Rgb {
    int r = 0;
    int g = 0;
    int b = 0;

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
};

struct ColorCount {
    Rgb color;
    int count = 0;
};

struct UnitSignature {
    std::string label;
    Rgb reference_color;
};

// Channels quantized to floor(c / bucket) * bucket; most frequent first,
// ties broken by colour value so the order is deterministic
std::vector<ColorCount> dominantColors(const RgbImage& img, int bucket, int top_n);

inline int squaredDistance(const Rgb& a, const Rgb& b) {
    int dr = a.r - b.r, dg = a.g - b.g, db = a.b - b.b;
    return dr * dr + dg * dg + db * db;
}

class ColorMatcher {
public:
    struct Match {
        std::string label;
        int distance = 0;
        float confidence = 0.0f;   // max(0.1, 1 - distance / max_distance)
    };

    explicit ColorMatcher(int max_distance = 2000) : max_distance_(max_distance) {}

    void setReferences(std::vector<UnitSignature> refs) { refs_ = std::move(refs); }

    // One signature per image file in `dir`, sorted by label
    Result<size_t> loadReferenceDir(const std::string& dir, int bucket);

    // First candidate (in the given order) whose nearest reference lies within
    // max_distance wins
    std::optional<Match> match(const std::vector<ColorCount>& candidates) const;

    const std::vector<UnitSignature>& references() const { return refs_; }
    size_t size() const { return refs_.size(); }
    int maxDistance() const { return max_distance_; }

private:
    int max_distance_;
    std::vector<UnitSignature> refs_;
};

} // namespace rampart::vision
