#pragma once
// =============================================================================
// GridAnalyzer - rows x cols cell classification
// =============================================================================
// Per cell, first decisive step wins:
//   1. brightness outside [brightness_min, brightness_max] -> empty (0.1)
//   2. dominant colour within max_color_distance of a reference -> unit
//   3. "card" template above its threshold -> unit
//   4. otherwise occupied, label "unknown" (0.5)
// The analyzer is a pure function of (image, config, reference tables).
// =============================================================================

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "vision/color_matcher.hpp"
#include "vision/image.hpp"
#include "vision/rank_classifier.hpp"
#include "vision/template_library.hpp"

namespace rampart::vision {

enum class MatchSource { None, Color, Template, Unknown };

const char* matchSourceName(MatchSource s);

struct GridCell {
    int row = 0;
    int col = 0;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    bool occupied = false;
    std::optional<std::string> unit_label;
    float confidence = 0.0f;      // [0,1]
    int rank = 0;
    float rank_confidence = 0.0f;
    MatchSource source = MatchSource::None;

    int centerX() const { return x + width / 2; }
    int centerY() const { return y + height / 2; }
    nlohmann::json toJson() const;
};

struct MergePair {
    int from_row = 0;
    int from_col = 0;
    int to_row = 0;
    int to_col = 0;
    std::string label;
};

struct GridAnalysis {
    std::vector<GridCell> cells;     // row-major, always rows * cols
    std::vector<MergePair> mergeable;
    bool valid = false;
    int occupied_count = 0;
    int template_matches = 0;
    int rank_predictions = 0;

    int emptyCount() const { return static_cast<int>(cells.size()) - occupied_count; }
    nlohmann::json toJson() const;
};

class GridAnalyzer {
public:
    GridAnalyzer(const config::GridConfig& grid, const config::VisionConfig& vision,
                 const ColorMatcher& colors, const TemplateLibrary& templates,
                 const RankClassifier& ranks);

    GridAnalysis analyze(const RgbImage& screen) const;

    // Classify one already-cropped cell image
    GridCell classifyCell(const RgbImage& cell_img, GridCell cell, GridAnalysis* counters = nullptr) const;

    // Explicitly empty result for an undecodable frame
    static GridAnalysis emptyResult(const config::GridConfig& grid);

    static config::Rect cellRect(const config::GridConfig& grid, int row, int col);

    // 4-adjacent occupied pairs with the same colour/template label
    static std::vector<MergePair> findMergeablePairs(const std::vector<GridCell>& cells,
                                                     int rows, int cols);

private:
    RgbImage colorSample(const RgbImage& cell_img) const;

    config::GridConfig grid_;
    config::VisionConfig vision_;
    const ColorMatcher& colors_;
    const TemplateLibrary& templates_;
    const RankClassifier& ranks_;
};

} // namespace rampart::vision
