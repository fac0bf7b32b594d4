#include "vision/grid_analyzer.hpp"
#include "rampart_log.hpp"

#include <algorithm>

static constexpr const char* TAG = "grid";

namespace rampart::vision {

const char* matchSourceName(MatchSource s) {
    switch (s) {
        case MatchSource::None:     return "none";
        case MatchSource::Color:    return "color";
        case MatchSource::Template: return "template";
        case MatchSource::Unknown:  return "unknown";
    }
    return "none";
}

nlohmann::json GridCell::toJson() const {
    nlohmann::json j = {
        {"row", row}, {"col", col},
        {"x", x}, {"y", y}, {"width", width}, {"height", height},
        {"occupied", occupied},
        {"confidence", confidence},
        {"rank", rank},
        {"rank_confidence", rank_confidence},
        {"source", matchSourceName(source)},
    };
    j["unit_type"] = unit_label ? nlohmann::json(*unit_label) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json GridAnalysis::toJson() const {
    nlohmann::json cells_json = nlohmann::json::array();
    for (const auto& c : cells) cells_json.push_back(c.toJson());
    nlohmann::json pairs = nlohmann::json::array();
    for (const auto& p : mergeable) {
        pairs.push_back({{"from", {p.from_row, p.from_col}},
                         {"to", {p.to_row, p.to_col}},
                         {"unit_type", p.label}});
    }
    return {
        {"valid", valid},
        {"cells", cells_json},
        {"total_cells", cells.size()},
        {"occupied_cells", occupied_count},
        {"empty_cells", emptyCount()},
        {"mergeable_pairs", pairs},
    };
}

GridAnalyzer::GridAnalyzer(const config::GridConfig& grid, const config::VisionConfig& vision,
                           const ColorMatcher& colors, const TemplateLibrary& templates,
                           const RankClassifier& ranks)
    : grid_(grid), vision_(vision), colors_(colors), templates_(templates), ranks_(ranks) {}

config::Rect GridAnalyzer::cellRect(const config::GridConfig& grid, int row, int col) {
    return {grid.origin_x + col * (grid.cell_width + grid.spacing),
            grid.origin_y + row * (grid.cell_height + grid.spacing),
            grid.cell_width, grid.cell_height};
}

GridAnalysis GridAnalyzer::emptyResult(const config::GridConfig& grid) {
    GridAnalysis out;
    out.valid = false;
    out.cells.reserve(static_cast<size_t>(grid.rows) * grid.cols);
    for (int r = 0; r < grid.rows; ++r) {
        for (int c = 0; c < grid.cols; ++c) {
            auto rect = cellRect(grid, r, c);
            GridCell cell;
            cell.row = r;
            cell.col = c;
            cell.x = rect.x;
            cell.y = rect.y;
            cell.width = rect.w;
            cell.height = rect.h;
            out.cells.push_back(cell);
        }
    }
    return out;
}

RgbImage GridAnalyzer::colorSample(const RgbImage& cell_img) const {
    if (!vision_.crop_cells) return cell_img;
    int size = std::min({vision_.cell_crop_max,
                         cell_img.h - 2 * vision_.cell_inset_y,
                         cell_img.w - 2 * vision_.cell_inset_x});
    if (size <= 0) return cell_img;
    return crop(cell_img, vision_.cell_inset_x, vision_.cell_inset_y, size, size);
}

GridCell GridAnalyzer::classifyCell(const RgbImage& cell_img, GridCell cell,
                                    GridAnalysis* counters) const {
    cell.occupied = false;
    cell.unit_label.reset();
    cell.confidence = 0.0f;
    cell.source = MatchSource::None;
    if (cell_img.empty()) return cell;

    Gray8 gray = toGray(cell_img);
    double brightness = meanBrightness(gray);
    if (brightness < vision_.brightness_min || brightness > vision_.brightness_max) {
        cell.confidence = 0.1f;
        return cell;
    }

    auto candidates = dominantColors(colorSample(cell_img), vision_.color_bucket, vision_.top_colors);
    if (auto m = colors_.match(candidates)) {
        cell.occupied = true;
        cell.source = MatchSource::Color;
        cell.confidence = std::clamp(m->confidence, 0.0f, 1.0f);
        std::string label = m->label;

        if (ranks_.isLoaded()) {
            RankPrediction rp = ranks_.predict(gray);
            if (counters) counters->rank_predictions++;
            cell.rank = rp.rank;
            cell.rank_confidence = std::clamp(rp.confidence, 0.0f, 1.0f);
            if (rp.rank > 0 && rp.confidence > vision_.rank_min_confidence) {
                label += "_rank_" + std::to_string(rp.rank);
            }
        }
        cell.unit_label = label;
        return cell;
    }

    if (auto hit = templates_.bestMatch(gray, "card", vision_.confidence_threshold)) {
        if (counters) counters->template_matches++;
        cell.occupied = true;
        cell.source = MatchSource::Template;
        cell.unit_label = hit->name;
        cell.confidence = std::clamp(hit->score, 0.0f, 1.0f);
        return cell;
    }

    cell.occupied = true;
    cell.source = MatchSource::Unknown;
    cell.unit_label = "unknown";
    cell.confidence = 0.5f;
    return cell;
}

GridAnalysis GridAnalyzer::analyze(const RgbImage& screen) const {
    GridAnalysis out = emptyResult(grid_);
    out.valid = !screen.empty();
    if (!out.valid) return out;

    for (auto& cell : out.cells) {
        RgbImage cell_img = crop(screen, cell.x, cell.y, cell.width, cell.height);
        cell = classifyCell(cell_img, cell, &out);
        if (cell.occupied) out.occupied_count++;
    }
    out.mergeable = findMergeablePairs(out.cells, grid_.rows, grid_.cols);

    RLOG_DEBUG(TAG, "grid: %d/%zu occupied, %zu mergeable pair(s)",
               out.occupied_count, out.cells.size(), out.mergeable.size());
    return out;
}

std::vector<MergePair> GridAnalyzer::findMergeablePairs(const std::vector<GridCell>& cells,
                                                        int rows, int cols) {
    std::vector<MergePair> pairs;
    if (rows <= 0 || cols <= 0 || cells.size() != static_cast<size_t>(rows) * cols) return pairs;

    auto mergeable = [](const GridCell& c) {
        return c.occupied && c.unit_label &&
               (c.source == MatchSource::Color || c.source == MatchSource::Template);
    };
    auto at = [&](int r, int c) -> const GridCell& { return cells[static_cast<size_t>(r) * cols + c]; };

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const GridCell& a = at(r, c);
            if (!mergeable(a)) continue;
            if (c + 1 < cols) {
                const GridCell& b = at(r, c + 1);
                if (mergeable(b) && *b.unit_label == *a.unit_label) {
                    pairs.push_back({r, c, r, c + 1, *a.unit_label});
                }
            }
            if (r + 1 < rows) {
                const GridCell& b = at(r + 1, c);
                if (mergeable(b) && *b.unit_label == *a.unit_label) {
                    pairs.push_back({r, c, r + 1, c, *a.unit_label});
                }
            }
        }
    }
    return pairs;
}

} // namespace rampart::vision
