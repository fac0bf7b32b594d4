#include "vision/perception_pipeline.hpp"
#include "event_bus.hpp"
#include "rampart_log.hpp"

#include <algorithm>
#include <chrono>
#include <numeric>

static constexpr const char* TAG = "vision";

namespace rampart::vision {

nlohmann::json PerceptionResult::toJson() const {
    return {
        {"valid", valid},
        {"error", error},
        {"timestamp", timestamp_ms},
        {"processing_time_ms", processing_ms},
        {"in_game", inGame()},
        {"grid", grid.toJson()},
        {"mana", mana.toJson()},
    };
}

nlohmann::json UnitRecognition::toJson() const {
    return {{"unit_type", unit_type}, {"confidence", confidence},
            {"rank", rank}, {"rank_confidence", rank_confidence},
            {"position", {x, y}}};
}

nlohmann::json PerceptionStats::toJson() const {
    return {
        {"total_analyses", total_analyses},
        {"grid_analyses", grid_analyses},
        {"mana_analyses", mana_analyses},
        {"template_matches", template_matches},
        {"unit_recognitions", unit_recognitions},
        {"rank_predictions", rank_predictions},
        {"decode_failures", decode_failures},
        {"average_processing_time", avg_process_time_ms},
        {"templates_loaded", templates_loaded},
        {"references_loaded", references_loaded},
        {"model_loaded", model_loaded},
    };
}

PerceptionPipeline::PerceptionPipeline(const config::GridConfig& grid, const config::ManaConfig& mana,
                                       const config::VisionConfig& vision)
    : grid_(grid), mana_cfg_(mana), vision_(vision),
      confidence_threshold_(vision.confidence_threshold) {
    tables_.colors = std::make_shared<const ColorMatcher>(vision_.max_color_distance);
    tables_.templates = std::make_shared<const TemplateLibrary>();
    tables_.ranks = std::make_shared<const NullRankClassifier>();
}

config::VisionConfig PerceptionPipeline::visionConfig() const {
    config::VisionConfig v = vision_;
    v.confidence_threshold = confidence_threshold_.load();
    return v;
}

void PerceptionPipeline::setConfidenceThreshold(float threshold) {
    threshold = std::clamp(threshold, 0.0f, 1.0f);
    if (confidence_threshold_.exchange(threshold) != threshold) {
        RLOG_INFO(TAG, "template confidence threshold -> %.2f", threshold);
    }
}

PerceptionPipeline::Tables PerceptionPipeline::snapshot() const {
    std::lock_guard<std::mutex> lock(tables_mutex_);
    return tables_;
}

// =============================================================================
// Reference data
// =============================================================================

void PerceptionPipeline::loadAll() {
    if (auto r = loadReferences(vision_.references_dir); r.is_err()) {
        RLOG_WARN(TAG, "unit references: %s", r.error().message.c_str());
    }
    if (auto r = loadTemplates(vision_.templates_dir); r.is_err()) {
        RLOG_WARN(TAG, "templates: %s", r.error().message.c_str());
    }
    if (auto r = loadRankModel(vision_.rank_model_path); r.is_err()) {
        RLOG_WARN(TAG, "rank model: %s (ranks disabled)", r.error().message.c_str());
    }
}

Result<size_t> PerceptionPipeline::loadReferences(const std::string& dir) {
    auto matcher = std::make_shared<ColorMatcher>(vision_.max_color_distance);
    auto loaded = matcher->loadReferenceDir(dir, vision_.color_bucket);
    if (loaded.is_err()) return loaded;
    std::lock_guard<std::mutex> lock(tables_mutex_);
    tables_.colors = std::move(matcher);
    return loaded;
}

Result<size_t> PerceptionPipeline::loadTemplates(const std::string& dir) {
    auto lib = std::make_shared<TemplateLibrary>();
    auto loaded = lib->loadDirectory(dir);
    if (loaded.is_err()) return loaded;
    std::lock_guard<std::mutex> lock(tables_mutex_);
    tables_.templates = std::move(lib);
    return loaded;
}

Result<void> PerceptionPipeline::loadRankModel(const std::string& path) {
    auto clf = std::make_shared<LogisticRankClassifier>();
    RAMPART_TRY(clf->load(path));
    std::lock_guard<std::mutex> lock(tables_mutex_);
    tables_.trainable = clf;
    tables_.ranks = clf;
    return Ok();
}

Result<size_t> PerceptionPipeline::trainRankModel(const std::string& dir, const RankTrainingOptions& opts) {
    auto clf = std::make_shared<LogisticRankClassifier>();
    auto trained = clf->trainFromDirectory(dir, opts);
    if (trained.is_err()) return trained;
    std::lock_guard<std::mutex> lock(tables_mutex_);
    tables_.trainable = clf;
    tables_.ranks = clf;
    return trained;
}

Result<void> PerceptionPipeline::saveRankModel(const std::string& path) const {
    auto t = snapshot();
    if (!t.trainable) return Error("no trained rank model", ErrorCode::ClassifierUnavailable);
    return t.trainable->save(path);
}

Result<std::string> PerceptionPipeline::addTrainingSample(const std::vector<uint8_t>& image_bytes, int rank) {
    auto img = decodeImage(image_bytes.data(), image_bytes.size());
    if (img.is_err()) return img.error();
    return saveTrainingSample(vision_.training_dir, img.value(), rank);
}

nlohmann::json PerceptionPipeline::trainingStats() const {
    auto counts = trainingSampleCounts(vision_.training_dir);
    nlohmann::json dist = nlohmann::json::object();
    int total = 0;
    for (const auto& [rank, n] : counts) {
        dist[std::to_string(rank)] = n;
        total += n;
    }
    return {{"total_samples", total},
            {"rank_distribution", dist},
            {"unique_ranks", counts.size()},
            {"model_trained", snapshot().ranks->isLoaded()}};
}

void PerceptionPipeline::setReferences(std::vector<UnitSignature> refs) {
    auto matcher = std::make_shared<ColorMatcher>(vision_.max_color_distance);
    matcher->setReferences(std::move(refs));
    std::lock_guard<std::mutex> lock(tables_mutex_);
    tables_.colors = std::move(matcher);
}

void PerceptionPipeline::setTemplates(std::vector<UnitTemplate> templates) {
    auto lib = std::make_shared<TemplateLibrary>();
    for (auto& t : templates) lib->add(std::move(t));
    std::lock_guard<std::mutex> lock(tables_mutex_);
    tables_.templates = std::move(lib);
}

void PerceptionPipeline::setRankClassifier(std::shared_ptr<const RankClassifier> classifier) {
    std::lock_guard<std::mutex> lock(tables_mutex_);
    tables_.trainable.reset();
    tables_.ranks = classifier ? std::move(classifier)
                               : std::make_shared<const NullRankClassifier>();
}

// =============================================================================
// Analysis
// =============================================================================

void PerceptionPipeline::recordTiming(double ms) {
    // caller holds stats_mutex_
    timings_.push_back(ms);
    if (timings_.size() > TIMING_WINDOW) timings_.pop_front();
    stats_.avg_process_time_ms =
        std::accumulate(timings_.begin(), timings_.end(), 0.0) / timings_.size();
}

PerceptionResult PerceptionPipeline::analyzeImage(const RgbImage& img) {
    auto start = std::chrono::steady_clock::now();
    auto t = snapshot();

    PerceptionResult result;
    result.timestamp_ms = wallClockMs();
    GridAnalyzer grid(grid_, visionConfig(), *t.colors, *t.templates, *t.ranks);
    result.grid = grid.analyze(img);
    result.mana = ManaAnalyzer(mana_cfg_).analyze(img);
    result.valid = result.grid.valid;
    result.processing_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.total_analyses++;
    stats_.grid_analyses++;
    stats_.mana_analyses++;
    stats_.template_matches += result.grid.template_matches;
    stats_.rank_predictions += result.grid.rank_predictions;
    recordTiming(result.processing_ms);
    return result;
}

PerceptionResult PerceptionPipeline::analyze(const std::vector<uint8_t>& png) {
    auto img = decodeImage(png.data(), png.size());
    if (img.is_ok()) return analyzeImage(img.value());

    PerceptionResult result;
    result.timestamp_ms = wallClockMs();
    result.grid = GridAnalyzer::emptyResult(grid_);
    result.mana.max = mana_cfg_.max_mana;
    result.valid = false;
    result.error = img.error().message;
    RLOG_WARN(TAG, "frame rejected: %s", result.error.c_str());

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.total_analyses++;
    stats_.decode_failures++;
    return result;
}

GridAnalysis PerceptionPipeline::analyzeGrid(const std::vector<uint8_t>& png) {
    auto start = std::chrono::steady_clock::now();
    auto img = decodeImage(png.data(), png.size());
    if (img.is_err()) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_analyses++;
        stats_.decode_failures++;
        return GridAnalyzer::emptyResult(grid_);
    }

    auto t = snapshot();
    GridAnalysis g = GridAnalyzer(grid_, visionConfig(), *t.colors, *t.templates, *t.ranks).analyze(img.value());
    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.total_analyses++;
    stats_.grid_analyses++;
    stats_.template_matches += g.template_matches;
    stats_.rank_predictions += g.rank_predictions;
    recordTiming(ms);
    return g;
}

ManaReading PerceptionPipeline::analyzeMana(const std::vector<uint8_t>& png) {
    auto start = std::chrono::steady_clock::now();
    auto img = decodeImage(png.data(), png.size());
    if (img.is_err()) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_analyses++;
        stats_.decode_failures++;
        ManaReading empty;
        empty.max = mana_cfg_.max_mana;
        return empty;
    }

    ManaReading m = ManaAnalyzer(mana_cfg_).analyze(img.value());
    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.total_analyses++;
    stats_.mana_analyses++;
    recordTiming(ms);
    return m;
}

UnitRecognition PerceptionPipeline::recognizeUnit(const std::vector<uint8_t>& png) {
    UnitRecognition out;
    auto img = decodeImage(png.data(), png.size());
    if (img.is_err()) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.decode_failures++;
        return out;
    }

    const RgbImage& unit = img.value();
    auto t = snapshot();
    out.x = unit.w / 2;
    out.y = unit.h / 2;

    auto m = t.colors->match(dominantColors(unit, vision_.color_bucket, vision_.top_colors));
    out.unit_type = m ? m->label : "empty";
    float color_conf = m ? m->confidence : 0.0f;

    bool predicted = false;
    if (t.ranks->isLoaded()) {
        RankPrediction rp = t.ranks->predict(toGray(unit));
        out.rank = rp.rank;
        out.rank_confidence = rp.confidence;
        predicted = true;
    }
    out.confidence = out.rank > 0 ? std::min(color_conf, out.rank_confidence) : color_conf;

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.unit_recognitions++;
    if (predicted) stats_.rank_predictions++;
    return out;
}

PerceptionStats PerceptionPipeline::stats() const {
    auto t = snapshot();
    std::lock_guard<std::mutex> lock(stats_mutex_);
    PerceptionStats s = stats_;
    s.templates_loaded = t.templates->size();
    s.references_loaded = t.colors->size();
    s.model_loaded = t.ranks->isLoaded();
    return s;
}

void PerceptionPipeline::resetStats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = PerceptionStats{};
    timings_.clear();
}

} // namespace rampart::vision
