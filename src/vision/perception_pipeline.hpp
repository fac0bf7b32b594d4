#pragma once
// =============================================================================
// PerceptionPipeline - screenshot bytes -> structured game state
// =============================================================================
// Owns the reference tables (unit colours, templates, rank model). Tables are
// immutable snapshots swapped in by the loaders, so analysis never observes a
// half-loaded table. Only the run statistics are mutable.
// =============================================================================

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "result.hpp"
#include "vision/color_matcher.hpp"
#include "vision/grid_analyzer.hpp"
#include "vision/mana_analyzer.hpp"
#include "vision/rank_classifier.hpp"
#include "vision/template_library.hpp"

namespace rampart::vision {

struct PerceptionResult {
    GridAnalysis grid;
    ManaReading mana;
    bool valid = false;          // false: frame could not be decoded
    std::string error;
    int64_t timestamp_ms = 0;
    double processing_ms = 0.0;

    // Occupied cells or mana on screen means a match is running
    bool inGame() const { return valid && (grid.occupied_count > 0 || mana.current > 0); }
    nlohmann::json toJson() const;
};

struct UnitRecognition {
    std::string unit_type = "unknown";
    float confidence = 0.0f;
    int rank = 0;
    float rank_confidence = 0.0f;
    int x = 0;
    int y = 0;

    nlohmann::json toJson() const;
};

struct PerceptionStats {
    uint64_t total_analyses = 0;
    uint64_t grid_analyses = 0;
    uint64_t mana_analyses = 0;
    uint64_t template_matches = 0;
    uint64_t unit_recognitions = 0;
    uint64_t rank_predictions = 0;
    uint64_t decode_failures = 0;
    double avg_process_time_ms = 0.0;   // over the last 100 calls
    size_t templates_loaded = 0;
    size_t references_loaded = 0;
    bool model_loaded = false;

    nlohmann::json toJson() const;
};

class PerceptionPipeline {
public:
    static constexpr size_t TIMING_WINDOW = 100;

    PerceptionPipeline(const config::GridConfig& grid, const config::ManaConfig& mana,
                       const config::VisionConfig& vision);

    // --- reference data ---
    // Loads every table named in VisionConfig; missing pieces are logged only
    void loadAll();
    Result<size_t> loadReferences(const std::string& dir);
    Result<size_t> loadTemplates(const std::string& dir);
    Result<void> loadRankModel(const std::string& path);
    Result<size_t> trainRankModel(const std::string& dir, const RankTrainingOptions& opts = {});
    Result<void> saveRankModel(const std::string& path) const;
    Result<std::string> addTrainingSample(const std::vector<uint8_t>& image_bytes, int rank);
    nlohmann::json trainingStats() const;

    void setReferences(std::vector<UnitSignature> refs);
    void setTemplates(std::vector<UnitTemplate> templates);
    void setRankClassifier(std::shared_ptr<const RankClassifier> classifier);

    // --- analysis ---
    PerceptionResult analyze(const std::vector<uint8_t>& png);
    PerceptionResult analyzeImage(const RgbImage& img);
    GridAnalysis analyzeGrid(const std::vector<uint8_t>& png);
    ManaReading analyzeMana(const std::vector<uint8_t>& png);
    UnitRecognition recognizeUnit(const std::vector<uint8_t>& png);

    PerceptionStats stats() const;
    void resetStats();

    // Default acceptance score for templates without their own threshold
    void setConfidenceThreshold(float threshold);
    float confidenceThreshold() const { return confidence_threshold_.load(); }

    const config::GridConfig& gridConfig() const { return grid_; }
    const std::string& trainingDir() const { return vision_.training_dir; }
    const std::string& rankModelPath() const { return vision_.rank_model_path; }

private:
    struct Tables {
        std::shared_ptr<const ColorMatcher> colors;
        std::shared_ptr<const TemplateLibrary> templates;
        std::shared_ptr<const RankClassifier> ranks;
        std::shared_ptr<LogisticRankClassifier> trainable;  // same object as ranks when trained/loaded
    };
    Tables snapshot() const;
    config::VisionConfig visionConfig() const;
    void recordTiming(double ms);

    config::GridConfig grid_;
    config::ManaConfig mana_cfg_;
    config::VisionConfig vision_;
    std::atomic<float> confidence_threshold_;

    mutable std::mutex tables_mutex_;
    Tables tables_;

    mutable std::mutex stats_mutex_;
    PerceptionStats stats_;
    std::deque<double> timings_;
};

} // namespace rampart::vision
