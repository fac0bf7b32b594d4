#pragma once
// =============================================================================
// RankClassifier - unit rank from an edge-feature vector
// =============================================================================
// Feature pipeline: gray cell -> resize to model size -> Canny(50,100) ->
// flattened 0/1 vector. The trained model is multinomial logistic
// regression, stored as JSON. A loaded model is immutable and shared; a
// retrain swaps in a new snapshot.
// =============================================================================

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "result.hpp"
#include "vision/image.hpp"

namespace rampart::vision {

struct RankPrediction {
    int rank = 0;               // 0 = no rank detected
    float confidence = 0.0f;
};

class RankClassifier {
public:
    virtual ~RankClassifier() = default;
    virtual bool isLoaded() const = 0;
    virtual RankPrediction predict(const Gray8& cell) const = 0;
};

// Selected when no model is available; every prediction is (0, 0.0)
class NullRankClassifier : public RankClassifier {
public:
    bool isLoaded() const override { return false; }
    RankPrediction predict(const Gray8&) const override { return {}; }
};

struct RankTrainingOptions {
    int width = 32;
    int height = 32;
    int max_iter = 1000;
    double learning_rate = 0.5;
    double l2 = 1e-3;
};

class LogisticRankClassifier : public RankClassifier {
public:
    static constexpr double CANNY_LOW = 50.0;
    static constexpr double CANNY_HIGH = 100.0;

    struct Model {
        int width = 0;
        int height = 0;
        std::vector<int> classes;                 // rank label per row
        std::vector<std::vector<double>> weights; // [class][feature], bias last
    };

    bool isLoaded() const override;
    RankPrediction predict(const Gray8& cell) const override;

    Result<void> load(const std::string& path);
    Result<void> save(const std::string& path) const;

    // samples: (image, rank); needs at least two distinct ranks
    Result<void> train(const std::vector<std::pair<Gray8, int>>& samples,
                       const RankTrainingOptions& opts = {});

    // "<rank>_*.png" files in `dir`
    Result<size_t> trainFromDirectory(const std::string& dir, const RankTrainingOptions& opts = {});

    void setModel(Model m);
    std::shared_ptr<const Model> model() const;

    static std::vector<double> extractFeatures(const Gray8& cell, int width, int height);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Model> model_;
};

// --- training sample directory helpers ---

// Writes "<rank>_<unix_ms>_<seq>.png"; returns the file path
Result<std::string> saveTrainingSample(const std::string& dir, const RgbImage& img, int rank);

// rank -> sample count for "<rank>_*.png" files
std::map<int, int> trainingSampleCounts(const std::string& dir);

} // namespace rampart::vision
