#include "vision/rank_classifier.hpp"
#include "rampart_log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

static constexpr const char* TAG = "rank";

namespace rampart::vision {

namespace {

std::vector<double> softmax(const std::vector<std::vector<double>>& w, const std::vector<double>& x) {
    std::vector<double> z(w.size(), 0.0);
    for (size_t k = 0; k < w.size(); ++k) {
        double s = w[k].back();  // bias
        for (size_t f = 0; f < x.size(); ++f) s += w[k][f] * x[f];
        z[k] = s;
    }
    double zmax = *std::max_element(z.begin(), z.end());
    double sum = 0.0;
    for (auto& v : z) {
        v = std::exp(v - zmax);
        sum += v;
    }
    for (auto& v : z) v /= sum;
    return z;
}

// "<rank>_anything.png" -> rank
std::optional<int> rankFromFilename(const fs::path& p) {
    if (p.extension() != ".png") return std::nullopt;
    std::string stem = p.stem().string();
    size_t us = stem.find('_');
    if (us == std::string::npos || us == 0) return std::nullopt;
    std::string head = stem.substr(0, us);
    char* end = nullptr;
    long v = std::strtol(head.c_str(), &end, 10);
    if (*end != '\0' || v < 0) return std::nullopt;
    return static_cast<int>(v);
}

} // anonymous namespace

// =============================================================================
// Prediction
// =============================================================================

std::vector<double> LogisticRankClassifier::extractFeatures(const Gray8& cell, int width, int height) {
    Gray8 scaled = resize(cell, width, height);
    Gray8 edges = canny(scaled, CANNY_LOW, CANNY_HIGH);
    std::vector<double> x(static_cast<size_t>(width) * height, 0.0);
    for (size_t i = 0; i < x.size() && i < edges.pix.size(); ++i) {
        x[i] = edges.pix[i] / 255.0;
    }
    return x;
}

bool LogisticRankClassifier::isLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_ != nullptr;
}

std::shared_ptr<const LogisticRankClassifier::Model> LogisticRankClassifier::model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
}

void LogisticRankClassifier::setModel(Model m) {
    auto snapshot = std::make_shared<const Model>(std::move(m));
    std::lock_guard<std::mutex> lock(mutex_);
    model_ = std::move(snapshot);
}

RankPrediction LogisticRankClassifier::predict(const Gray8& cell) const {
    auto m = model();
    if (!m || cell.empty() || m->classes.empty()) return {};

    auto x = extractFeatures(cell, m->width, m->height);
    auto p = softmax(m->weights, x);
    size_t best = static_cast<size_t>(std::max_element(p.begin(), p.end()) - p.begin());

    RankPrediction out;
    out.rank = m->classes[best];
    out.confidence = static_cast<float>(std::round(p[best] * 1000.0) / 1000.0);
    return out;
}

// =============================================================================
// Persistence
// =============================================================================

Result<void> LogisticRankClassifier::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return Error("rank model not found: " + path, ErrorCode::ClassifierUnavailable);
    }

    Model m;
    try {
        auto j = nlohmann::json::parse(in);
        m.width = j.at("width").get<int>();
        m.height = j.at("height").get<int>();
        m.classes = j.at("classes").get<std::vector<int>>();
        m.weights = j.at("weights").get<std::vector<std::vector<double>>>();
    } catch (const nlohmann::json::exception& e) {
        return Error(std::string("rank model malformed: ") + e.what(), ErrorCode::ClassifierUnavailable);
    }

    const size_t features = static_cast<size_t>(m.width) * m.height;
    if (m.width <= 0 || m.height <= 0 || m.classes.empty() || m.weights.size() != m.classes.size() ||
        std::any_of(m.weights.begin(), m.weights.end(),
                    [&](const std::vector<double>& row) { return row.size() != features + 1; })) {
        return Error("rank model has inconsistent dimensions", ErrorCode::ClassifierUnavailable);
    }

    RLOG_INFO(TAG, "Loaded rank model %s (%dx%d, %zu classes)", path.c_str(),
              m.width, m.height, m.classes.size());
    setModel(std::move(m));
    return Ok();
}

Result<void> LogisticRankClassifier::save(const std::string& path) const {
    auto m = model();
    if (!m) return Error("no rank model to save", ErrorCode::ClassifierUnavailable);

    nlohmann::json j = {
        {"version", 1},
        {"width", m->width},
        {"height", m->height},
        {"classes", m->classes},
        {"weights", m->weights},
    };

    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    std::ofstream out(path);
    if (!out.is_open()) return Error("cannot write " + path, ErrorCode::IoError);
    out << j.dump();
    if (!out) return Error("write failed: " + path, ErrorCode::IoError);
    RLOG_INFO(TAG, "Saved rank model to %s", path.c_str());
    return Ok();
}

// =============================================================================
// Training
// =============================================================================

Result<void> LogisticRankClassifier::train(const std::vector<std::pair<Gray8, int>>& samples,
                                           const RankTrainingOptions& opts) {
    if (opts.width <= 0 || opts.height <= 0 || opts.max_iter <= 0) {
        return Error("invalid training options", ErrorCode::InvalidArgument);
    }

    std::set<int> labels;
    for (const auto& s : samples) labels.insert(s.second);
    if (samples.size() < 2 || labels.size() < 2) {
        return Error("need samples of at least two ranks", ErrorCode::InvalidArgument);
    }

    Model m;
    m.width = opts.width;
    m.height = opts.height;
    m.classes.assign(labels.begin(), labels.end());
    const size_t K = m.classes.size();
    const size_t F = static_cast<size_t>(opts.width) * opts.height;
    m.weights.assign(K, std::vector<double>(F + 1, 0.0));

    std::vector<std::vector<double>> X;
    std::vector<size_t> Y;
    X.reserve(samples.size());
    Y.reserve(samples.size());
    for (const auto& [img, rank] : samples) {
        if (img.empty()) continue;
        X.push_back(extractFeatures(img, opts.width, opts.height));
        Y.push_back(static_cast<size_t>(
            std::lower_bound(m.classes.begin(), m.classes.end(), rank) - m.classes.begin()));
    }
    if (X.size() < 2) return Error("not enough usable samples", ErrorCode::InvalidArgument);

    const double n = static_cast<double>(X.size());
    std::vector<std::vector<double>> grad(K, std::vector<double>(F + 1, 0.0));
    int iter = 0;
    for (; iter < opts.max_iter; ++iter) {
        for (auto& row : grad) std::fill(row.begin(), row.end(), 0.0);

        for (size_t i = 0; i < X.size(); ++i) {
            auto p = softmax(m.weights, X[i]);
            for (size_t k = 0; k < K; ++k) {
                double err = p[k] - (Y[i] == k ? 1.0 : 0.0);
                if (err == 0.0) continue;
                for (size_t f = 0; f < F; ++f) {
                    if (X[i][f] != 0.0) grad[k][f] += err * X[i][f];
                }
                grad[k][F] += err;
            }
        }

        double max_step = 0.0;
        for (size_t k = 0; k < K; ++k) {
            for (size_t f = 0; f <= F; ++f) {
                double g = grad[k][f] / n;
                if (f < F) g += opts.l2 * m.weights[k][f];
                m.weights[k][f] -= opts.learning_rate * g;
                max_step = std::max(max_step, std::abs(g));
            }
        }
        if (max_step < 1e-5) break;
    }

    RLOG_INFO(TAG, "Trained rank model: %zu samples, %zu classes, %d iterations",
              X.size(), K, iter);
    setModel(std::move(m));
    return Ok();
}

Result<size_t> LogisticRankClassifier::trainFromDirectory(const std::string& dir,
                                                          const RankTrainingOptions& opts) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Err<size_t>("training directory not found: " + dir, ErrorCode::IoError);
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && rankFromFilename(entry.path())) files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    std::vector<std::pair<Gray8, int>> samples;
    for (const auto& f : files) {
        auto img = loadImageFile(f.string());
        if (!img) continue;
        samples.emplace_back(toGray(img.value()), *rankFromFilename(f));
    }

    auto trained = train(samples, opts);
    if (trained.is_err()) return trained.error();
    return samples.size();
}

// =============================================================================
// Sample directory
// =============================================================================

Result<std::string> saveTrainingSample(const std::string& dir, const RgbImage& img, int rank) {
    if (rank < 0) return Err<std::string>("rank must be non-negative", ErrorCode::InvalidArgument);
    if (img.empty()) return Err<std::string>("empty sample image", ErrorCode::InvalidArgument);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return Err<std::string>("cannot create " + dir + ": " + ec.message(), ErrorCode::IoError);

    static std::atomic<unsigned> seq{0};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string name = std::to_string(rank) + "_" + std::to_string(ms) + "_" +
                       std::to_string(seq.fetch_add(1)) + ".png";
    std::string path = (fs::path(dir) / name).string();

    auto written = writePng(path, img);
    if (written.is_err()) return written.error();
    return path;
}

std::map<int, int> trainingSampleCounts(const std::string& dir) {
    std::map<int, int> counts;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return counts;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        if (auto r = rankFromFilename(entry.path())) counts[*r]++;
    }
    return counts;
}

} // namespace rampart::vision
