// =============================================================================
// Unit tests for LogisticRankClassifier (src/vision/rank_classifier.hpp)
// =============================================================================
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "vision/rank_classifier.hpp"

using namespace rampart;
using namespace rampart::vision;
namespace fs = std::filesystem;

namespace {

// Bright bar on black; vertical bars are rank 1, horizontal rank 2
Gray8 bar(bool vertical, int offset) {
    Gray8 g(32, 32);
    for (int y = 0; y < 32; ++y) {
        for (int x = 0; x < 32; ++x) {
            int along = vertical ? x : y;
            if (along >= 10 + offset && along < 18 + offset) {
                g.pix[static_cast<size_t>(y) * 32 + x] = 230;
            }
        }
    }
    return g;
}

std::vector<std::pair<Gray8, int>> barSamples() {
    std::vector<std::pair<Gray8, int>> samples;
    for (int off = -3; off <= 3; ++off) {
        samples.emplace_back(bar(true, off), 1);
        samples.emplace_back(bar(false, off), 2);
    }
    return samples;
}

RankTrainingOptions fastOptions() {
    RankTrainingOptions opts;
    opts.width = 16;
    opts.height = 16;
    opts.max_iter = 300;
    return opts;
}

class RankClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = (fs::temp_directory_path() / "rampart_rank_test").string();
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    std::string dir_;
};

} // namespace

TEST(RankFeatureTest, EdgeVectorIsBinary) {
    auto x = LogisticRankClassifier::extractFeatures(bar(true, 0), 16, 16);
    ASSERT_EQ(x.size(), 256u);
    size_t edges = 0;
    for (double v : x) {
        EXPECT_TRUE(v == 0.0 || v == 1.0);
        if (v == 1.0) edges++;
    }
    EXPECT_GT(edges, 0u);
}

TEST(RankClassifierBasicTest, UntrainedPredictsNothing) {
    LogisticRankClassifier clf;
    EXPECT_FALSE(clf.isLoaded());
    auto p = clf.predict(bar(true, 0));
    EXPECT_EQ(p.rank, 0);
    EXPECT_FLOAT_EQ(p.confidence, 0.0f);

    NullRankClassifier null_clf;
    EXPECT_FALSE(null_clf.isLoaded());
    EXPECT_EQ(null_clf.predict(bar(true, 0)).rank, 0);
}

TEST(RankClassifierBasicTest, TrainAndPredict) {
    LogisticRankClassifier clf;
    ASSERT_TRUE(clf.train(barSamples(), fastOptions()).is_ok());
    ASSERT_TRUE(clf.isLoaded());

    auto v = clf.predict(bar(true, 1));
    EXPECT_EQ(v.rank, 1);
    EXPECT_GT(v.confidence, 0.5f);
    EXPECT_LE(v.confidence, 1.0f);

    auto h = clf.predict(bar(false, -2));
    EXPECT_EQ(h.rank, 2);
    EXPECT_GT(h.confidence, 0.5f);
}

TEST(RankClassifierBasicTest, NeedsTwoRanks) {
    LogisticRankClassifier clf;
    std::vector<std::pair<Gray8, int>> one_rank = {{bar(true, 0), 1}, {bar(true, 1), 1}};
    auto r = clf.train(one_rank, fastOptions());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(clf.isLoaded());

    EXPECT_TRUE(clf.train({}, fastOptions()).is_err());

    RankTrainingOptions bad = fastOptions();
    bad.width = 0;
    EXPECT_TRUE(clf.train(barSamples(), bad).is_err());
}

TEST_F(RankClassifierTest, SaveAndLoadPreservePredictions) {
    LogisticRankClassifier clf;
    ASSERT_TRUE(clf.train(barSamples(), fastOptions()).is_ok());
    const std::string path = dir_ + "/models/rank_model.json";
    ASSERT_TRUE(clf.save(path).is_ok());

    LogisticRankClassifier loaded;
    ASSERT_TRUE(loaded.load(path).is_ok());
    auto a = clf.predict(bar(false, 2));
    auto b = loaded.predict(bar(false, 2));
    EXPECT_EQ(a.rank, b.rank);
    EXPECT_FLOAT_EQ(a.confidence, b.confidence);
    EXPECT_EQ(loaded.model()->classes, (std::vector<int>{1, 2}));
}

TEST_F(RankClassifierTest, LoadFailures) {
    LogisticRankClassifier clf;
    auto missing = clf.load(dir_ + "/absent.json");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().code, ErrorCode::ClassifierUnavailable);

    const std::string bad = dir_ + "/bad.json";
    std::ofstream(bad) << "{not json";
    EXPECT_EQ(clf.load(bad).error().code, ErrorCode::ClassifierUnavailable);

    const std::string wrong = dir_ + "/wrong.json";
    std::ofstream(wrong) << R"({"width":2,"height":2,"classes":[1,2],"weights":[[0,0,0,0,0],[0,0]]})";
    EXPECT_EQ(clf.load(wrong).error().code, ErrorCode::ClassifierUnavailable);
    EXPECT_FALSE(clf.isLoaded());

    EXPECT_EQ(clf.save(dir_ + "/none.json").error().code, ErrorCode::ClassifierUnavailable);
}

TEST_F(RankClassifierTest, SampleDirectoryRoundTrip) {
    for (int off = -2; off <= 2; ++off) {
        for (bool vertical : {true, false}) {
            Gray8 g = bar(vertical, off);
            RgbImage rgb(g.w, g.h);
            for (size_t i = 0; i < g.pix.size(); ++i) {
                rgb.pix[i * 3] = rgb.pix[i * 3 + 1] = rgb.pix[i * 3 + 2] = g.pix[i];
            }
            auto saved = saveTrainingSample(dir_, rgb, vertical ? 1 : 2);
            ASSERT_TRUE(saved.is_ok()) << saved.error().message;
            EXPECT_EQ(fs::path(saved.value()).extension().string(), ".png");
        }
    }
    std::ofstream(dir_ + "/notes.txt") << "ignored";
    std::ofstream(dir_ + "/x_bad.png") << "ignored";

    auto counts = trainingSampleCounts(dir_);
    EXPECT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts[1], 5);
    EXPECT_EQ(counts[2], 5);

    LogisticRankClassifier clf;
    auto trained = clf.trainFromDirectory(dir_, fastOptions());
    ASSERT_TRUE(trained.is_ok());
    EXPECT_EQ(trained.value(), 10u);
    EXPECT_EQ(clf.predict(bar(true, 0)).rank, 1);
}

TEST_F(RankClassifierTest, SampleValidation) {
    EXPECT_EQ(saveTrainingSample(dir_, RgbImage(4, 4), -1).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(saveTrainingSample(dir_, RgbImage{}, 1).error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(trainingSampleCounts(dir_ + "/missing").empty());

    LogisticRankClassifier clf;
    EXPECT_EQ(clf.trainFromDirectory(dir_ + "/missing").error().code, ErrorCode::IoError);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
