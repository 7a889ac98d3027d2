#include <gtest/gtest.h>

#include "hough_ml/core/errors.hpp"
#include "hough_ml/core/peak_detection.hpp"

#include <cmath>
#include <limits>
#include <random>

using namespace hough_ml::core;

namespace {

PeakDetectionParams makeParams(double threshold_abs, int min_distance,
                               double threshold_rel = 0.0, double smooth_sigma = 0.0) {
    PeakDetectionParams params;
    params.threshold_abs = threshold_abs;
    params.threshold_rel = threshold_rel;
    params.min_distance = min_distance;
    params.smooth_sigma = smooth_sigma;
    return params;
}

} // namespace

TEST(PeakDetectionTest, FindsIsolatedSpike) {
    AccumulatorGrid grid = AccumulatorGrid::Zero(10, 10);
    grid(5, 5) = 20.0f;

    PeakList peaks = findPeaks(grid, makeParams(5.0, 2));

    ASSERT_EQ(peaks.size(), 1u);
    EXPECT_EQ(peaks[0], Peak(5.0f, 5.0f, 20.0f));
}

TEST(PeakDetectionTest, ColumnIsXAndRowIsY) {
    AccumulatorGrid grid = AccumulatorGrid::Zero(8, 12);
    grid(2, 9) = 11.0f;

    PeakList peaks = findPeaks(grid, makeParams(5.0, 2));

    ASSERT_EQ(peaks.size(), 1u);
    EXPECT_FLOAT_EQ(peaks[0].x, 9.0f);
    EXPECT_FLOAT_EQ(peaks[0].y, 2.0f);
    EXPECT_FLOAT_EQ(peaks[0].height, 11.0f);
}

TEST(PeakDetectionTest, EmptyWhenNothingExceedsThreshold) {
    AccumulatorGrid grid = AccumulatorGrid::Zero(6, 6);
    EXPECT_TRUE(findPeaks(grid, makeParams(5.0, 2)).empty());

    // Strictly above threshold is required
    grid(3, 3) = 5.0f;
    EXPECT_TRUE(findPeaks(grid, makeParams(5.0, 2)).empty());
}

TEST(PeakDetectionTest, RelativeThresholdUsesGridMaximum) {
    AccumulatorGrid grid = AccumulatorGrid::Zero(20, 20);
    grid(3, 3) = 10.0f;
    grid(15, 15) = 4.0f;

    PeakList peaks = findPeaks(grid, makeParams(0.0, 2, 0.5));

    ASSERT_EQ(peaks.size(), 1u);
    EXPECT_FLOAT_EQ(peaks[0].height, 10.0f);
}

TEST(PeakDetectionTest, PlateauResolvedToLowestRowThenColumn) {
    AccumulatorGrid grid = AccumulatorGrid::Zero(10, 10);
    grid(3, 4) = 7.0f;
    grid(3, 3) = 7.0f;
    grid(4, 2) = 7.0f;

    PeakList peaks = findPeaks(grid, makeParams(1.0, 2));

    ASSERT_EQ(peaks.size(), 1u);
    EXPECT_FLOAT_EQ(peaks[0].x, 3.0f);
    EXPECT_FLOAT_EQ(peaks[0].y, 3.0f);
}

TEST(PeakDetectionTest, BoundaryCellsAreEligible) {
    AccumulatorGrid grid = AccumulatorGrid::Zero(10, 10);
    grid(0, 0) = 9.0f;
    grid(9, 9) = 8.0f;

    PeakList peaks = findPeaks(grid, makeParams(1.0, 2));

    ASSERT_EQ(peaks.size(), 2u);
    EXPECT_EQ(peaks[0], Peak(0.0f, 0.0f, 9.0f));
    EXPECT_EQ(peaks[1], Peak(9.0f, 9.0f, 8.0f));
}

TEST(PeakDetectionTest, OrderedByDescendingHeight) {
    AccumulatorGrid grid = AccumulatorGrid::Zero(15, 15);
    grid(2, 2) = 9.0f;
    grid(10, 10) = 15.0f;
    grid(2, 10) = 12.0f;

    PeakList peaks = findPeaks(grid, makeParams(1.0, 2));

    ASSERT_EQ(peaks.size(), 3u);
    EXPECT_FLOAT_EQ(peaks[0].height, 15.0f);
    EXPECT_FLOAT_EQ(peaks[1].height, 12.0f);
    EXPECT_FLOAT_EQ(peaks[2].height, 9.0f);
}

TEST(PeakDetectionTest, EqualHeightsKeepRowMajorOrder) {
    AccumulatorGrid grid = AccumulatorGrid::Zero(12, 12);
    grid(8, 1) = 6.0f;
    grid(1, 8) = 6.0f;

    PeakList peaks = findPeaks(grid, makeParams(1.0, 2));

    ASSERT_EQ(peaks.size(), 2u);
    EXPECT_FLOAT_EQ(peaks[0].y, 1.0f);
    EXPECT_FLOAT_EQ(peaks[1].y, 8.0f);
}

TEST(PeakDetectionTest, PeaksRespectMinimumSeparationAndThreshold) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> dist(0.0f, 10.0f);

    AccumulatorGrid grid(40, 40);
    for (int r = 0; r < grid.rows(); ++r) {
        for (int c = 0; c < grid.cols(); ++c) {
            grid(r, c) = dist(rng);
        }
    }

    const int min_distance = 3;
    PeakList peaks = findPeaks(grid, makeParams(5.0, min_distance));

    ASSERT_FALSE(peaks.empty());
    for (size_t i = 0; i < peaks.size(); ++i) {
        EXPECT_GT(peaks[i].height, 5.0f);
        for (size_t j = i + 1; j < peaks.size(); ++j) {
            EXPECT_GE(peaks[i].distanceTo(peaks[j]), static_cast<float>(min_distance));
        }
        if (i > 0) {
            EXPECT_GE(peaks[i - 1].height, peaks[i].height);
        }
    }
}

TEST(PeakDetectionTest, SmoothingLocalizesButReportsOriginalHeight) {
    AccumulatorGrid grid = AccumulatorGrid::Zero(20, 20);
    grid(10, 10) = 20.0f;

    PeakList peaks = findPeaks(grid, makeParams(1.0, 2, 0.0, 1.0));

    ASSERT_EQ(peaks.size(), 1u);
    EXPECT_EQ(peaks[0], Peak(10.0f, 10.0f, 20.0f));
}

TEST(PeakDetectionTest, SmoothingMergesNeighbouringSpikes) {
    AccumulatorGrid grid = AccumulatorGrid::Zero(30, 30);
    grid(15, 14) = 10.0f;
    grid(15, 16) = 10.0f;

    // Without smoothing both spikes are found
    EXPECT_EQ(findPeaks(grid, makeParams(1.0, 1)).size(), 2u);

    // The blurred ridge has a single maximum between them
    PeakList smoothed = findPeaks(grid, makeParams(0.1, 1, 0.0, 2.0));
    ASSERT_EQ(smoothed.size(), 1u);
    EXPECT_FLOAT_EQ(smoothed[0].x, 15.0f);
    EXPECT_FLOAT_EQ(smoothed[0].y, 15.0f);
    EXPECT_FLOAT_EQ(smoothed[0].height, 0.0f);
}

TEST(PeakDetectionTest, RejectsMalformedGrid) {
    EXPECT_THROW(findPeaks(AccumulatorGrid(0, 0), makeParams(5.0, 2)), InvalidInputError);
    EXPECT_THROW(findPeaks(AccumulatorGrid(0, 5), makeParams(5.0, 2)), InvalidInputError);

    AccumulatorGrid grid = AccumulatorGrid::Zero(5, 5);
    grid(2, 2) = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(findPeaks(grid, makeParams(5.0, 2)), InvalidInputError);

    grid(2, 2) = std::numeric_limits<float>::infinity();
    EXPECT_THROW(findPeaks(grid, makeParams(5.0, 2)), InvalidInputError);
}

TEST(PeakDetectionTest, RejectsInvalidParameters) {
    AccumulatorGrid grid = AccumulatorGrid::Zero(5, 5);

    EXPECT_THROW(findPeaks(grid, makeParams(5.0, 0)), ConfigurationError);
    EXPECT_THROW(findPeaks(grid, makeParams(-1.0, 2)), ConfigurationError);
    EXPECT_THROW(findPeaks(grid, makeParams(5.0, 2, 1.5)), ConfigurationError);
    EXPECT_THROW(findPeaks(grid, makeParams(5.0, 2, 0.0, -0.5)), ConfigurationError);
}

TEST(PeakDetectionTest, ErrorsDeriveFromInvalidArgument) {
    EXPECT_THROW(findPeaks(AccumulatorGrid(0, 0), makeParams(5.0, 2)), std::invalid_argument);
    EXPECT_THROW(findPeaks(AccumulatorGrid::Zero(3, 3), makeParams(5.0, 0)),
                 std::invalid_argument);
}

TEST(SlidingWindowMaxTest, ClipsAtEdges) {
    Eigen::MatrixXf grid(3, 4);
    grid << 1, 2, 3, 4,
            5, 6, 7, 8,
            9, 1, 1, 1;

    Eigen::MatrixXf result = slidingWindowMax(grid, 1);

    EXPECT_FLOAT_EQ(result(0, 0), 6.0f);
    EXPECT_FLOAT_EQ(result(0, 3), 8.0f);
    EXPECT_FLOAT_EQ(result(2, 0), 9.0f);
    EXPECT_FLOAT_EQ(result(2, 3), 8.0f);
    EXPECT_FLOAT_EQ(result(1, 1), 9.0f);
}

TEST(SuppressNonMaximaTest, HigherCandidateWins) {
    std::vector<PeakCandidate> candidates = {
        PeakCandidate(0, 0, 5.0f, 5.0f, 0),
        PeakCandidate(0, 1, 9.0f, 9.0f, 1),
        PeakCandidate(0, 6, 3.0f, 3.0f, 2),
    };

    std::vector<PeakCandidate> kept = suppressNonMaxima(candidates, 2.0);

    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].col, 1);
    EXPECT_EQ(kept[1].col, 6);
}

TEST(EffectiveThresholdTest, TakesLargerOfAbsoluteAndRelative) {
    Eigen::MatrixXf grid = Eigen::MatrixXf::Zero(3, 3);
    grid(1, 1) = 40.0f;

    EXPECT_FLOAT_EQ(effectiveThreshold(grid, makeParams(5.0, 1, 0.5)), 20.0f);
    EXPECT_FLOAT_EQ(effectiveThreshold(grid, makeParams(25.0, 1, 0.5)), 25.0f);
}
