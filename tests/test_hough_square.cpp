#include <gtest/gtest.h>

#include "hough_ml/core/errors.hpp"
#include "hough_ml/core/hough_square.hpp"

using namespace hough_ml::core;

namespace {

HoughSquare square(float fill, bool is_tp, float cx, float cy,
                   int event_id = 0, int slice = 0, int side = 3) {
    return HoughSquare(Eigen::MatrixXf::Constant(side, side, fill), is_tp, cx, cy,
                       event_id, slice);
}

} // namespace

TEST(HoughSquareTest, RejectsNonSquareData) {
    EXPECT_THROW(HoughSquare(Eigen::MatrixXf::Zero(3, 4), true, 0.0f, 0.0f), InvalidInputError);
    EXPECT_THROW(HoughSquare(Eigen::MatrixXf(0, 0), true, 0.0f, 0.0f), InvalidInputError);
}

TEST(HoughSquareTest, FlattensRowMajor) {
    Eigen::MatrixXf data(2, 2);
    data << 1.0f, 2.0f,
            3.0f, 4.0f;
    HoughSquare sq(data, false, 1.0f, 2.0f);

    Eigen::VectorXf flat = sq.toFlat();
    ASSERT_EQ(flat.size(), 4);
    EXPECT_FLOAT_EQ(flat(1), 2.0f);
    EXPECT_FLOAT_EQ(flat(2), 3.0f);
    EXPECT_EQ(sq.size(), 2);
    EXPECT_FALSE(sq.isTruePositive());
}

TEST(HoughSquareCollectionTest, SplitsByLabel) {
    HoughSquareCollection collection;
    EXPECT_TRUE(collection.add(square(1.0f, true, 1.0f, 1.0f)));
    EXPECT_TRUE(collection.add(square(0.0f, false, 2.0f, 2.0f)));
    EXPECT_TRUE(collection.add(square(0.0f, false, 3.0f, 3.0f)));

    EXPECT_EQ(collection.truePositiveCount(), 1u);
    EXPECT_EQ(collection.falsePositiveCount(), 2u);

    SquareSummary s = collection.summary();
    EXPECT_EQ(s.total, 3u);
    EXPECT_NEAR(s.true_positive_ratio, 1.0 / 3.0, 1e-12);
}

TEST(HoughSquareCollectionTest, DuplicateKeysAreIgnored) {
    HoughSquareCollection collection;
    EXPECT_TRUE(collection.add(square(1.0f, true, 5.0f, 6.0f, 1, 2)));
    EXPECT_FALSE(collection.add(square(9.0f, false, 5.0f, 6.0f, 1, 2)));
    EXPECT_TRUE(collection.add(square(1.0f, true, 5.0f, 6.0f, 1, 3)));
    EXPECT_EQ(collection.size(), 2u);
}

TEST(HoughSquareCollectionTest, RejectsMixedSides) {
    HoughSquareCollection collection;
    collection.add(square(1.0f, true, 1.0f, 1.0f, 0, 0, 3));
    EXPECT_THROW(collection.add(square(1.0f, true, 2.0f, 2.0f, 0, 0, 5)), InvalidInputError);
}

TEST(HoughSquareCollectionTest, AppendCountsNewSquares) {
    HoughSquareCollection first;
    first.add(square(1.0f, true, 1.0f, 1.0f));

    HoughSquareCollection second;
    second.add(square(1.0f, true, 1.0f, 1.0f));
    second.add(square(0.0f, false, 4.0f, 4.0f));

    EXPECT_EQ(first.append(second), 1u);
    EXPECT_EQ(first.size(), 2u);
}

TEST(HoughSquareCollectionTest, TrainingDataPutsTruePositivesFirst) {
    HoughSquareCollection collection;
    collection.add(square(0.0f, false, 2.0f, 2.0f));
    collection.add(square(7.0f, true, 1.0f, 1.0f));

    TrainingData data = collection.trainingData();
    ASSERT_EQ(data.features.rows(), 2);
    ASSERT_EQ(data.features.cols(), 9);
    EXPECT_FLOAT_EQ(data.labels(0), 1.0f);
    EXPECT_FLOAT_EQ(data.labels(1), 0.0f);
    EXPECT_FLOAT_EQ(data.features(0, 4), 7.0f);
    EXPECT_FLOAT_EQ(data.features(1, 4), 0.0f);
}

TEST(HoughSquareCollectionTest, EmptyTrainingData) {
    HoughSquareCollection collection;
    TrainingData data = collection.trainingData();
    EXPECT_EQ(data.features.rows(), 0);
    EXPECT_EQ(data.labels.size(), 0);
    EXPECT_DOUBLE_EQ(collection.summary().true_positive_ratio, 0.0);
}
