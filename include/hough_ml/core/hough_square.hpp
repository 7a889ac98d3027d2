#ifndef HOUGH_ML_CORE_HOUGH_SQUARE_HPP
#define HOUGH_ML_CORE_HOUGH_SQUARE_HPP

#include <Eigen/Core>
#include <cstddef>
#include <set>
#include <tuple>
#include <vector>

namespace hough_ml {
namespace core {

/**
 * @brief Labeled accumulator snapshot around one peak, used as a training sample
 */
class HoughSquare {
public:
    /**
     * @throws InvalidInputError if data is not square
     */
    HoughSquare(Eigen::MatrixXf data, bool is_true_positive,
                float center_x, float center_y,
                int event_id = 0, int slice_index = -1);

    const Eigen::MatrixXf& data() const { return data_; }
    int size() const { return static_cast<int>(data_.rows()); }
    bool isTruePositive() const { return is_true_positive_; }
    float centerX() const { return center_x_; }
    float centerY() const { return center_y_; }
    int eventId() const { return event_id_; }
    int sliceIndex() const { return slice_index_; }

    /**
     * @brief Row-major flattening of the square
     */
    Eigen::VectorXf toFlat() const;

private:
    Eigen::MatrixXf data_;
    bool is_true_positive_;
    float center_x_;
    float center_y_;
    int event_id_;
    int slice_index_;
};

/**
 * @brief Stacked training arrays, one flattened square per row
 */
struct TrainingData {
    Eigen::MatrixXf features;
    Eigen::VectorXf labels;
};

struct SquareSummary {
    std::size_t true_positives;
    std::size_t false_positives;
    std::size_t total;
    double true_positive_ratio;
};

/**
 * @brief Append-only store of squares for a whole run
 */
class HoughSquareCollection {
public:
    HoughSquareCollection() = default;

    /**
     * @brief Append a square
     * @return false if a square with the same (event, slice, center) is already stored
     * @throws InvalidInputError if the square side differs from the stored squares
     */
    bool add(const HoughSquare& square);

    /**
     * @brief Append all squares of another collection
     * @return Number of squares actually added
     */
    std::size_t append(const HoughSquareCollection& other);

    const std::vector<HoughSquare>& truePositives() const { return true_positives_; }
    const std::vector<HoughSquare>& falsePositives() const { return false_positives_; }

    std::size_t truePositiveCount() const { return true_positives_.size(); }
    std::size_t falsePositiveCount() const { return false_positives_.size(); }
    std::size_t size() const { return true_positives_.size() + false_positives_.size(); }
    bool empty() const { return size() == 0; }

    /**
     * @brief Features (N x side*side) and labels (N), true positives first
     */
    TrainingData trainingData() const;

    SquareSummary summary() const;

private:
    using SquareKey = std::tuple<int, int, float, float>;

    std::vector<HoughSquare> true_positives_;
    std::vector<HoughSquare> false_positives_;
    std::set<SquareKey> keys_;
    int side_ = 0;
};

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_HOUGH_SQUARE_HPP
