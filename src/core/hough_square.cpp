#include "hough_ml/core/hough_square.hpp"
#include "hough_ml/core/errors.hpp"

#include <string>
#include <utility>

namespace hough_ml {
namespace core {

HoughSquare::HoughSquare(Eigen::MatrixXf data, bool is_true_positive,
                         float center_x, float center_y,
                         int event_id, int slice_index)
    : data_(std::move(data)), is_true_positive_(is_true_positive),
      center_x_(center_x), center_y_(center_y),
      event_id_(event_id), slice_index_(slice_index) {

    if (data_.rows() == 0 || data_.rows() != data_.cols()) {
        throw InvalidInputError("square data must be a non-empty square matrix, got " +
                                std::to_string(data_.rows()) + "x" +
                                std::to_string(data_.cols()));
    }
}

Eigen::VectorXf HoughSquare::toFlat() const {
    Eigen::VectorXf flat(data_.size());
    const int side = size();
    for (int r = 0; r < side; ++r) {
        for (int c = 0; c < side; ++c) {
            flat(r * side + c) = data_(r, c);
        }
    }
    return flat;
}

bool HoughSquareCollection::add(const HoughSquare& square) {
    if (side_ != 0 && square.size() != side_) {
        throw InvalidInputError("square side " + std::to_string(square.size()) +
                                " does not match collection side " +
                                std::to_string(side_));
    }

    SquareKey key(square.eventId(), square.sliceIndex(),
                  square.centerX(), square.centerY());
    if (!keys_.insert(key).second) {
        return false;
    }

    side_ = square.size();
    if (square.isTruePositive()) {
        true_positives_.push_back(square);
    } else {
        false_positives_.push_back(square);
    }
    return true;
}

std::size_t HoughSquareCollection::append(const HoughSquareCollection& other) {
    std::size_t added = 0;
    for (const auto& square : other.true_positives_) {
        if (add(square)) ++added;
    }
    for (const auto& square : other.false_positives_) {
        if (add(square)) ++added;
    }
    return added;
}

TrainingData HoughSquareCollection::trainingData() const {
    TrainingData result;
    if (empty()) {
        result.features = Eigen::MatrixXf(0, 0);
        result.labels = Eigen::VectorXf(0);
        return result;
    }

    const Eigen::Index n_rows = static_cast<Eigen::Index>(size());
    result.features.resize(n_rows, side_ * side_);
    result.labels.resize(n_rows);

    Eigen::Index row = 0;
    for (const auto& square : true_positives_) {
        result.features.row(row) = square.toFlat().transpose();
        result.labels(row) = 1.0f;
        ++row;
    }
    for (const auto& square : false_positives_) {
        result.features.row(row) = square.toFlat().transpose();
        result.labels(row) = 0.0f;
        ++row;
    }

    return result;
}

SquareSummary HoughSquareCollection::summary() const {
    SquareSummary s;
    s.true_positives = truePositiveCount();
    s.false_positives = falsePositiveCount();
    s.total = size();
    s.true_positive_ratio = s.total > 0
        ? static_cast<double>(s.true_positives) / static_cast<double>(s.total)
        : 0.0;
    return s;
}

} // namespace core
} // namespace hough_ml
