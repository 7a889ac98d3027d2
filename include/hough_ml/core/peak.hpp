#ifndef HOUGH_ML_CORE_PEAK_HPP
#define HOUGH_ML_CORE_PEAK_HPP

#include <Eigen/Core>
#include <cmath>
#include <vector>

namespace hough_ml {
namespace core {

/**
 * @brief Dense Hough accumulator, rows = phi bins, columns = q/pT bins
 */
using AccumulatorGrid = Eigen::MatrixXf;

/**
 * @brief Local maximum of the accumulator in grid coordinates
 *
 * x is the column (q/pT bin), y is the row (phi bin).
 */
struct Peak {
    float x;
    float y;
    float height;

    Peak() : x(0.0f), y(0.0f), height(0.0f) {}
    Peak(float x_val, float y_val, float height_val)
        : x(x_val), y(y_val), height(height_val) {}

    float distanceTo(const Peak& other) const {
        const float dx = x - other.x;
        const float dy = y - other.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    bool isWithinTolerance(const Peak& other, float tolerance) const {
        return distanceTo(other) <= tolerance;
    }

    bool operator==(const Peak& other) const {
        return x == other.x && y == other.y && height == other.height;
    }
};

using PeakList = std::vector<Peak>;

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_PEAK_HPP
