#ifndef HOUGH_ML_CORE_PEAK_DETECTION_HPP
#define HOUGH_ML_CORE_PEAK_DETECTION_HPP

#include "hough_ml/core/config.hpp"
#include "hough_ml/core/peak.hpp"

#include <Eigen/Core>
#include <vector>

namespace hough_ml {
namespace core {

/**
 * @brief Local maximum found on the searched (possibly smoothed) grid
 */
struct PeakCandidate {
    int row;
    int col;
    float score;   // value on the searched grid
    float height;  // value on the original grid
    int order;     // row-major detection order

    PeakCandidate() : row(0), col(0), score(0.0f), height(0.0f), order(0) {}
    PeakCandidate(int r, int c, float s, float h, int o)
        : row(r), col(c), score(s), height(h), order(o) {}
};

/**
 * @brief Find local maxima in a Hough accumulator
 *
 * @param grid Accumulator, rows = phi bins, cols = q/pT bins
 * @param params Smoothing, thresholds and minimum peak separation
 * @return Peaks ordered by descending height; heights taken from the unsmoothed grid
 *
 * @throws InvalidInputError if the grid is empty or contains non-finite values
 * @throws ConfigurationError if params are out of range
 */
PeakList findPeaks(const AccumulatorGrid& grid, const PeakDetectionParams& params);

/**
 * @brief max(threshold_abs, threshold_rel * max(searched))
 */
float effectiveThreshold(const Eigen::MatrixXf& searched, const PeakDetectionParams& params);

/**
 * @brief Maximum over the clipped (2*radius+1)^2 window around every cell
 */
Eigen::MatrixXf slidingWindowMax(const Eigen::MatrixXf& grid, int radius);

/**
 * @brief Cells above threshold that are the strict maximum of their window
 *
 * Equal values inside a window are resolved in favour of the lowest row,
 * then lowest column. Windows are clipped at the grid edges.
 *
 * @param searched Grid the maxima are searched on
 * @param original Grid the reported heights are read from (same shape)
 * @param threshold Value a candidate must strictly exceed
 * @param radius Chebyshev half-width of the window
 * @return Candidates in row-major order
 */
std::vector<PeakCandidate> findLocalMaxima(
    const Eigen::MatrixXf& searched,
    const Eigen::MatrixXf& original,
    float threshold,
    int radius);

/**
 * @brief Drop candidates closer than min_distance to a higher ranked one
 *
 * Ranking is by height, ties by detection order.
 *
 * @return Surviving candidates ordered by rank
 */
std::vector<PeakCandidate> suppressNonMaxima(
    const std::vector<PeakCandidate>& candidates,
    double min_distance);

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_PEAK_DETECTION_HPP
