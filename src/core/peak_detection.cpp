#include "hough_ml/core/peak_detection.hpp"
#include "hough_ml/core/errors.hpp"
#include "hough_ml/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <omp.h>

namespace hough_ml {
namespace core {

namespace {

void validatePeakParams(const PeakDetectionParams& params) {
    if (!params.isValid()) {
        throw ConfigurationError(
            "invalid peak detection parameters: threshold_abs=" +
            std::to_string(params.threshold_abs) +
            " threshold_rel=" + std::to_string(params.threshold_rel) +
            " min_distance=" + std::to_string(params.min_distance) +
            " smooth_sigma=" + std::to_string(params.smooth_sigma));
    }
}

void validateGrid(const AccumulatorGrid& grid) {
    if (grid.rows() < 1 || grid.cols() < 1) {
        throw InvalidInputError("accumulator grid must have at least one row and one column");
    }
    if (!grid.allFinite()) {
        throw InvalidInputError("accumulator grid contains non-finite values");
    }
}

// True if an equal value precedes (row, col) in row-major order inside the window
bool hasPrecedingTie(const Eigen::MatrixXf& grid, int row, int col, int radius) {
    const float value = grid(row, col);
    const int r_lo = std::max(0, row - radius);
    const int c_lo = std::max(0, col - radius);
    const int c_hi = std::min(static_cast<int>(grid.cols()) - 1, col + radius);

    for (int r = r_lo; r <= row; ++r) {
        const int c_end = (r == row) ? col - 1 : c_hi;
        for (int c = c_lo; c <= c_end; ++c) {
            if (grid(r, c) == value) return true;
        }
    }
    return false;
}

} // anonymous namespace

float effectiveThreshold(const Eigen::MatrixXf& searched, const PeakDetectionParams& params) {
    const double rel = searched.size() > 0
        ? params.threshold_rel * static_cast<double>(searched.maxCoeff())
        : 0.0;
    return static_cast<float>(std::max(params.threshold_abs, rel));
}

Eigen::MatrixXf slidingWindowMax(const Eigen::MatrixXf& grid, int radius) {
    const int rows = static_cast<int>(grid.rows());
    const int cols = static_cast<int>(grid.cols());

    Eigen::MatrixXf row_max(rows, cols);
    #pragma omp parallel for schedule(static)
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const int lo = std::max(0, c - radius);
            const int hi = std::min(cols - 1, c + radius);
            row_max(r, c) = grid.row(r).segment(lo, hi - lo + 1).maxCoeff();
        }
    }

    Eigen::MatrixXf window_max(rows, cols);
    #pragma omp parallel for schedule(static)
    for (int c = 0; c < cols; ++c) {
        for (int r = 0; r < rows; ++r) {
            const int lo = std::max(0, r - radius);
            const int hi = std::min(rows - 1, r + radius);
            window_max(r, c) = row_max.col(c).segment(lo, hi - lo + 1).maxCoeff();
        }
    }

    return window_max;
}

std::vector<PeakCandidate> findLocalMaxima(
    const Eigen::MatrixXf& searched,
    const Eigen::MatrixXf& original,
    float threshold,
    int radius) {

    const int rows = static_cast<int>(searched.rows());
    const int cols = static_cast<int>(searched.cols());

    const Eigen::MatrixXf window_max = slidingWindowMax(searched, radius);

    // Per-row buffers keep the row-major order deterministic under OpenMP
    std::vector<std::vector<PeakCandidate>> per_row(rows);

    #pragma omp parallel for schedule(dynamic)
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const float value = searched(r, c);
            if (!(value > threshold) || value != window_max(r, c)) {
                continue;
            }
            if (hasPrecedingTie(searched, r, c, radius)) {
                continue;
            }
            per_row[r].emplace_back(r, c, value, original(r, c), 0);
        }
    }

    std::vector<PeakCandidate> candidates;
    for (auto& row_candidates : per_row) {
        for (auto& cand : row_candidates) {
            cand.order = static_cast<int>(candidates.size());
            candidates.push_back(cand);
        }
    }

    return candidates;
}

std::vector<PeakCandidate> suppressNonMaxima(
    const std::vector<PeakCandidate>& candidates,
    double min_distance) {

    if (candidates.empty()) return {};

    std::vector<PeakCandidate> ranked = candidates;
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const PeakCandidate& a, const PeakCandidate& b) {
            if (a.height != b.height) return a.height > b.height;
            return a.order < b.order;
        });

    std::vector<PeakCandidate> selected;
    selected.reserve(ranked.size());

    for (const auto& cand : ranked) {
        bool is_far_enough = true;
        for (const auto& sel : selected) {
            const double dr = static_cast<double>(cand.row - sel.row);
            const double dc = static_cast<double>(cand.col - sel.col);
            if (std::sqrt(dr * dr + dc * dc) < min_distance) {
                is_far_enough = false;
                break;
            }
        }

        if (is_far_enough) {
            selected.push_back(cand);
        }
    }

    return selected;
}

PeakList findPeaks(const AccumulatorGrid& grid, const PeakDetectionParams& params) {
    validatePeakParams(params);
    validateGrid(grid);

    Eigen::MatrixXf searched = params.smooth_sigma > 0.0
        ? gaussianBlur2D(grid, params.smooth_sigma)
        : grid;

    const float threshold = effectiveThreshold(searched, params);

    std::vector<PeakCandidate> candidates = findLocalMaxima(
        searched, grid, threshold, params.min_distance);

    std::vector<PeakCandidate> selected = suppressNonMaxima(
        candidates, static_cast<double>(params.min_distance));

    PeakList peaks;
    peaks.reserve(selected.size());
    for (const auto& cand : selected) {
        peaks.emplace_back(static_cast<float>(cand.col),
                           static_cast<float>(cand.row),
                           cand.height);
    }

    return peaks;
}

} // namespace core
} // namespace hough_ml
