#include "hough_ml/core/utils.hpp"
#include "hough_ml/core/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <vector>
#include <omp.h>

namespace hough_ml {
namespace core {

namespace {

// Mirror index into [0, n) with the edge sample repeated: d c b a | a b c d | d c b a
int reflectIndex(int idx, int n) {
    if (n == 1) return 0;
    const int period = 2 * n;
    idx %= period;
    if (idx < 0) idx += period;
    return idx < n ? idx : period - 1 - idx;
}

std::vector<float> gaussianKernel(double sigma) {
    const int radius = static_cast<int>(4.0 * sigma + 0.5);
    std::vector<float> kernel(2 * radius + 1);

    double sum = 0.0;
    for (int k = -radius; k <= radius; ++k) {
        const double w = std::exp(-0.5 * (k * k) / (sigma * sigma));
        kernel[k + radius] = static_cast<float>(w);
        sum += w;
    }
    for (auto& w : kernel) {
        w = static_cast<float>(w / sum);
    }
    return kernel;
}

bool parseInt(const std::string& token, int& value) {
    if (token.empty()) return false;
    char* end = nullptr;
    const long parsed = std::strtol(token.c_str(), &end, 10);
    if (end == token.c_str() || *end != '\0') return false;
    value = static_cast<int>(parsed);
    return true;
}

} // anonymous namespace

Eigen::MatrixXf gaussianBlur2D(const Eigen::MatrixXf& grid, double sigma) {
    if (grid.size() == 0 || sigma <= 0.0) {
        return grid;
    }

    const std::vector<float> kernel = gaussianKernel(sigma);
    const int radius = static_cast<int>(kernel.size() / 2);
    const int rows = static_cast<int>(grid.rows());
    const int cols = static_cast<int>(grid.cols());

    // Pass along columns (within each row)
    Eigen::MatrixXf horizontal(rows, cols);
    #pragma omp parallel for schedule(static)
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            float acc = 0.0f;
            for (int k = -radius; k <= radius; ++k) {
                acc += kernel[k + radius] * grid(r, reflectIndex(c + k, cols));
            }
            horizontal(r, c) = acc;
        }
    }

    // Pass along rows
    Eigen::MatrixXf blurred(rows, cols);
    #pragma omp parallel for schedule(static)
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            float acc = 0.0f;
            for (int k = -radius; k <= radius; ++k) {
                acc += kernel[k + radius] * horizontal(reflectIndex(r + k, rows), c);
            }
            blurred(r, c) = acc;
        }
    }

    return blurred;
}

std::pair<int, int> parseHistogramName(const std::string& name) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : name) {
        if (ch == '_' || ch == ';') {
            parts.push_back(current);
            current.clear();
        } else {
            current += ch;
        }
    }
    parts.push_back(current);

    int event_id = 0;
    int slice_index = 0;
    if (parts.size() < 3 || !parseInt(parts[1], event_id) || !parseInt(parts[2], slice_index)) {
        throw InvalidInputError("cannot parse event and slice from histogram name '" +
                                name + "'");
    }
    return std::make_pair(event_id, slice_index);
}

} // namespace core
} // namespace hough_ml
