#include "hough_ml/core/matching.hpp"
#include "hough_ml/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <tuple>

#include <pcl/kdtree/kdtree_flann.h>
#include <pcl/point_types.h>
#include <pcl/point_cloud.h>

namespace hough_ml {
namespace core {

// KDTree implementation using PCL
class KDTree::Impl {
public:
    pcl::PointCloud<pcl::PointXY>::Ptr cloud;
    pcl::KdTreeFLANN<pcl::PointXY> tree;

    explicit Impl(const Eigen::MatrixXf& pts) {
        cloud = pcl::PointCloud<pcl::PointXY>::Ptr(new pcl::PointCloud<pcl::PointXY>);
        cloud->resize(pts.rows());

        for (int i = 0; i < pts.rows(); ++i) {
            cloud->points[i].x = pts(i, 0);
            cloud->points[i].y = pts(i, 1);
        }

        if (!cloud->empty()) {
            tree.setInputCloud(cloud);
        }
    }
};

KDTree::KDTree(const Eigen::MatrixXf& points)
    : pImpl(std::make_unique<Impl>(points)),
      size_(static_cast<std::size_t>(points.rows())) {
    if (points.rows() > 0 && points.cols() != 2) {
        throw InvalidInputError("KDTree expects an N x 2 point matrix");
    }
}

KDTree::~KDTree() = default;

std::vector<std::pair<int, float>> KDTree::queryRadius(
    const Eigen::Vector2f& point, float radius) const {

    std::vector<std::pair<int, float>> results;
    if (size_ == 0) return results;

    pcl::PointXY searchPoint;
    searchPoint.x = point(0);
    searchPoint.y = point(1);

    std::vector<int> indices;
    std::vector<float> distances;

    pImpl->tree.radiusSearch(searchPoint, radius, indices, distances);

    for (size_t i = 0; i < indices.size(); ++i) {
        results.emplace_back(indices[i], std::sqrt(distances[i]));
    }

    return results;
}

namespace {

void checkTolerance(double tolerance) {
    if (!std::isfinite(tolerance) || tolerance < 0.0) {
        throw ConfigurationError("matching tolerance must be finite and >= 0, got " +
                                 std::to_string(tolerance));
    }
}

Eigen::MatrixXf peakPositions(const PeakList& peaks) {
    Eigen::MatrixXf points(peaks.size(), 2);
    for (size_t i = 0; i < peaks.size(); ++i) {
        points(i, 0) = peaks[i].x;
        points(i, 1) = peaks[i].y;
    }
    return points;
}

} // anonymous namespace

std::vector<MatchedPair> greedyMatch(
    const PeakList& peaks,
    const TrackCollection& tracks,
    double tolerance) {

    checkTolerance(tolerance);

    std::vector<MatchedPair> assigned;
    if (tolerance == 0.0 || peaks.empty() || tracks.empty()) {
        return assigned;
    }

    KDTree peak_tree(peakPositions(peaks));

    // The tree works in float; search slightly wider and apply the exact cut below
    const float search_radius = static_cast<float>(tolerance) * 1.0001f + 1e-4f;

    std::vector<MatchedPair> candidates;
    for (size_t t = 0; t < tracks.size(); ++t) {
        const Peak expected = tracks[t].expectedPosition();
        auto neighbours = peak_tree.queryRadius(
            Eigen::Vector2f(expected.x, expected.y), search_radius);

        for (const auto& neighbour : neighbours) {
            const int peak_idx = neighbour.first;
            const float dist = expected.distanceTo(peaks[peak_idx]);
            if (static_cast<double>(dist) <= tolerance) {
                candidates.emplace_back(static_cast<int>(t), peak_idx, dist);
            }
        }
    }

    std::sort(candidates.begin(), candidates.end(),
        [](const MatchedPair& a, const MatchedPair& b) {
            return std::tie(a.distance, a.track_index, a.peak_index) <
                   std::tie(b.distance, b.track_index, b.peak_index);
        });

    std::vector<bool> track_used(tracks.size(), false);
    std::vector<bool> peak_used(peaks.size(), false);

    for (const auto& cand : candidates) {
        if (track_used[cand.track_index] || peak_used[cand.peak_index]) {
            continue;
        }
        track_used[cand.track_index] = true;
        peak_used[cand.peak_index] = true;
        assigned.push_back(cand);
    }

    return assigned;
}

Eigen::MatrixXf extractSquare(
    const AccumulatorGrid& grid,
    int center_row,
    int center_col,
    int half_size) {

    const int side = 2 * half_size + 1;
    Eigen::MatrixXf square = Eigen::MatrixXf::Zero(side, side);

    const int rows = static_cast<int>(grid.rows());
    const int cols = static_cast<int>(grid.cols());

    // Overlap of the window with the grid
    const int r0 = std::max(0, center_row - half_size);
    const int r1 = std::min(rows - 1, center_row + half_size);
    const int c0 = std::max(0, center_col - half_size);
    const int c1 = std::min(cols - 1, center_col + half_size);

    if (r0 > r1 || c0 > c1) {
        return square;
    }

    square.block(r0 - (center_row - half_size), c0 - (center_col - half_size),
                 r1 - r0 + 1, c1 - c0 + 1) = grid.block(r0, c0, r1 - r0 + 1, c1 - c0 + 1);
    return square;
}

MatchResult matchAndExtractSquares(
    const AccumulatorGrid& grid,
    const PeakList& peaks,
    TrackCollection& tracks,
    const MatchingParams& params,
    const SliceKey& key) {

    if (params.square_size <= 0) {
        throw ConfigurationError("square_size must be > 0, got " +
                                 std::to_string(params.square_size));
    }
    checkTolerance(params.tolerance);

    MatchResult result;
    result.peak_mask.assign(peaks.size(), false);
    result.track_mask.assign(tracks.size(), false);

    if (peaks.empty()) {
        return result;
    }
    if (grid.rows() < 1 || grid.cols() < 1) {
        throw InvalidInputError("cannot extract squares from an empty accumulator");
    }

    result.pairs = greedyMatch(peaks, tracks, params.tolerance);

    for (const auto& pair : result.pairs) {
        result.peak_mask[pair.peak_index] = true;
        result.track_mask[pair.track_index] = true;
        tracks[pair.track_index].markReconstructed();
    }

    for (size_t i = 0; i < peaks.size(); ++i) {
        const Peak& peak = peaks[i];
        const int row = static_cast<int>(std::lround(peak.y));
        const int col = static_cast<int>(std::lround(peak.x));

        HoughSquare square(extractSquare(grid, row, col, params.square_size),
                           result.peak_mask[i], peak.x, peak.y,
                           key.event_id, key.slice_index);

        if (!result.squares.add(square)) {
            ++result.duplicate_squares;
        }
    }

    return result;
}

} // namespace core
} // namespace hough_ml
