#ifndef HOUGH_ML_CORE_MATCHING_HPP
#define HOUGH_ML_CORE_MATCHING_HPP

#include "hough_ml/core/config.hpp"
#include "hough_ml/core/hough_square.hpp"
#include "hough_ml/core/peak.hpp"
#include "hough_ml/core/track.hpp"

#include <Eigen/Core>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace hough_ml {
namespace core {

/**
 * @brief 2D KD-tree over point rows (x, y)
 */
class KDTree {
public:
    explicit KDTree(const Eigen::MatrixXf& points);
    ~KDTree();

    /**
     * @brief Points within radius of the query, as (index, distance)
     */
    std::vector<std::pair<int, float>> queryRadius(
        const Eigen::Vector2f& point,
        float radius) const;

    std::size_t size() const { return size_; }

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    std::size_t size_;
};

/**
 * @brief Identifies the accumulator a match run belongs to
 */
struct SliceKey {
    int event_id;
    int slice_index;

    SliceKey() : event_id(0), slice_index(-1) {}
    SliceKey(int event, int slice) : event_id(event), slice_index(slice) {}
};

struct MatchedPair {
    int track_index;
    int peak_index;
    float distance;

    MatchedPair() : track_index(-1), peak_index(-1), distance(0.0f) {}
    MatchedPair(int t, int p, float d) : track_index(t), peak_index(p), distance(d) {}
};

/**
 * @brief Outcome of matching one accumulator
 *
 * peak_mask[i] is true if peak i was paired with a track, track_mask[j] if
 * track j was paired with a peak. Pairs are in assignment order.
 */
struct MatchResult {
    HoughSquareCollection squares;
    std::vector<bool> peak_mask;
    std::vector<bool> track_mask;
    std::vector<MatchedPair> pairs;
    std::size_t duplicate_squares = 0;

    std::size_t matchedCount() const { return pairs.size(); }
};

/**
 * @brief Greedy one-to-one pairing of tracks and peaks
 *
 * Candidate pairs with distance <= tolerance are taken in ascending distance
 * (ties: lower track index, then lower peak index); a track or peak already
 * used is skipped. tolerance == 0 yields no pairs.
 *
 * @throws ConfigurationError if tolerance is negative or non-finite
 */
std::vector<MatchedPair> greedyMatch(
    const PeakList& peaks,
    const TrackCollection& tracks,
    double tolerance);

/**
 * @brief (2*half_size+1)^2 window of the grid centred on (row, col)
 *
 * Cells outside the grid are zero.
 */
Eigen::MatrixXf extractSquare(
    const AccumulatorGrid& grid,
    int center_row,
    int center_col,
    int half_size);

/**
 * @brief Pair peaks with tracks and cut one labeled square per peak
 *
 * Paired tracks are marked reconstructed in place. Paired peaks give true
 * positive squares, all others false positive squares.
 *
 * @param grid Accumulator the peaks were found in
 * @param peaks Detected peaks
 * @param tracks True tracks of the slice, updated in place
 * @param params Matching tolerance and square half-width
 * @param key Event and slice stored on every square
 *
 * @throws ConfigurationError if square_size <= 0 or tolerance is negative or non-finite
 * @throws InvalidInputError if peaks are given for an empty grid
 */
MatchResult matchAndExtractSquares(
    const AccumulatorGrid& grid,
    const PeakList& peaks,
    TrackCollection& tracks,
    const MatchingParams& params,
    const SliceKey& key);

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_MATCHING_HPP
