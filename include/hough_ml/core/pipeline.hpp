#ifndef HOUGH_ML_CORE_PIPELINE_HPP
#define HOUGH_ML_CORE_PIPELINE_HPP

#include "hough_ml/core/angular_slicer.hpp"
#include "hough_ml/core/config.hpp"
#include "hough_ml/core/easing.hpp"
#include "hough_ml/core/hough_square.hpp"
#include "hough_ml/core/matching.hpp"
#include "hough_ml/core/peak.hpp"
#include "hough_ml/core/track.hpp"

#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace hough_ml {
namespace core {

/**
 * @brief Counters accumulated over a run
 */
struct AnalysisStatistics {
    std::size_t total_files = 0;
    std::size_t processed_files = 0;
    std::vector<int> events;  // unique, in discovery order
    std::size_t histograms_processed = 0;
    std::size_t histograms_failed = 0;
    std::size_t total_peaks = 0;
    std::size_t true_tracks_total = 0;  // tracks of every processed slice
    std::size_t true_squares = 0;
    std::size_t false_squares = 0;

    void recordEvent(int event_id);
    std::size_t eventCount() const { return events.size(); }

    /**
     * @brief true_squares / true_tracks_total, 0 without tracks
     */
    double reconstructionEfficiency() const;

    std::string toString() const;
};

/**
 * @brief Per-slice counts reported to the progress callback
 */
struct SliceProgress {
    int event_id;
    int slice_index;
    std::size_t peaks_found;
    std::size_t tracks_in_slice;
    std::size_t tracks_matched;
    std::size_t true_squares;
    std::size_t false_squares;
};

using ProgressCallback = std::function<void(const SliceProgress&)>;

/**
 * @brief Turns accumulators and true tracks into labeled training squares
 *
 * One instance covers one run: squares and statistics accumulate across
 * processSlice() calls.
 */
class HoughTrainingPipeline {
public:
    /**
     * @throws ConfigurationError if the configuration is invalid
     * @throws UnknownStrategyError if config.easing_type is not in the registry
     */
    HoughTrainingPipeline(const AnalysisConfig& config, const EasingRegistry& registry);

    bool shouldProcess(int slice_index) const;

    /**
     * @brief Run peak finding and matching on one accumulator
     *
     * Tracks of the slice that get matched are flagged reconstructed in
     * event_tracks as well.
     *
     * @param event_id Event the accumulator belongs to
     * @param slice_index Angular slice of the accumulator, -1 for the full range
     * @param grid Accumulator
     * @param event_tracks All true tracks of the event
     * @param progress Invoked once after the slice, may be empty
     * @return Matching outcome of the slice
     */
    MatchResult processSlice(int event_id, int slice_index,
                             const AccumulatorGrid& grid,
                             TrackCollection& event_tracks,
                             const ProgressCallback& progress = ProgressCallback());

    void setTotalFiles(std::size_t count) { stats_.total_files = count; }
    void recordFileProcessed() { ++stats_.processed_files; }
    void recordEvent(int event_id) { stats_.recordEvent(event_id); }
    void recordFailure() { ++stats_.histograms_failed; }

    const HoughSquareCollection& squares() const { return squares_; }
    const AnalysisStatistics& statistics() const { return stats_; }
    const AngularSlicer& slicer() const { return slicer_; }
    const AnalysisConfig& config() const { return config_; }

private:
    AnalysisConfig config_;
    AngularSlicer slicer_;
    std::set<int> slice_set_;
    HoughSquareCollection squares_;
    AnalysisStatistics stats_;
};

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_PIPELINE_HPP
