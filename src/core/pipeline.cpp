#include "hough_ml/core/pipeline.hpp"
#include "hough_ml/core/errors.hpp"
#include "hough_ml/core/peak_detection.hpp"

#include <algorithm>
#include <sstream>

namespace hough_ml {
namespace core {

namespace {

const AnalysisConfig& validated(const AnalysisConfig& config) {
    validateConfig(config);
    return config;
}

} // anonymous namespace

void AnalysisStatistics::recordEvent(int event_id) {
    if (std::find(events.begin(), events.end(), event_id) == events.end()) {
        events.push_back(event_id);
    }
}

double AnalysisStatistics::reconstructionEfficiency() const {
    if (true_tracks_total == 0) return 0.0;
    return static_cast<double>(true_squares) / static_cast<double>(true_tracks_total);
}

std::string AnalysisStatistics::toString() const {
    std::ostringstream oss;
    oss << "files " << processed_files << "/" << total_files
        << ", events " << eventCount()
        << ", histograms " << histograms_processed
        << " (failed " << histograms_failed << ")"
        << ", peaks " << total_peaks
        << ", true tracks " << true_tracks_total
        << ", true squares " << true_squares
        << ", false squares " << false_squares
        << ", efficiency " << reconstructionEfficiency() * 100.0 << "%";
    return oss.str();
}

HoughTrainingPipeline::HoughTrainingPipeline(const AnalysisConfig& config,
                                             const EasingRegistry& registry)
    : config_(validated(config)),
      slicer_(config.hough.nbin_phi,
              config.processing.total_slices,
              registry.get(config.easing_type),
              config.processing.phi_offset),
      slice_set_(config.processing.slice_list.begin(), config.processing.slice_list.end()) {

    if (config_.processing.use_vz_range) {
        slicer_.setVzRange(static_cast<float>(config_.processing.vz_min),
                           static_cast<float>(config_.processing.vz_max));
    }
}

bool HoughTrainingPipeline::shouldProcess(int slice_index) const {
    return slice_set_.count(slice_index) > 0;
}

MatchResult HoughTrainingPipeline::processSlice(int event_id, int slice_index,
                                                const AccumulatorGrid& grid,
                                                TrackCollection& event_tracks,
                                                const ProgressCallback& progress) {
    stats_.recordEvent(event_id);

    TrackCollection slice_tracks = slicer_.filterTracksForSlice(event_tracks, slice_index);

    PeakList peaks = findPeaks(grid, config_.peak_detection);

    MatchResult result = matchAndExtractSquares(
        grid, peaks, slice_tracks, config_.matchingParams(),
        SliceKey(event_id, slice_index));

    event_tracks.propagateReconstructed(slice_tracks);

    // Squares already stored by an earlier pass are not counted again
    const std::size_t true_before = squares_.truePositiveCount();
    const std::size_t false_before = squares_.falsePositiveCount();
    squares_.append(result.squares);

    ++stats_.histograms_processed;
    stats_.total_peaks += peaks.size();
    stats_.true_tracks_total += slice_tracks.size();
    stats_.true_squares += squares_.truePositiveCount() - true_before;
    stats_.false_squares += squares_.falsePositiveCount() - false_before;

    if (progress) {
        SliceProgress report;
        report.event_id = event_id;
        report.slice_index = slice_index;
        report.peaks_found = peaks.size();
        report.tracks_in_slice = slice_tracks.size();
        report.tracks_matched = result.matchedCount();
        report.true_squares = result.squares.truePositiveCount();
        report.false_squares = result.squares.falsePositiveCount();
        progress(report);
    }

    return result;
}

} // namespace core
} // namespace hough_ml
