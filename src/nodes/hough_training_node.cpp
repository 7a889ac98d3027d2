#include "hough_ml/nodes/hough_training_node.hpp"
#include "hough_ml/core/errors.hpp"
#include "hough_ml/io/root_io.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <vector>

namespace hough_ml {
namespace nodes {

HoughTrainingNode::HoughTrainingNode(const rclcpp::NodeOptions& options)
    : Node("hough_training_node", options),
      charges_(core::UnknownChargePolicy::kUseDefault, 0.0),
      run_on_startup_(false) {

    // Parse parameters
    parseParameters();

    // Create services
    run_analysis_service_ = this->create_service<std_srvs::srv::Trigger>(
        "run_analysis",
        std::bind(&HoughTrainingNode::runAnalysisCallback, this,
                  std::placeholders::_1, std::placeholders::_2));

    RCLCPP_INFO(this->get_logger(), "Hough training node initialized");

    if (run_on_startup_) {
        try {
            std::lock_guard<std::mutex> lock(analysis_mutex_);
            core::AnalysisStatistics stats = runAnalysis();
            RCLCPP_INFO(this->get_logger(), "Startup analysis finished: %s",
                        stats.toString().c_str());
        } catch (const std::exception& e) {
            RCLCPP_ERROR(this->get_logger(), "Startup analysis failed: %s", e.what());
        }
    }
}

void HoughTrainingNode::parseParameters() {
    // Hough binning and matching
    config_.hough.nbin_phi = this->declare_parameter<int>("hough.nbin_phi", 7000);
    config_.hough.nbin_qpt = this->declare_parameter<int>("hough.nbin_qpt", 216);
    config_.hough.square_size = this->declare_parameter<int>("hough.square_size", 16);
    config_.hough.tolerance = this->declare_parameter<double>("hough.tolerance", 6.0);

    // Peak detection
    config_.peak_detection.threshold_abs = this->declare_parameter<double>(
        "peak_detection.threshold_abs", 5.0);
    config_.peak_detection.threshold_rel = this->declare_parameter<double>(
        "peak_detection.threshold_rel", 0.0);
    config_.peak_detection.min_distance = this->declare_parameter<int>(
        "peak_detection.min_distance", 2);
    config_.peak_detection.smooth_sigma = this->declare_parameter<double>(
        "peak_detection.smooth_sigma", 0.0);

    // Processing
    const std::vector<int64_t> slice_list = this->declare_parameter<std::vector<int64_t>>(
        "processing.slice_list", std::vector<int64_t>{-1});
    config_.processing.slice_list.assign(slice_list.begin(), slice_list.end());
    config_.processing.total_slices = this->declare_parameter<int>(
        "processing.total_slices", 32);
    config_.processing.num_files = this->declare_parameter<int>("processing.num_files", 8);
    config_.processing.min_hits = this->declare_parameter<int>("processing.min_hits", 4);
    config_.processing.use_vz_range = this->declare_parameter<bool>(
        "processing.use_vz_range", true);
    const std::vector<double> vz_range = this->declare_parameter<std::vector<double>>(
        "processing.vz_range", std::vector<double>{-200.0, 200.0});
    config_.processing.phi_offset = this->declare_parameter<double>(
        "processing.phi_offset", 0.0);
    run_on_startup_ = this->declare_parameter<bool>("processing.run_on_startup", false);

    // Paths
    config_.paths.data_path = this->declare_parameter<std::string>("paths.data_path", ".");
    config_.paths.output_dir = this->declare_parameter<std::string>("paths.output_dir", ".");
    config_.paths.hough_file_pattern = this->declare_parameter<std::string>(
        "paths.hough_file_pattern", "out");
    config_.paths.particle_file_pattern = this->declare_parameter<std::string>(
        "paths.particle_file_pattern", "particles");

    config_.easing_type = this->declare_parameter<std::string>("easing_type", "InSquare");

    try {
        config_.processing.setVzRange(vz_range);
        core::validateConfig(config_);
        if (!easings_.contains(config_.easing_type)) {
            throw core::UnknownStrategyError("unknown easing strategy: '" +
                                             config_.easing_type + "'");
        }
    } catch (const std::exception& e) {
        RCLCPP_FATAL(this->get_logger(), "Invalid configuration: %s", e.what());
        throw;
    }

    RCLCPP_INFO(this->get_logger(), "%s", config_.toString().c_str());
}

core::AnalysisStatistics HoughTrainingNode::runAnalysis() {
    core::HoughTrainingPipeline pipeline(config_, easings_);

    // Step 1: true tracks
    RCLCPP_INFO(this->get_logger(), "[1/3] Loading particle data from %s",
                config_.paths.data_path.c_str());
    io::RootParticleReader particle_reader(
        config_.paths.data_path, charges_, config_.paths.particle_file_pattern);
    std::map<int, core::TrackCollection> tracks = particle_reader.readTracks(
        config_.hough.nbin_phi, config_.hough.nbin_qpt, config_.processing.min_hits);
    RCLCPP_INFO(this->get_logger(), "Created tracks for %zu events", tracks.size());

    // Step 2: accumulators
    RCLCPP_INFO(this->get_logger(), "[2/3] Processing Hough accumulator files");
    io::RootHoughReader hough_reader(config_.paths.data_path,
                                     config_.paths.hough_file_pattern);
    const std::vector<std::string> files = hough_reader.findFiles();
    const std::size_t num_files = std::min(
        files.size(), static_cast<std::size_t>(config_.processing.num_files));
    pipeline.setTotalFiles(num_files);

    const core::ProgressCallback progress = [this](const core::SliceProgress& p) {
        RCLCPP_INFO(this->get_logger(),
                    "Event %d slice %d: %zu peaks, %zu tracks, %zu matched (%zu true / %zu false squares)",
                    p.event_id, p.slice_index, p.peaks_found, p.tracks_in_slice,
                    p.tracks_matched, p.true_squares, p.false_squares);
    };

    const io::RootHoughReader::HistogramVisitor process_histogram =
        [&](const io::HoughHistogram& hist) {
            pipeline.recordEvent(hist.event_id);
            if (!pipeline.shouldProcess(hist.slice_index)) {
                return;
            }

            auto it = tracks.find(hist.event_id);
            if (it == tracks.end()) {
                RCLCPP_WARN(this->get_logger(), "No true tracks for event %d, skipping %s",
                            hist.event_id, hist.name.c_str());
                return;
            }

            try {
                pipeline.processSlice(hist.event_id, hist.slice_index, hist.grid,
                                      it->second, progress);
            } catch (const std::exception& e) {
                RCLCPP_ERROR(this->get_logger(), "Failed to process %s: %s",
                             hist.name.c_str(), e.what());
                pipeline.recordFailure();
            }
        };

    for (std::size_t i = 0; i < num_files; ++i) {
        RCLCPP_INFO(this->get_logger(), "File %zu/%zu: %s",
                    i + 1, num_files, files[i].c_str());

        std::size_t visited = 0;
        try {
            visited = hough_reader.forEachHistogram(files[i], process_histogram);
        } catch (const std::runtime_error& e) {
            RCLCPP_ERROR(this->get_logger(), "Skipping file %s: %s", files[i].c_str(), e.what());
            continue;
        }

        RCLCPP_INFO(this->get_logger(), "Read %zu histograms from %s",
                    visited, files[i].c_str());
        pipeline.recordFileProcessed();
    }

    std::size_t reconstructed = 0;
    std::size_t total_tracks = 0;
    for (const auto& entry : tracks) {
        reconstructed += entry.second.countReconstructed();
        total_tracks += entry.second.size();
    }
    RCLCPP_INFO(this->get_logger(), "Reconstructed %zu of %zu true tracks",
                reconstructed, total_tracks);

    // Step 3: outputs
    RCLCPP_INFO(this->get_logger(), "[3/3] Saving results to %s",
                config_.paths.output_dir.c_str());
    io::RootTrainingWriter writer(config_.paths.output_dir);
    writer.writeSquares(pipeline.squares());
    writer.writeTracks(tracks, pipeline.statistics().events);

    return pipeline.statistics();
}

void HoughTrainingNode::runAnalysisCallback(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response) {

    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        std::lock_guard<std::mutex> lock(analysis_mutex_);

        core::AnalysisStatistics stats = runAnalysis();

        response->success = true;
        response->message = stats.toString();

    } catch (const std::exception& e) {
        response->success = false;
        response->message = std::string("Exception: ") + e.what();
        RCLCPP_ERROR(this->get_logger(), "Analysis failed: %s", e.what());
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time);

    RCLCPP_INFO(this->get_logger(), "Analysis completed in %ld ms: %s",
                static_cast<long>(duration.count()), response->message.c_str());
}

} // namespace nodes
} // namespace hough_ml
