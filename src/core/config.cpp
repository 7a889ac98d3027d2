#include "hough_ml/core/config.hpp"
#include "hough_ml/core/errors.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace hough_ml {
namespace core {

void ProcessingParams::setVzRange(const std::vector<double>& range) {
    if (range.size() != 2) {
        throw ConfigurationError("vz_range needs exactly two values [min, max], got " +
                                 std::to_string(range.size()));
    }
    vz_min = range[0];
    vz_max = range[1];
}

void validateConfig(const AnalysisConfig& config) {
    const HoughParams& h = config.hough;
    if (h.nbin_phi <= 0 || h.nbin_qpt <= 0) {
        throw ConfigurationError("hough binning must be positive");
    }
    if (h.square_size <= 0) {
        throw ConfigurationError("square_size must be positive");
    }
    if (!(h.tolerance > 0.0) || !std::isfinite(h.tolerance)) {
        throw ConfigurationError("tolerance must be positive and finite");
    }

    const PeakDetectionParams& p = config.peak_detection;
    if (p.threshold_abs < 0.0) {
        throw ConfigurationError("threshold_abs must be non-negative");
    }
    if (p.threshold_rel < 0.0 || p.threshold_rel > 1.0) {
        throw ConfigurationError("threshold_rel must lie in [0, 1]");
    }
    if (p.min_distance < 1) {
        throw ConfigurationError("min_distance must be at least 1");
    }
    if (p.smooth_sigma < 0.0) {
        throw ConfigurationError("smooth_sigma must be non-negative");
    }

    const ProcessingParams& proc = config.processing;
    if (proc.total_slices < 1) {
        throw ConfigurationError("total_slices must be at least 1");
    }
    if (proc.slice_list.empty()) {
        throw ConfigurationError("slice_list must not be empty");
    }
    for (int slice : proc.slice_list) {
        if (slice < -1 || slice >= proc.total_slices) {
            throw ConfigurationError("slice " + std::to_string(slice) +
                                     " outside [-1, " +
                                     std::to_string(proc.total_slices) + ")");
        }
    }
    if (proc.num_files < 0 || proc.min_hits < 0) {
        throw ConfigurationError("num_files and min_hits must be non-negative");
    }
    if (proc.use_vz_range && !(proc.vz_min < proc.vz_max)) {
        throw ConfigurationError("vz_range must satisfy vz_min < vz_max");
    }
    if (!std::isfinite(proc.phi_offset)) {
        throw ConfigurationError("phi_offset must be finite");
    }

    if (config.easing_type.empty()) {
        throw ConfigurationError("easing_type must not be empty");
    }
}

std::string AnalysisConfig::toString() const {
    std::ostringstream os;
    os << "=== Analysis Configuration ===\n"
       << "Easing Type: " << easing_type << "\n"
       << "Hough Transform:\n"
       << "  - Phi bins: " << hough.nbin_phi << "\n"
       << "  - Q/pT bins: " << hough.nbin_qpt << "\n"
       << "  - Square size: " << hough.square_size << "\n"
       << "  - Tolerance: " << hough.tolerance << "\n"
       << "Peak Detection:\n"
       << "  - Absolute threshold: " << peak_detection.threshold_abs << "\n"
       << "  - Relative threshold: " << peak_detection.threshold_rel << "\n"
       << "  - Min distance: " << peak_detection.min_distance << "\n"
       << "  - Smoothing sigma: " << peak_detection.smooth_sigma << "\n"
       << "Processing:\n"
       << "  - Slice list: [";
    for (size_t i = 0; i < processing.slice_list.size(); ++i) {
        if (i > 0) os << ", ";
        os << processing.slice_list[i];
    }
    os << "]\n"
       << "  - Total slices: " << processing.total_slices << "\n"
       << "  - Number of files: " << processing.num_files << "\n"
       << "  - Min hits: " << processing.min_hits << "\n";
    if (processing.use_vz_range) {
        os << "  - Vz range: (" << processing.vz_min << ", " << processing.vz_max << ")\n";
    } else {
        os << "  - Vz range: disabled\n";
    }
    os << "  - Phi offset: " << processing.phi_offset << "\n"
       << "Paths:\n"
       << "  - Data path: " << paths.data_path << "\n"
       << "  - Output dir: " << paths.output_dir << "\n"
       << "==============================";
    return os.str();
}

} // namespace core
} // namespace hough_ml
