#ifndef HOUGH_ML_CORE_CONFIG_HPP
#define HOUGH_ML_CORE_CONFIG_HPP

#include <string>
#include <vector>

namespace hough_ml {
namespace core {

/**
 * @brief Accumulator binning and square extraction parameters
 */
struct HoughParams {
    int nbin_phi;
    int nbin_qpt;
    int square_size;   // half-width, squares are (2*square_size+1)^2
    double tolerance;  // max peak-track distance in bins

    HoughParams()
        : nbin_phi(7000), nbin_qpt(216), square_size(16), tolerance(6.0) {}
};

/**
 * @brief Local maxima search parameters
 */
struct PeakDetectionParams {
    double threshold_abs;
    double threshold_rel;
    int min_distance;
    double smooth_sigma;

    PeakDetectionParams()
        : threshold_abs(5.0), threshold_rel(0.0), min_distance(2), smooth_sigma(0.0) {}

    bool isValid() const {
        return threshold_abs >= 0.0 &&
               threshold_rel >= 0.0 && threshold_rel <= 1.0 &&
               min_distance >= 1 &&
               smooth_sigma >= 0.0;
    }
};

/**
 * @brief Peak-track matching parameters
 */
struct MatchingParams {
    double tolerance;
    int square_size;

    MatchingParams() : tolerance(6.0), square_size(16) {}
    MatchingParams(double tol, int size) : tolerance(tol), square_size(size) {}
};

struct ProcessingParams {
    std::vector<int> slice_list;
    int total_slices;
    int num_files;
    int min_hits;
    bool use_vz_range;
    double vz_min;
    double vz_max;
    double phi_offset;  // slice origin in phi bins

    ProcessingParams()
        : slice_list({-1}), total_slices(32), num_files(8), min_hits(4),
          use_vz_range(true), vz_min(-200.0), vz_max(200.0), phi_offset(0.0) {}

    /**
     * @brief Set vz_min and vz_max from a [min, max] list
     * @throws ConfigurationError unless the list holds exactly two values
     */
    void setVzRange(const std::vector<double>& range);
};

struct PathParams {
    std::string data_path;
    std::string output_dir;
    std::string hough_file_pattern;
    std::string particle_file_pattern;

    PathParams()
        : data_path("."), output_dir("."),
          hough_file_pattern("out"), particle_file_pattern("particles") {}
};

/**
 * @brief Complete run configuration, validated once at entry
 */
struct AnalysisConfig {
    HoughParams hough;
    PeakDetectionParams peak_detection;
    ProcessingParams processing;
    PathParams paths;
    std::string easing_type;

    AnalysisConfig() : easing_type("InSquare") {}

    MatchingParams matchingParams() const {
        return MatchingParams(hough.tolerance, hough.square_size);
    }

    std::string toString() const;
};

/**
 * @brief Check every section of the configuration
 * @throws ConfigurationError naming the first offending parameter
 */
void validateConfig(const AnalysisConfig& config);

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_CONFIG_HPP
