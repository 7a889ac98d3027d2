#ifndef HOUGH_ML_CORE_UTILS_HPP
#define HOUGH_ML_CORE_UTILS_HPP

#include <Eigen/Core>
#include <cmath>
#include <string>
#include <utility>

namespace hough_ml {
namespace core {

/**
 * @brief Phi bin of a track direction
 *
 * @param phi Azimuthal angle in radians, [-pi, pi]
 * @param nbin_phi Number of phi bins of the accumulator
 * @return Continuous bin coordinate (phi + pi) * nbin_phi / (2 pi)
 */
inline float phiToBin(float phi, int nbin_phi) {
    return static_cast<float>((phi + M_PI) * nbin_phi / (2.0 * M_PI));
}

/**
 * @brief q/pT bin of a track curvature
 *
 * The accumulator centre column corresponds to infinite momentum.
 *
 * @param charge Particle charge in units of e
 * @param pt Transverse momentum in GeV
 * @param nbin_qpt Number of q/pT bins of the accumulator
 */
inline float curvatureToBin(float charge, float pt, int nbin_qpt) {
    const int half = nbin_qpt / 2;
    const float curv = pt != 0.0f ? charge / pt : 0.0f;
    return static_cast<float>(half) + curv * static_cast<float>(half);
}

/**
 * @brief Map an angular bin coordinate into [0, nbin_phi)
 */
inline double wrapPhiBin(double phi_bin, double nbin_phi) {
    double wrapped = std::fmod(phi_bin, nbin_phi);
    if (wrapped < 0.0) wrapped += nbin_phi;
    // fmod of a tiny negative value can round up to nbin_phi
    if (wrapped >= nbin_phi) wrapped = 0.0;
    return wrapped;
}

/**
 * @brief Separable Gaussian blur with mirror-reflect boundary
 *
 * Kernel is truncated at 4 sigma. Rows are processed in parallel.
 *
 * @param grid Input grid
 * @param sigma Standard deviation in bins, must be > 0
 * @return Blurred grid of the same shape
 */
Eigen::MatrixXf gaussianBlur2D(const Eigen::MatrixXf& grid, double sigma);

/**
 * @brief Event id and slice index encoded in a histogram name
 *
 * Accepts "<prefix>_<event>_<slice>" with '_' or ';' separators
 * (ROOT key cycles such as "h_12_-1;1" are tolerated).
 *
 * @throws InvalidInputError if the name does not carry two integers
 */
std::pair<int, int> parseHistogramName(const std::string& name);

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_UTILS_HPP
