#ifndef HOUGH_ML_CORE_ANGULAR_SLICER_HPP
#define HOUGH_ML_CORE_ANGULAR_SLICER_HPP

#include "hough_ml/core/easing.hpp"
#include "hough_ml/core/track.hpp"

namespace hough_ml {
namespace core {

/**
 * @brief Half-open angular window [start, end) in phi bins
 *
 * start and end are unwrapped; end may exceed nbin_phi when the slices are
 * shifted by a phi offset, in which case the window wraps to bin 0.
 */
struct SliceWindow {
    double start;
    double end;
    bool full_range;

    SliceWindow() : start(0.0), end(0.0), full_range(false) {}
    SliceWindow(double s, double e, bool full = false)
        : start(s), end(e), full_range(full) {}

    double width() const { return end - start; }

    /**
     * @brief Whether a phi bin coordinate (any real value) falls in the window
     */
    bool contains(double phi_bin, double nbin_phi) const;
};

/**
 * @brief Window of one slice of an eased angular partition
 *
 * Boundary k sits at phi_offset + ease(k / total_slices) * nbin_phi.
 * Slice -1 is the whole circle and bypasses the easing.
 *
 * @throws ConfigurationError if total_slices < 1, nbin_phi < 1 or
 *         slice_index is outside [-1, total_slices)
 */
SliceWindow sliceWindow(int slice_index, int total_slices,
                        const EasingFunction& easing,
                        int nbin_phi, double phi_offset = 0.0);

/**
 * @brief Splits the phi axis into eased slices and selects the tracks of each
 */
class AngularSlicer {
public:
    /**
     * @throws ConfigurationError if nbin_phi < 1 or total_slices < 1
     */
    AngularSlicer(int nbin_phi, int total_slices,
                  const EasingFunction& easing, double phi_offset = 0.0);

    /**
     * @brief Apply vz_min < vz < vz_max in addition to the angular cut
     */
    void setVzRange(float vz_min, float vz_max);

    SliceWindow sliceWindow(int slice_index) const;

    /**
     * @brief Tracks whose wrapped phi bin lies in the slice window
     *
     * Slice -1 keeps every track (subject to the vz cut). The returned
     * collection is a copy; input order is preserved.
     */
    TrackCollection filterTracksForSlice(const TrackCollection& tracks, int slice_index) const;

private:
    int nbin_phi_;
    int total_slices_;
    EasingFunction easing_;
    double phi_offset_;
    bool use_vz_range_;
    float vz_min_;
    float vz_max_;
};

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_ANGULAR_SLICER_HPP
