#include "hough_ml/core/angular_slicer.hpp"
#include "hough_ml/core/errors.hpp"
#include "hough_ml/core/utils.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace hough_ml {
namespace core {

namespace {

// Shared by both ends of adjacent slices so the partition has no gaps
double sliceBoundary(int k, int total_slices, const EasingFunction& easing,
                     int nbin_phi, double phi_offset) {
    const double t = static_cast<double>(k) / static_cast<double>(total_slices);
    return phi_offset + easing.ease(t) * static_cast<double>(nbin_phi);
}

void checkSlicing(int total_slices, int nbin_phi, double phi_offset) {
    if (total_slices < 1) {
        throw ConfigurationError("total_slices must be >= 1, got " +
                                 std::to_string(total_slices));
    }
    if (nbin_phi < 1) {
        throw ConfigurationError("nbin_phi must be >= 1, got " + std::to_string(nbin_phi));
    }
    if (!std::isfinite(phi_offset)) {
        throw ConfigurationError("phi_offset must be finite");
    }
}

} // anonymous namespace

bool SliceWindow::contains(double phi_bin, double nbin_phi) const {
    if (full_range) return true;

    const double w = width();
    if (w <= 0.0) return false;
    if (w >= nbin_phi) return true;

    const double p = wrapPhiBin(phi_bin, nbin_phi);
    const double s = wrapPhiBin(start, nbin_phi);
    const double e = wrapPhiBin(end, nbin_phi);

    if (s < e) {
        return s <= p && p < e;
    }
    // Window runs past nbin_phi: [s, nbin_phi) U [0, e)
    return p >= s || p < e;
}

SliceWindow sliceWindow(int slice_index, int total_slices,
                        const EasingFunction& easing,
                        int nbin_phi, double phi_offset) {
    checkSlicing(total_slices, nbin_phi, phi_offset);

    if (slice_index == -1) {
        return SliceWindow(0.0, static_cast<double>(nbin_phi), true);
    }
    if (slice_index < -1 || slice_index >= total_slices) {
        throw ConfigurationError("slice index " + std::to_string(slice_index) +
                                 " outside [-1, " + std::to_string(total_slices) + ")");
    }

    const double start = sliceBoundary(slice_index, total_slices, easing, nbin_phi, phi_offset);
    const double end = sliceBoundary(slice_index + 1, total_slices, easing, nbin_phi, phi_offset);
    return SliceWindow(start, end);
}

AngularSlicer::AngularSlicer(int nbin_phi, int total_slices,
                             const EasingFunction& easing, double phi_offset)
    : nbin_phi_(nbin_phi),
      total_slices_(total_slices),
      easing_(easing),
      phi_offset_(phi_offset),
      use_vz_range_(false),
      vz_min_(0.0f),
      vz_max_(0.0f) {
    checkSlicing(total_slices, nbin_phi, phi_offset);
}

void AngularSlicer::setVzRange(float vz_min, float vz_max) {
    if (!(vz_min < vz_max)) {
        throw ConfigurationError("vz range must satisfy vz_min < vz_max");
    }
    use_vz_range_ = true;
    vz_min_ = vz_min;
    vz_max_ = vz_max;
}

SliceWindow AngularSlicer::sliceWindow(int slice_index) const {
    return core::sliceWindow(slice_index, total_slices_, easing_, nbin_phi_, phi_offset_);
}

TrackCollection AngularSlicer::filterTracksForSlice(const TrackCollection& tracks,
                                                    int slice_index) const {
    const SliceWindow window = sliceWindow(slice_index);
    const double nbin = static_cast<double>(nbin_phi_);

    const TrackCollection candidates = use_vz_range_
        ? tracks.filterByVzRange(vz_min_, vz_max_)
        : tracks;

    std::vector<Track> selected;
    for (const auto& track : candidates) {
        if (window.contains(track.phi_bin, nbin)) {
            selected.push_back(track);
        }
    }
    return TrackCollection(std::move(selected));
}

} // namespace core
} // namespace hough_ml
