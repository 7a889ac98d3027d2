#ifndef HOUGH_ML_CORE_TRACK_HPP
#define HOUGH_ML_CORE_TRACK_HPP

#include "hough_ml/core/peak.hpp"

#include <cstddef>
#include <vector>

namespace hough_ml {
namespace core {

/**
 * @brief Ground-truth particle track of one event
 *
 * phi_bin and qpt_bin are the expected accumulator position of the track.
 * The reconstructed flag is the only state that changes after loading.
 */
class Track {
public:
    Track();

    int event_id;
    int track_id;
    float phi_bin;
    float qpt_bin;
    float vz;
    int particle_type;
    float charge;
    int number_of_hits;
    float phi;
    float eta;
    float pt;
    float pz;

    float pzOverPt() const { return pt != 0.0f ? pz / pt : 0.0f; }

    /**
     * @brief Expected accumulator position of the track (x = q/pT bin, y = phi bin)
     */
    Peak expectedPosition() const { return Peak(qpt_bin, phi_bin, 0.0f); }

    bool isInVzRange(float vz_min, float vz_max) const {
        return vz_min < vz && vz < vz_max;
    }

    bool isReconstructed() const { return reconstructed_; }

    /**
     * @brief Flag the track as paired with a peak. Never cleared.
     */
    void markReconstructed() { reconstructed_ = true; }

private:
    bool reconstructed_;
};

/**
 * @brief Ordered tracks of one event
 *
 * Filtering returns copies; flags set on a filtered copy are carried back to
 * the event collection with propagateReconstructed().
 */
class TrackCollection {
public:
    TrackCollection() = default;
    explicit TrackCollection(std::vector<Track> tracks);

    void add(const Track& track);

    std::size_t size() const { return tracks_.size(); }
    bool empty() const { return tracks_.empty(); }

    Track& operator[](std::size_t idx) { return tracks_[idx]; }
    const Track& operator[](std::size_t idx) const { return tracks_[idx]; }

    std::vector<Track>::iterator begin() { return tracks_.begin(); }
    std::vector<Track>::iterator end() { return tracks_.end(); }
    std::vector<Track>::const_iterator begin() const { return tracks_.begin(); }
    std::vector<Track>::const_iterator end() const { return tracks_.end(); }

    /**
     * @brief Track with the given id, nullptr if absent
     */
    const Track* findById(int track_id) const;

    TrackCollection filterByVzRange(float vz_min, float vz_max) const;

    /**
     * @brief Tracks with strictly more than min_hits hits
     */
    TrackCollection filterByHits(int min_hits) const;

    std::size_t countReconstructed() const;

    /**
     * @brief Copy reconstructed flags of a filtered subset back by track id
     * @return Number of tracks newly flagged by this call
     */
    std::size_t propagateReconstructed(const TrackCollection& subset);

private:
    Track* findMutableById(int track_id);

    std::vector<Track> tracks_;
};

} // namespace core
} // namespace hough_ml

#endif // HOUGH_ML_CORE_TRACK_HPP
