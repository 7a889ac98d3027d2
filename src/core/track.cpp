#include "hough_ml/core/track.hpp"

#include <algorithm>
#include <utility>

namespace hough_ml {
namespace core {

Track::Track()
    : event_id(0), track_id(0), phi_bin(0.0f), qpt_bin(0.0f), vz(0.0f),
      particle_type(0), charge(0.0f), number_of_hits(0), phi(0.0f),
      eta(0.0f), pt(0.0f), pz(0.0f), reconstructed_(false) {}

TrackCollection::TrackCollection(std::vector<Track> tracks)
    : tracks_(std::move(tracks)) {}

void TrackCollection::add(const Track& track) {
    tracks_.push_back(track);
}

const Track* TrackCollection::findById(int track_id) const {
    auto it = std::find_if(tracks_.begin(), tracks_.end(),
        [track_id](const Track& t) { return t.track_id == track_id; });
    return it != tracks_.end() ? &(*it) : nullptr;
}

Track* TrackCollection::findMutableById(int track_id) {
    auto it = std::find_if(tracks_.begin(), tracks_.end(),
        [track_id](const Track& t) { return t.track_id == track_id; });
    return it != tracks_.end() ? &(*it) : nullptr;
}

TrackCollection TrackCollection::filterByVzRange(float vz_min, float vz_max) const {
    std::vector<Track> filtered;
    for (const auto& track : tracks_) {
        if (track.isInVzRange(vz_min, vz_max)) {
            filtered.push_back(track);
        }
    }
    return TrackCollection(std::move(filtered));
}

TrackCollection TrackCollection::filterByHits(int min_hits) const {
    std::vector<Track> filtered;
    for (const auto& track : tracks_) {
        if (track.number_of_hits > min_hits) {
            filtered.push_back(track);
        }
    }
    return TrackCollection(std::move(filtered));
}

std::size_t TrackCollection::countReconstructed() const {
    return static_cast<std::size_t>(std::count_if(tracks_.begin(), tracks_.end(),
        [](const Track& t) { return t.isReconstructed(); }));
}

std::size_t TrackCollection::propagateReconstructed(const TrackCollection& subset) {
    std::size_t newly_reconstructed = 0;
    for (const auto& sub_track : subset) {
        if (!sub_track.isReconstructed()) continue;

        Track* track = findMutableById(sub_track.track_id);
        if (track && !track->isReconstructed()) {
            track->markReconstructed();
            ++newly_reconstructed;
        }
    }
    return newly_reconstructed;
}

} // namespace core
} // namespace hough_ml
