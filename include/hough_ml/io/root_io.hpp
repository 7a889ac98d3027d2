#ifndef HOUGH_ML_IO_ROOT_IO_HPP
#define HOUGH_ML_IO_ROOT_IO_HPP

#include "hough_ml/core/charge_table.hpp"
#include "hough_ml/core/hough_square.hpp"
#include "hough_ml/core/peak.hpp"
#include "hough_ml/core/track.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace hough_ml {
namespace io {

/**
 * @brief Files in a directory whose name starts with prefix and ends in .root
 * @return Full paths, sorted
 * @throws std::runtime_error if the directory does not exist
 */
std::vector<std::string> listRootFiles(const std::string& directory, const std::string& prefix);

/**
 * @brief One Hough accumulator histogram read from file
 */
struct HoughHistogram {
    std::string name;
    int event_id;
    int slice_index;
    core::AccumulatorGrid grid;  // row = y bin (phi), col = x bin (q/pT)
};

/**
 * @brief Reads TH2 accumulators from out*.root files
 */
class RootHoughReader {
public:
    using HistogramVisitor = std::function<void(const HoughHistogram&)>;

    explicit RootHoughReader(const std::string& data_path,
                             const std::string& file_prefix = "out");

    std::vector<std::string> findFiles() const;

    /**
     * @brief Call visit for every TH2 in a file, in key order
     *
     * Histograms whose name does not carry an event and slice are skipped
     * and reported on stderr.
     *
     * @return Number of histograms visited
     * @throws std::runtime_error if the file cannot be opened
     */
    std::size_t forEachHistogram(const std::string& file_path,
                                 const HistogramVisitor& visit) const;

private:
    std::string data_path_;
    std::string file_prefix_;
};

/**
 * @brief Builds the true tracks of every event from particles*.root
 */
class RootParticleReader {
public:
    /**
     * @param charges Charge lookup, unknown ids are treated as neutral
     */
    RootParticleReader(const std::string& data_path,
                       const core::ChargeTable& charges,
                       const std::string& file_prefix = "particles");

    std::vector<std::string> findFiles() const;

    /**
     * @brief Charged particles with more than min_hits hits, keyed by event
     *
     * phi_bin and qpt_bin are filled with the Hough projection. Track ids
     * are the position of the track within its event.
     *
     * @throws std::runtime_error if no file matches or a file lacks the particles tree
     */
    std::map<int, core::TrackCollection> readTracks(int nbin_phi, int nbin_qpt,
                                                    int min_hits) const;

private:
    void readFile(const std::string& file_path, int nbin_phi, int nbin_qpt, int min_hits,
                  std::map<int, core::TrackCollection>& tracks) const;

    std::string data_path_;
    const core::ChargeTable& charges_;
    std::string file_prefix_;
};

/**
 * @brief Persists training squares and reconstructed-track state
 */
class RootTrainingWriter {
public:
    /**
     * @throws std::runtime_error if the directory cannot be created
     */
    explicit RootTrainingWriter(const std::string& output_dir);

    /**
     * @brief Write one entry per square to the "squares" tree, true positives first
     * @return Path of the written file
     * @throws std::runtime_error if the file cannot be created
     */
    std::string writeSquares(const core::HoughSquareCollection& squares,
                             const std::string& filename = "images.root") const;

    /**
     * @brief Write the tracks of the listed events to the "ntuple" tree
     * @return Path of the written file
     * @throws std::runtime_error if the file cannot be created
     */
    std::string writeTracks(const std::map<int, core::TrackCollection>& tracks,
                            const std::vector<int>& event_list,
                            const std::string& filename = "out_true_tracks.root") const;

private:
    std::string output_dir_;
};

} // namespace io
} // namespace hough_ml

#endif // HOUGH_ML_IO_ROOT_IO_HPP
