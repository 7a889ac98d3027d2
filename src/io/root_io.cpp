#include "hough_ml/io/root_io.hpp"
#include "hough_ml/core/errors.hpp"
#include "hough_ml/core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <tuple>

#include <TClass.h>
#include <TFile.h>
#include <TH2.h>
#include <TKey.h>
#include <TList.h>
#include <TTree.h>

namespace hough_ml {
namespace io {

namespace fs = std::filesystem;

namespace {

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::unique_ptr<TFile> openForReading(const std::string& file_path) {
    std::unique_ptr<TFile> file(TFile::Open(file_path.c_str(), "READ"));
    if (!file || file->IsZombie()) {
        throw std::runtime_error("cannot open ROOT file: " + file_path);
    }
    return file;
}

std::unique_ptr<TFile> openForWriting(const std::string& file_path) {
    std::unique_ptr<TFile> file(TFile::Open(file_path.c_str(), "RECREATE"));
    if (!file || file->IsZombie()) {
        throw std::runtime_error("cannot create ROOT file: " + file_path);
    }
    return file;
}

core::AccumulatorGrid histogramToGrid(const TH2& hist) {
    const int nx = hist.GetNbinsX();
    const int ny = hist.GetNbinsY();

    core::AccumulatorGrid grid(ny, nx);
    for (int iy = 0; iy < ny; ++iy) {
        for (int ix = 0; ix < nx; ++ix) {
            grid(iy, ix) = static_cast<float>(hist.GetBinContent(ix + 1, iy + 1));
        }
    }
    return grid;
}

// Element of a per-event particle vector, or fail on a short branch
template <typename T>
T elementAt(const std::vector<T>* values, std::size_t idx, const char* branch) {
    if (idx >= values->size()) {
        throw std::runtime_error(std::string("particles branch '") + branch +
                                 "' is shorter than particle_type");
    }
    return (*values)[idx];
}

} // anonymous namespace

std::vector<std::string> listRootFiles(const std::string& directory, const std::string& prefix) {
    if (!fs::is_directory(directory)) {
        throw std::runtime_error("data directory does not exist: " + directory);
    }

    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (!entry.is_regular_file()) continue;

        const std::string name = entry.path().filename().string();
        if (name.compare(0, prefix.size(), prefix) == 0 && endsWith(name, ".root")) {
            files.push_back(entry.path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

// RootHoughReader

RootHoughReader::RootHoughReader(const std::string& data_path, const std::string& file_prefix)
    : data_path_(data_path), file_prefix_(file_prefix) {}

std::vector<std::string> RootHoughReader::findFiles() const {
    return listRootFiles(data_path_, file_prefix_);
}

std::size_t RootHoughReader::forEachHistogram(const std::string& file_path,
                                              const HistogramVisitor& visit) const {
    std::unique_ptr<TFile> file = openForReading(file_path);

    std::size_t visited = 0;
    TIter next(file->GetListOfKeys());
    while (TKey* key = static_cast<TKey*>(next())) {
        TClass* cls = TClass::GetClass(key->GetClassName());
        if (!cls || !cls->InheritsFrom(TH2::Class())) {
            continue;
        }

        HoughHistogram histogram;
        histogram.name = key->GetName();
        try {
            std::tie(histogram.event_id, histogram.slice_index) =
                core::parseHistogramName(histogram.name);
        } catch (const core::InvalidInputError& e) {
            std::cerr << "Skipping histogram in " << file_path << ": " << e.what() << std::endl;
            continue;
        }

        std::unique_ptr<TH2> hist(key->ReadObject<TH2>());
        if (!hist) {
            std::cerr << "Cannot read histogram " << histogram.name
                      << " from " << file_path << std::endl;
            continue;
        }
        hist->SetDirectory(nullptr);

        histogram.grid = histogramToGrid(*hist);
        visit(histogram);
        ++visited;
    }

    file->Close();
    return visited;
}

// RootParticleReader

RootParticleReader::RootParticleReader(const std::string& data_path,
                                       const core::ChargeTable& charges,
                                       const std::string& file_prefix)
    : data_path_(data_path), charges_(charges), file_prefix_(file_prefix) {}

std::vector<std::string> RootParticleReader::findFiles() const {
    return listRootFiles(data_path_, file_prefix_);
}

std::map<int, core::TrackCollection> RootParticleReader::readTracks(
    int nbin_phi, int nbin_qpt, int min_hits) const {

    const std::vector<std::string> files = findFiles();
    if (files.empty()) {
        throw std::runtime_error("no files matching '" + file_prefix_ + "*.root' in " +
                                 data_path_);
    }

    std::map<int, core::TrackCollection> tracks;
    for (const auto& file_path : files) {
        std::cout << "Reading particles from " << file_path << std::endl;
        readFile(file_path, nbin_phi, nbin_qpt, min_hits, tracks);
    }
    return tracks;
}

void RootParticleReader::readFile(const std::string& file_path,
                                  int nbin_phi, int nbin_qpt, int min_hits,
                                  std::map<int, core::TrackCollection>& tracks) const {
    // Branch buffers outlive the file and its tree
    UInt_t event_id = 0;
    std::vector<int> particle_type_buf;
    std::vector<float> vz_buf, phi_buf, eta_buf, pt_buf, pz_buf;
    std::vector<UInt_t> hits_buf;

    std::vector<int>* particle_type = &particle_type_buf;
    std::vector<float>* vz = &vz_buf;
    std::vector<float>* phi = &phi_buf;
    std::vector<float>* eta = &eta_buf;
    std::vector<float>* pt = &pt_buf;
    std::vector<float>* pz = &pz_buf;
    std::vector<UInt_t>* number_of_hits = &hits_buf;

    std::unique_ptr<TFile> file = openForReading(file_path);

    TTree* tree = dynamic_cast<TTree*>(file->Get("particles"));
    if (!tree) {
        file->Close();
        throw std::runtime_error("TTree 'particles' not found in " + file_path);
    }

    tree->SetBranchAddress("event_id",       &event_id);
    tree->SetBranchAddress("particle_type",  &particle_type);
    tree->SetBranchAddress("vz",             &vz);
    tree->SetBranchAddress("phi",            &phi);
    tree->SetBranchAddress("eta",            &eta);
    tree->SetBranchAddress("pt",             &pt);
    tree->SetBranchAddress("pz",             &pz);
    tree->SetBranchAddress("number_of_hits", &number_of_hits);

    const Long64_t entries = tree->GetEntries();
    for (Long64_t entry = 0; entry < entries; ++entry) {
        tree->GetEntry(entry);

        const int event = static_cast<int>(event_id);
        core::TrackCollection& event_tracks = tracks[event];

        for (std::size_t i = 0; i < particle_type->size(); ++i) {
            const int pdg = (*particle_type)[i];
            const double charge = charges_.chargeOr(pdg, 0.0);
            const int hits = static_cast<int>(elementAt(number_of_hits, i, "number_of_hits"));
            if (charge == 0.0 || hits <= min_hits) {
                continue;
            }

            core::Track track;
            track.event_id = event;
            track.track_id = static_cast<int>(event_tracks.size());
            track.particle_type = pdg;
            track.charge = static_cast<float>(charge);
            track.number_of_hits = hits;
            track.vz = elementAt(vz, i, "vz");
            track.phi = elementAt(phi, i, "phi");
            track.eta = elementAt(eta, i, "eta");
            track.pt = elementAt(pt, i, "pt");
            track.pz = elementAt(pz, i, "pz");
            track.phi_bin = core::phiToBin(track.phi, nbin_phi);
            track.qpt_bin = core::curvatureToBin(track.charge, track.pt, nbin_qpt);

            event_tracks.add(track);
        }
    }

    tree->ResetBranchAddresses();
    file->Close();
}

// RootTrainingWriter

RootTrainingWriter::RootTrainingWriter(const std::string& output_dir)
    : output_dir_(output_dir) {
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        throw std::runtime_error("cannot create output directory " + output_dir_ +
                                 ": " + ec.message());
    }
}

std::string RootTrainingWriter::writeSquares(const core::HoughSquareCollection& squares,
                                             const std::string& filename) const {
    const std::string path = (fs::path(output_dir_) / filename).string();
    std::unique_ptr<TFile> file = openForWriting(path);

    // Owned by the file
    TTree* tree = new TTree("squares", "Hough accumulator training squares");

    std::vector<float> data;
    Int_t label = 0;
    Int_t event_id = 0;
    Int_t slice = 0;
    Float_t center_x = 0.0f;
    Float_t center_y = 0.0f;
    Int_t size = 0;

    tree->Branch("data",     &data);
    tree->Branch("label",    &label,    "label/I");
    tree->Branch("event_id", &event_id, "event_id/I");
    tree->Branch("slice",    &slice,    "slice/I");
    tree->Branch("center_x", &center_x, "center_x/F");
    tree->Branch("center_y", &center_y, "center_y/F");
    tree->Branch("size",     &size,     "size/I");

    auto fill = [&](const std::vector<core::HoughSquare>& group) {
        for (const auto& square : group) {
            const Eigen::VectorXf flat = square.toFlat();
            data.assign(flat.data(), flat.data() + flat.size());
            label = square.isTruePositive() ? 1 : 0;
            event_id = square.eventId();
            slice = square.sliceIndex();
            center_x = square.centerX();
            center_y = square.centerY();
            size = square.size();
            tree->Fill();
        }
    };
    fill(squares.truePositives());
    fill(squares.falsePositives());

    file->cd();
    tree->Write();
    file->Close();

    const core::SquareSummary summary = squares.summary();
    std::cout << "Training data saved to " << path << "\n"
              << "  True positives: " << summary.true_positives << "\n"
              << "  False positives: " << summary.false_positives << "\n"
              << "  Total samples: " << summary.total << std::endl;

    return path;
}

std::string RootTrainingWriter::writeTracks(const std::map<int, core::TrackCollection>& tracks,
                                            const std::vector<int>& event_list,
                                            const std::string& filename) const {
    const std::string path = (fs::path(output_dir_) / filename).string();
    std::unique_ptr<TFile> file = openForWriting(path);

    TTree* tree = new TTree("ntuple", "True tracks with reconstruction flag");

    Int_t event_id = 0;
    Int_t track_id = 0;
    Float_t phi_bin = 0.0f;
    Float_t curv_bin = 0.0f;
    Float_t eta = 0.0f;
    Float_t vz = 0.0f;
    Int_t number_of_hits = 0;
    Float_t pz_over_pt = 0.0f;
    Int_t particle_type = 0;
    Float_t phi = 0.0f;
    Float_t pt = 0.0f;
    Float_t pz = 0.0f;
    Int_t reco = 0;

    tree->Branch("event_id",       &event_id,       "event_id/I");
    tree->Branch("track_id",       &track_id,       "track_id/I");
    tree->Branch("phi_bin",        &phi_bin,        "phi_bin/F");
    tree->Branch("curv_bin",       &curv_bin,       "curv_bin/F");
    tree->Branch("eta",            &eta,            "eta/F");
    tree->Branch("vz",             &vz,             "vz/F");
    tree->Branch("number_of_hits", &number_of_hits, "number_of_hits/I");
    tree->Branch("pz_over_pt",     &pz_over_pt,     "pz_over_pt/F");
    tree->Branch("particle_type",  &particle_type,  "particle_type/I");
    tree->Branch("phi",            &phi,            "phi/F");
    tree->Branch("pt",             &pt,             "pt/F");
    tree->Branch("pz",             &pz,             "pz/F");
    tree->Branch("reco",           &reco,           "reco/I");

    std::size_t written = 0;
    for (int event : event_list) {
        auto it = tracks.find(event);
        if (it == tracks.end()) continue;

        for (const auto& track : it->second) {
            event_id = track.event_id;
            track_id = track.track_id;
            phi_bin = track.phi_bin;
            curv_bin = track.qpt_bin;
            eta = track.eta;
            vz = track.vz;
            number_of_hits = track.number_of_hits;
            pz_over_pt = track.pzOverPt();
            particle_type = track.particle_type;
            phi = track.phi;
            pt = track.pt;
            pz = track.pz;
            reco = track.isReconstructed() ? 1 : 0;
            tree->Fill();
            ++written;
        }
    }

    file->cd();
    tree->Write();
    file->Close();

    std::cout << "Saved " << written << " tracks to " << path << std::endl;
    return path;
}

} // namespace io
} // namespace hough_ml
