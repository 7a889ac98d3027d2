#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <pybind11/functional.h>

#include "hough_ml/core/angular_slicer.hpp"
#include "hough_ml/core/charge_table.hpp"
#include "hough_ml/core/config.hpp"
#include "hough_ml/core/easing.hpp"
#include "hough_ml/core/errors.hpp"
#include "hough_ml/core/matching.hpp"
#include "hough_ml/core/peak_detection.hpp"

#include <string>
#include <tuple>
#include <vector>

namespace py = pybind11;

using FloatArray = py::array_t<float, py::array::c_style | py::array::forcecast>;

// Helpers for NumPy conversion
namespace {

/**
 * @brief Copy a 2D float array (row-major) into an accumulator grid
 */
hough_ml::core::AccumulatorGrid numpyToGrid(const FloatArray& array) {
    if (array.ndim() != 2) {
        throw py::value_error("grid must be 2-dimensional");
    }

    const py::ssize_t rows = array.shape(0);
    const py::ssize_t cols = array.shape(1);
    auto view = array.unchecked<2>();

    hough_ml::core::AccumulatorGrid grid(rows, cols);
    for (py::ssize_t r = 0; r < rows; ++r) {
        for (py::ssize_t c = 0; c < cols; ++c) {
            grid(r, c) = view(r, c);
        }
    }
    return grid;
}

/**
 * @brief Tracks from an (N, 2) array of expected positions (qpt_bin, phi_bin)
 */
hough_ml::core::TrackCollection numpyToTracks(const FloatArray& positions) {
    if (positions.ndim() != 2 || positions.shape(1) != 2) {
        throw py::value_error("tracks must be an (N, 2) array of (qpt_bin, phi_bin)");
    }

    auto view = positions.unchecked<2>();
    std::vector<hough_ml::core::Track> tracks;
    tracks.reserve(positions.shape(0));

    for (py::ssize_t i = 0; i < positions.shape(0); ++i) {
        hough_ml::core::Track track;
        track.track_id = static_cast<int>(i);
        track.qpt_bin = view(i, 0);
        track.phi_bin = view(i, 1);
        tracks.push_back(track);
    }
    return hough_ml::core::TrackCollection(std::move(tracks));
}

py::array_t<bool> maskToNumpy(const std::vector<bool>& mask) {
    py::array_t<bool> result(static_cast<py::ssize_t>(mask.size()));
    auto view = result.mutable_unchecked<1>();
    for (size_t i = 0; i < mask.size(); ++i) {
        view(i) = mask[i];
    }
    return result;
}

py::array_t<float> matrixToNumpy(const Eigen::MatrixXf& matrix) {
    py::array_t<float> result({static_cast<py::ssize_t>(matrix.rows()),
                               static_cast<py::ssize_t>(matrix.cols())});
    auto view = result.mutable_unchecked<2>();
    for (Eigen::Index r = 0; r < matrix.rows(); ++r) {
        for (Eigen::Index c = 0; c < matrix.cols(); ++c) {
            view(r, c) = matrix(r, c);
        }
    }
    return result;
}

py::array_t<float> vectorToNumpy(const Eigen::VectorXf& vector) {
    py::array_t<float> result(static_cast<py::ssize_t>(vector.size()));
    auto view = result.mutable_unchecked<1>();
    for (Eigen::Index i = 0; i < vector.size(); ++i) {
        view(i) = vector(i);
    }
    return result;
}

} // anonymous namespace

// Python wrappers
namespace hough_ml {
namespace core {

/**
 * @brief Python wrapper for findPeaks
 */
PeakList findPeaksPython(
    const FloatArray& grid,
    double threshold_abs,
    double threshold_rel,
    int min_distance,
    double smooth_sigma
) {
    PeakDetectionParams params;
    params.threshold_abs = threshold_abs;
    params.threshold_rel = threshold_rel;
    params.min_distance = min_distance;
    params.smooth_sigma = smooth_sigma;

    try {
        return findPeaks(numpyToGrid(grid), params);
    } catch (const std::invalid_argument& e) {
        throw py::value_error("Peak detection error: " + std::string(e.what()));
    }
}

/**
 * @brief Python wrapper for sliceWindow, returns (start, end) in phi bins
 *
 * Without a registry only the built-in curves are known.
 */
std::tuple<double, double> sliceWindowPython(
    int slice_index,
    int total_slices,
    const std::string& easing,
    int nbin_phi,
    double phi_offset,
    const EasingRegistry* registry
) {
    try {
        const EasingRegistry builtins;
        const EasingRegistry& easings = registry ? *registry : builtins;
        const SliceWindow window = sliceWindow(slice_index, total_slices,
                                               easings.get(easing),
                                               nbin_phi, phi_offset);
        return std::make_tuple(window.start, window.end);
    } catch (const UnknownStrategyError& e) {
        throw py::key_error(e.what());
    } catch (const std::invalid_argument& e) {
        throw py::value_error("Slice window error: " + std::string(e.what()));
    }
}

/**
 * @brief Python wrapper for matchAndExtractSquares
 *
 * X and y list true positive squares first. peak_mask follows the order of
 * peaks, track_mask the order of tracks.
 */
py::tuple matchAndExtractSquaresPython(
    const FloatArray& grid,
    const PeakList& peaks,
    const FloatArray& tracks,
    double tolerance,
    int square_size,
    int event_id,
    int slice_index
) {
    try {
        TrackCollection track_collection = numpyToTracks(tracks);
        MatchResult result = matchAndExtractSquares(
            numpyToGrid(grid), peaks, track_collection,
            MatchingParams(tolerance, square_size),
            SliceKey(event_id, slice_index));

        const TrainingData data = result.squares.trainingData();
        return py::make_tuple(matrixToNumpy(data.features),
                              vectorToNumpy(data.labels),
                              maskToNumpy(result.peak_mask),
                              maskToNumpy(result.track_mask));

    } catch (const std::invalid_argument& e) {
        throw py::value_error("Matching error: " + std::string(e.what()));
    }
}

/**
 * @brief Charge lookup; without a table the static charges are used
 */
double chargeForPython(int pdg_id, const ChargeTable* table) {
    try {
        if (table) {
            return table->chargeFor(pdg_id);
        }
        const ChargeTable defaults;
        return defaults.chargeFor(pdg_id);
    } catch (const LookupError& e) {
        throw py::key_error(e.what());
    }
}

void registerEasingPython(EasingRegistry& registry,
                          const std::string& name,
                          const EasingFunction::Function& fn) {
    try {
        registry.registerEasing(name, fn);
    } catch (const std::invalid_argument& e) {
        throw py::value_error(e.what());
    }
}

} // namespace core
} // namespace hough_ml

// Module definition
PYBIND11_MODULE(hough_ml_core, m) {
    m.doc() = "Hough accumulator peak finding and training square extraction";

    py::class_<hough_ml::core::Peak>(m, "Peak")
        .def(py::init<>())
        .def(py::init<float, float, float>(), py::arg("x"), py::arg("y"), py::arg("height"))
        .def_readwrite("x", &hough_ml::core::Peak::x)
        .def_readwrite("y", &hough_ml::core::Peak::y)
        .def_readwrite("height", &hough_ml::core::Peak::height)
        .def("distance_to", &hough_ml::core::Peak::distanceTo)
        .def("__eq__", &hough_ml::core::Peak::operator==)
        .def("__repr__", [](const hough_ml::core::Peak& p) {
            return "Peak(" + std::to_string(p.x) + ", " + std::to_string(p.y) +
                   ", " + std::to_string(p.height) + ")";
        });

    // Peak detection
    m.def("find_peaks",
          &hough_ml::core::findPeaksPython,
          "Find local maxima of a Hough accumulator (rows = phi, cols = q/pT)",
          py::arg("grid"),
          py::arg("threshold_abs") = 5.0,
          py::arg("threshold_rel") = 0.0,
          py::arg("min_distance") = 2,
          py::arg("smooth_sigma") = 0.0);

    // Easing registry, passed explicitly to slice_window
    py::class_<hough_ml::core::EasingRegistry>(m, "EasingRegistry")
        .def(py::init<>())
        .def("register", &hough_ml::core::registerEasingPython,
             "Register a custom easing curve under a new name",
             py::arg("name"), py::arg("fn"))
        .def("contains", &hough_ml::core::EasingRegistry::contains, py::arg("name"))
        .def("names", &hough_ml::core::EasingRegistry::names);

    // Angular slicing
    m.def("slice_window",
          &hough_ml::core::sliceWindowPython,
          "Eased angular window (start, end) of a slice in phi bins",
          py::arg("slice_index"),
          py::arg("total_slices"),
          py::arg("easing") = "InSquare",
          py::arg("nbin_phi") = 7000,
          py::arg("phi_offset") = 0.0,
          py::arg("registry") = nullptr);

    // Matching
    m.def("match_and_extract_squares",
          &hough_ml::core::matchAndExtractSquaresPython,
          "Pair peaks with tracks and return (X, y, peak_mask, track_mask)",
          py::arg("grid"),
          py::arg("peaks"),
          py::arg("tracks"),
          py::arg("tolerance") = 6.0,
          py::arg("square_size") = 16,
          py::arg("event_id") = 0,
          py::arg("slice_index") = -1);

    // Charges
    py::enum_<hough_ml::core::UnknownChargePolicy>(m, "UnknownChargePolicy")
        .value("THROW", hough_ml::core::UnknownChargePolicy::kThrow)
        .value("USE_DEFAULT", hough_ml::core::UnknownChargePolicy::kUseDefault);

    py::class_<hough_ml::core::ChargeTable>(m, "ChargeTable")
        .def(py::init<hough_ml::core::UnknownChargePolicy, double>(),
             py::arg("policy") = hough_ml::core::UnknownChargePolicy::kThrow,
             py::arg("default_charge") = 0.0)
        .def("charge_for",
             [](const hough_ml::core::ChargeTable& table, int pdg_id) {
                 return hough_ml::core::chargeForPython(pdg_id, &table);
             },
             py::arg("pdg_id"))
        .def("charge_or", &hough_ml::core::ChargeTable::chargeOr,
             py::arg("pdg_id"), py::arg("fallback"))
        .def("contains", &hough_ml::core::ChargeTable::contains, py::arg("pdg_id"))
        .def("register_charge", &hough_ml::core::ChargeTable::registerCharge,
             "Register or override the charge of a PDG particle id",
             py::arg("pdg_id"), py::arg("charge"))
        .def("registrations", &hough_ml::core::ChargeTable::registrations)
        .def("__len__", &hough_ml::core::ChargeTable::size);

    m.def("charge_for",
          &hough_ml::core::chargeForPython,
          "Electric charge of a PDG particle id",
          py::arg("pdg_id"),
          py::arg("table") = nullptr);

    m.attr("__version__") = "1.0.0";
}
