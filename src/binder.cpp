#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include "SectorSearch.hpp"
#include <climits>
#include <cstdint>
#include <stdexcept>

namespace py = pybind11;

typedef py::array_t<double, py::array::c_style | py::array::forcecast> CoordArray;

// Number of drones in an (N, 2) array; an empty sequence counts as zero drones.
static int drone_count(const py::buffer_info &buf)
{
    if (buf.ndim == 1 && buf.shape[0] == 0)
        return 0;
    if (buf.ndim != 2 || buf.shape[1] != 2)
        throw std::invalid_argument("drones must be an (N, 2) array of x, y coordinates");
    if (buf.shape[0] > INT_MAX)
        throw std::invalid_argument("too many drones");
    return static_cast<int>(buf.shape[0]);
}

py::array_t<std::int64_t> wrap_find_conflicts(CoordArray input, double conflict_radius, double airspace_size,
                                              const SearchOptions &options)
{
    auto buf = input.request();
    int n = drone_count(buf);

    std::vector<int> ids;
    {
        py::gil_scoped_release release;
        ids = find_conflicts(static_cast<const double *>(buf.ptr), n, conflict_radius, airspace_size, options);
    }

    py::array_t<std::int64_t> out(ids.size());
    auto out_ptr = static_cast<std::int64_t *>(out.request().ptr);
    for (size_t k = 0; k < ids.size(); ++k)
    {
        out_ptr[k] = ids[k];
    }
    return out;
}

int wrap_count_conflicts(CoordArray input, double conflict_radius, double airspace_size, const SearchOptions &options)
{
    auto buf = input.request();
    int n = drone_count(buf);

    int result;
    {
        py::gil_scoped_release release;
        result = count_conflicts(static_cast<const double *>(buf.ptr), n, conflict_radius, airspace_size, options);
    }
    return result;
}

int wrap_count_conflicts_brute_force(CoordArray input, double conflict_radius, int limit)
{
    auto buf = input.request();
    int n = drone_count(buf);

    int result;
    {
        py::gil_scoped_release release;
        result = count_conflicts_brute_force(static_cast<const double *>(buf.ptr), n, conflict_radius, limit);
    }
    return result;
}

static SearchOptions make_options(int pad_mult, int limit, bool debug)
{
    SearchOptions options;
    options.pad_mult = pad_mult;
    options.limit = limit;
    options.debug = debug;
    return options;
}

PYBIND11_MODULE(SectorSearch, m)
{
    m.doc() = "Drone airspace conflict counting with overlapping sector search";

    py::class_<SearchOptions>(m, "SearchOptions")
        .def(py::init<>())
        .def(py::init(&make_options), py::arg("pad_mult") = 10, py::arg("limit") = -1, py::arg("debug") = false)
        .def_readwrite("pad_mult", &SearchOptions::pad_mult)
        .def_readwrite("limit", &SearchOptions::limit)
        .def_readwrite("debug", &SearchOptions::debug);

    m.def("count_conflicts", &wrap_count_conflicts,
          "Count drones closer than conflict_radius to at least one other drone",
          py::arg("drones"), py::arg("conflict_radius"), py::arg("airspace_size"), py::arg("options"));

    m.def("count_conflicts",
          [](CoordArray drones, double conflict_radius, double airspace_size, int pad_mult, int limit, bool debug) {
              return wrap_count_conflicts(drones, conflict_radius, airspace_size, make_options(pad_mult, limit, debug));
          },
          "Count drones closer than conflict_radius to at least one other drone",
          py::arg("drones"), py::arg("conflict_radius"), py::arg("airspace_size"),
          py::arg("pad_mult") = 10, py::arg("limit") = -1, py::arg("debug") = false);

    m.def("find_conflicts", &wrap_find_conflicts,
          "Sorted ids of drones in conflict",
          py::arg("drones"), py::arg("conflict_radius"), py::arg("airspace_size"), py::arg("options"));

    m.def("find_conflicts",
          [](CoordArray drones, double conflict_radius, double airspace_size, int pad_mult, int limit, bool debug) {
              return wrap_find_conflicts(drones, conflict_radius, airspace_size, make_options(pad_mult, limit, debug));
          },
          "Sorted ids of drones in conflict",
          py::arg("drones"), py::arg("conflict_radius"), py::arg("airspace_size"),
          py::arg("pad_mult") = 10, py::arg("limit") = -1, py::arg("debug") = false);

    m.def("count_conflicts_brute_force", &wrap_count_conflicts_brute_force,
          "All-pairs conflict count without sectoring",
          py::arg("drones"), py::arg("conflict_radius"), py::arg("limit") = -1);

    m.def("split_into_sectors",
          [](double airspace_size, double conflict_radius, int pad_mult) {
              return split_into_sectors(airspace_size, conflict_radius, pad_mult).boundaries;
          },
          "Sector boundaries along one axis",
          py::arg("airspace_size"), py::arg("conflict_radius"), py::arg("pad_mult") = 10);

    m.attr("__version__") = "0.1.0";
}
