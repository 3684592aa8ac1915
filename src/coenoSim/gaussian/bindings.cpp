#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "dispersion.hpp"
#include "errors.hpp"
#include "response.hpp"
#include "simulate.hpp"

namespace py = pybind11;

using DoubleArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

namespace {

Eigen::VectorXd toVector(const DoubleArray& a)
{
    if (a.ndim() != 1)
        throw std::invalid_argument("expected a one-dimensional array");
    return Eigen::Map<const Eigen::VectorXd>(a.data(), a.shape(0));
}

py::array_t<double> toNumpy(const Eigen::VectorXd& v)
{
    return py::array_t<double>(v.size(), v.data());
}

// Copies; Eigen stores column-major so the strides say so.
py::array_t<double> toNumpy(const Eigen::MatrixXd& m)
{
    return py::array_t<double>(
        {m.rows(), m.cols()},
        {sizeof(double), sizeof(double) * m.rows()},
        m.data()
    );
}

Eigen::MatrixXd toMatrix(const DoubleArray& a)
{
    if (a.ndim() != 2)
        throw std::invalid_argument("expected a two-dimensional array");
    using RowMatrixXd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    return Eigen::Map<const RowMatrixXd>(a.data(), a.shape(0), a.shape(1));
}

} // namespace

PYBIND11_MODULE(coenosim_cpp, m)
{
    m.doc() = "Gaussian response species simulation C++ backend";

    // ---------------- Errors ----------------
    py::register_exception<DimensionMismatch>(m, "DimensionMismatch", PyExc_ValueError);
    py::register_exception<InvalidParameter>(m, "InvalidParameter", PyExc_ValueError);

    // ---------------- Parameters ----------------
    py::class_<Parameters>(m, "Parameters")
        .def(py::init<>())
        .def_readwrite("alpha",       &Parameters::alpha)
        .def_readwrite("corr",        &Parameters::corr)
        .def_readwrite("expectation", &Parameters::expectation)
        .def_readwrite("seed",        &Parameters::seed)
        .def_readwrite("seeded",      &Parameters::seeded);

    // ---------------- Sampler ----------------
    py::class_<Sampler>(m, "Sampler")
        .def(py::init<>())
        .def(py::init<std::uint32_t>(), py::arg("seed"))
        .def(py::init(&makeSampler), py::arg("params"))
        .def("seed", &Sampler::seed, py::arg("value"))
        .def("draw_count", &Sampler::drawCount);

    // ---------------- Response model ----------------
    m.def("expand_gauss",
        [](DoubleArray x, DoubleArray opt, DoubleArray tol, DoubleArray h) {
            const ExpandedGrid g =
                expandGauss(toVector(x), toVector(opt), toVector(tol), toVector(h));
            py::dict out;
            out["x"]   = toNumpy(g.x);
            out["opt"] = toNumpy(g.opt);
            out["tol"] = toNumpy(g.tol);
            out["h"]   = toNumpy(g.h);
            return out;
        },
        py::arg("x"), py::arg("opt"), py::arg("tol"), py::arg("h"));

    m.def("gaussian_response",
        [](DoubleArray x, DoubleArray opt, DoubleArray tol, DoubleArray h) {
            return toNumpy(gaussianResponse(toVector(x), toVector(opt),
                                            toVector(tol), toVector(h)));
        },
        py::arg("x"), py::arg("opt"), py::arg("tol"), py::arg("h"));

    m.def("bigaussian_response",
        [](DoubleArray x1, DoubleArray opt1, DoubleArray tol1,
           DoubleArray x2, DoubleArray opt2, DoubleArray tol2,
           DoubleArray h, double corr) {
            return toNumpy(biGaussianResponse(
                toVector(x1), toVector(opt1), toVector(tol1),
                toVector(x2), toVector(opt2), toVector(tol2),
                toVector(h), corr));
        },
        py::arg("x1"), py::arg("opt1"), py::arg("tol1"),
        py::arg("x2"), py::arg("opt2"), py::arg("tol2"),
        py::arg("h"), py::arg("corr") = 0.0);

    // ---------------- Simulation drivers ----------------
    m.def("sim1d_negbinom",
        [](Sampler& s, DoubleArray x, DoubleArray opt, DoubleArray tol,
           DoubleArray h, double alpha, bool expectation) {
            return toNumpy(simulateSingleGradientCounts(
                s, toVector(x), toVector(opt), toVector(tol), toVector(h),
                alpha, expectation));
        },
        py::arg("sampler"), py::arg("x"), py::arg("opt"), py::arg("tol"),
        py::arg("h"), py::arg("alpha") = 1.0, py::arg("expectation") = false);

    m.def("sim2d_negbinom",
        [](Sampler& s, DoubleArray x1, DoubleArray x2,
           DoubleArray opt1, DoubleArray tol1,
           DoubleArray opt2, DoubleArray tol2,
           DoubleArray h, double corr, double alpha, bool expectation) {
            return toNumpy(simulateTwoGradientCounts(
                s, toVector(x1), toVector(x2), toVector(opt1), toVector(tol1),
                toVector(opt2), toVector(tol2), toVector(h),
                corr, alpha, expectation));
        },
        py::arg("sampler"), py::arg("x1"), py::arg("x2"),
        py::arg("opt1"), py::arg("tol1"), py::arg("opt2"), py::arg("tol2"),
        py::arg("h"), py::arg("corr") = 0.0, py::arg("alpha") = 1.0,
        py::arg("expectation") = false);

    m.def("sim2d_binomial",
        [](Sampler& s, DoubleArray x1, DoubleArray x2,
           DoubleArray opt1, DoubleArray tol1,
           DoubleArray opt2, DoubleArray tol2,
           DoubleArray h, double corr, bool expectation) {
            return toNumpy(simulateTwoGradientOccurrence(
                s, toVector(x1), toVector(x2), toVector(opt1), toVector(tol1),
                toVector(opt2), toVector(tol2), toVector(h),
                corr, expectation));
        },
        py::arg("sampler"), py::arg("x1"), py::arg("x2"),
        py::arg("opt1"), py::arg("tol1"), py::arg("opt2"), py::arg("tol2"),
        py::arg("h"), py::arg("corr") = 0.0, py::arg("expectation") = false);

    // ---------------- Diagnostics ----------------
    m.def("column_means",
        [](DoubleArray y) { return toNumpy(columnMeans(toMatrix(y))); },
        py::arg("y"));
    m.def("column_variances",
        [](DoubleArray y) { return toNumpy(columnVariances(toMatrix(y))); },
        py::arg("y"));
    m.def("estimate_alpha", &estimateAlpha,
        py::arg("mean"), py::arg("variance"));
}
