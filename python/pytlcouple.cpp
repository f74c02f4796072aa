#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "tlcouple/coupling.hpp"
#include "tlcouple/interpretation.hpp"

namespace py = pybind11;
using namespace tlcouple;

PYBIND11_MODULE(pytlcouple, m) {
  m.doc() = "Python bindings for the tlcouple TEM coupling calculator.";

  py::enum_<DiagnosticKind>(m, "DiagnosticKind")
      .value("ConstantsCheck", DiagnosticKind::ConstantsCheck)
      .value("SingularMatrix", DiagnosticKind::SingularMatrix)
      .value("AsymmetricMutual", DiagnosticKind::AsymmetricMutual);

  py::class_<Diagnostic>(m, "Diagnostic",
                         "Message emitted during a coupling computation.")
      .def_readonly("kind", &Diagnostic::kind)
      .def_readonly("message", &Diagnostic::message);

  py::class_<CouplingOptions>(m, "CouplingOptions",
                              "Tolerances for singularity and symmetry checks.")
      .def(py::init<>())
      .def_readwrite("singular_tolerance",
                     &CouplingOptions::singular_tolerance)
      .def_readwrite("symmetry_rtol", &CouplingOptions::symmetry_rtol)
      .def_readwrite("symmetry_atol", &CouplingOptions::symmetry_atol);

  py::class_<CouplingResult>(m, "CouplingResult",
                             "Coupling coefficient and derived inductances.")
      .def_readonly("success", &CouplingResult::success)
      .def_readonly("error_message", &CouplingResult::error_message)
      .def_readonly("k", &CouplingResult::k, "Coupling coefficient")
      .def_readonly("L11", &CouplingResult::L11, "Self-inductance 1 (H)")
      .def_readonly("L22", &CouplingResult::L22, "Self-inductance 2 (H)")
      .def_readonly("M", &CouplingResult::M, "Mutual inductance (H)")
      .def_readonly("L", &CouplingResult::L, "Inductance matrix (H)")
      .def_readonly("diagnostics", &CouplingResult::diagnostics);

  m.def("compute_coupling",
        py::overload_cast<const Eigen::MatrixXd &, const CouplingOptions &>(
            &compute_coupling),
        "Compute k, L11, L22 and M from a 2x2 capacitance matrix (F).\n"
        "Raises ValueError for non-2x2 or non-finite input.",
        py::arg("C"), py::arg("options") = CouplingOptions());

  m.def("extract_conductor_pair", &extract_conductor_pair,
        "Extract the 2x2 sub-matrix for conductors i and j.", py::arg("C"),
        py::arg("i"), py::arg("j"));

  py::enum_<CouplingBand>(m, "CouplingBand")
      .value("VeryWeak", CouplingBand::VeryWeak)
      .value("Weak", CouplingBand::Weak)
      .value("Moderate", CouplingBand::Moderate)
      .value("Strong", CouplingBand::Strong)
      .value("VeryStrong", CouplingBand::VeryStrong);

  m.def("classify_coupling", &classify_coupling, "Classify |k| into a band.",
        py::arg("k"));
  m.def("band_name", &band_name, py::arg("band"));
  m.def("band_description", &band_description, py::arg("band"));
  m.def("is_physically_plausible", &is_physically_plausible, py::arg("k"));
}
