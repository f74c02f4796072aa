#include "tlcouple/report.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

#include "tlcouple/interpretation.hpp"

namespace tlcouple {

namespace {

std::string matrix_to_string(const Eigen::Matrix2d &C) {
  Eigen::IOFormat fmt(Eigen::StreamPrecision, 0, " ", "\n ", "[", "]", "[",
                      "]");
  std::ostringstream ss;
  ss << C.format(fmt);
  return ss.str();
}

} // namespace

void write_diagnostics(std::ostream &os,
                       const std::vector<Diagnostic> &diagnostics) {
  for (const auto &d : diagnostics) {
    switch (d.kind) {
    case DiagnosticKind::SingularMatrix:
      os << "Error: " << d.message << "\n";
      break;
    case DiagnosticKind::AsymmetricMutual:
      os << "Warning: " << d.message << "\n";
      break;
    case DiagnosticKind::ConstantsCheck:
      os << d.message << "\n";
      break;
    }
  }
}

CouplingResult write_report(std::ostream &os, const Eigen::Matrix2d &C,
                            const ReportOptions &opt) {
  os << "Capacitance Matrix (2×2 submatrix):\n";
  os << matrix_to_string(C) << "\n";

  CouplingResult res = compute_coupling(C, opt.coupling);
  if (opt.print_diagnostics) {
    write_diagnostics(os, res.diagnostics);
  }
  if (!res.success) {
    return res;
  }

  std::ostringstream ss;
  ss << std::scientific << std::setprecision(opt.precision);
  ss << "\nResults:\n";
  ss << "Self-inductance of conductor 1 (L11) = " << res.L11 << " H\n";
  ss << "Self-inductance of conductor 2 (L22) = " << res.L22 << " H\n";
  ss << "Mutual inductance (M) = " << res.M << " H\n";
  ss << "Coupling coefficient (k) = " << res.k << "\n";
  os << ss.str();

  os << "\nInterpretation: " << band_description(classify_coupling(res.k))
     << "\n";

  if (std::abs(res.k) > 1.0) {
    os << "\nWarning: |k| > 1, which is physically impossible.\n";
    os << "This suggests an error in the data or calculations.\n";
  }
  return res;
}

} // namespace tlcouple
