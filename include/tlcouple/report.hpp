#pragma once

#include <ostream>
#include <vector>

#include <Eigen/Core>

#include "tlcouple/coupling.hpp"

namespace tlcouple {

struct ReportOptions {
  /// Digits after the decimal point for inductances and k.
  int precision = 6;

  /// Print the calculator diagnostics (constants check, errors, warnings).
  bool print_diagnostics = true;

  CouplingOptions coupling;
};

/// Write diagnostics one per line. Errors are prefixed with "Error: " and
/// warnings with "Warning: "; informational lines are written as-is.
void write_diagnostics(std::ostream &os,
                       const std::vector<Diagnostic> &diagnostics);

/// Compute the coupling for C and write a human-readable report: the input
/// matrix, diagnostics, inductances, k, its interpretation and a warning
/// when |k| > 1. The results block is skipped when the computation fails.
/// @return The CouplingResult the report was written from
CouplingResult write_report(std::ostream &os, const Eigen::Matrix2d &C,
                            const ReportOptions &opt = ReportOptions());

} // namespace tlcouple
