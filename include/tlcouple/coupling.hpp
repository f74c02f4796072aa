#pragma once

#include <string>
#include <vector>

#include <Eigen/Core>

namespace tlcouple {

enum class DiagnosticKind { ConstantsCheck, SingularMatrix, AsymmetricMutual };

/// Message produced while computing a coupling coefficient.
/// ConstantsCheck is informational, SingularMatrix is an error and
/// AsymmetricMutual is a warning.
struct Diagnostic {
  DiagnosticKind kind;
  std::string message;
};

struct CouplingOptions {
  /// C is treated as singular when |det C| <= singular_tolerance times
  /// (|C11*C22| + |C12*C21|).
  double singular_tolerance = 1e-14;

  /// L12 and L21 are considered equal when
  /// |L12 - L21| <= symmetry_atol + symmetry_rtol * max(|L12|, |L21|).
  double symmetry_rtol = 1e-8;
  double symmetry_atol = 0.0;
};

/// Coupling coefficient and inductances derived from a 2x2 capacitance matrix.
struct CouplingResult {
  bool success = false;
  std::string error_message;

  double k = 0.0;   // Coupling coefficient M / sqrt(L11 * L22)
  double L11 = 0.0; // Self-inductance of conductor 1 (H)
  double L22 = 0.0; // Self-inductance of conductor 2 (H)
  double M = 0.0;   // Mutual inductance L12 (H)
  Eigen::Matrix2d L = Eigen::Matrix2d::Zero();

  double mu0_eps0 = 0.0;      // mu0 * eps0 as used for scaling
  double inv_c_squared = 0.0; // 1 / c0^2, cross-check of mu0_eps0

  std::vector<Diagnostic> diagnostics;

  bool has_diagnostic(DiagnosticKind kind) const {
    for (const auto &d : diagnostics) {
      if (d.kind == kind)
        return true;
    }
    return false;
  }
};

/// Compute the mutual coupling coefficient between two conductors using the
/// TEM approximation [L] = mu0*eps0*[C]^-1.
///
/// A singular capacitance matrix is not an exception: the result has
/// success == false, an error message and a SingularMatrix diagnostic, and
/// carries no inductance values.
/// @param C 2x2 capacitance matrix in farads
/// @param opt Tolerances for the singularity and symmetry checks
/// @return CouplingResult with k, L11, L22, M and the diagnostics emitted
/// @throws std::invalid_argument if any entry of C is NaN or infinite
CouplingResult compute_coupling(const Eigen::Matrix2d &C,
                                const CouplingOptions &opt = CouplingOptions());

/// Dynamic-size overload for callers holding an Eigen::MatrixXd.
/// @throws std::invalid_argument if C is not 2x2 or has non-finite entries
CouplingResult compute_coupling(const Eigen::MatrixXd &C,
                                const CouplingOptions &opt = CouplingOptions());

/// Inductance matrix mu0*eps0*C^-1.
/// @throws std::runtime_error if C is singular
Eigen::Matrix2d inductance_matrix(const Eigen::Matrix2d &C,
                                  double singular_tolerance = 1e-14);

/// Capacitance matrix mu0*eps0*L^-1, the inverse of inductance_matrix().
/// @throws std::runtime_error if L is singular
Eigen::Matrix2d capacitance_from_inductance(const Eigen::Matrix2d &L,
                                            double singular_tolerance = 1e-14);

/// Check that a matrix is symmetric (reciprocal) within a relative tolerance.
bool is_reciprocal(const Eigen::MatrixXd &M, double tolerance = 1e-8);

/// Extract the 2x2 capacitance sub-matrix for conductors i and j from an
/// NxN capacitance matrix: [[Cii, Cij], [Cji, Cjj]].
/// @throws std::invalid_argument if C is not square, an index is out of
/// range, or i == j
Eigen::Matrix2d extract_conductor_pair(const Eigen::MatrixXd &C, int i, int j);

} // namespace tlcouple
