#include "tlcouple/coupling.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "tlcouple/constants.hpp"

namespace tlcouple {

namespace {

std::string format_value(double value, int precision) {
  std::ostringstream ss;
  ss << std::scientific << std::setprecision(precision) << value;
  return ss.str();
}

// Relative determinant test. An absolute threshold would flag every
// farad-scale matrix (entries ~1e-10, det ~1e-20) as singular.
bool is_singular(const Eigen::Matrix2d &A, double tolerance) {
  double det = A.determinant();
  double scale = std::abs(A(0, 0) * A(1, 1)) + std::abs(A(0, 1) * A(1, 0));
  if (scale == 0.0) {
    return true;
  }
  return std::abs(det) <= tolerance * scale;
}

void require_finite(const Eigen::MatrixXd &C) {
  if (!C.allFinite()) {
    throw std::invalid_argument(
        "Capacitance matrix contains NaN or infinite entries");
  }
}

bool is_close(double a, double b, double rtol, double atol) {
  return std::abs(a - b) <= atol + rtol * std::max(std::abs(a), std::abs(b));
}

} // namespace

CouplingResult compute_coupling(const Eigen::Matrix2d &C,
                                const CouplingOptions &opt) {
  require_finite(C);

  CouplingResult res;

  // mu0*eps0 should equal 1/c^2; a mismatch is only reported.
  res.mu0_eps0 = constants::mu0_eps0;
  res.inv_c_squared = 1.0 / (constants::c0 * constants::c0);
  res.diagnostics.push_back(
      {DiagnosticKind::ConstantsCheck,
       "μ₀ε₀ = " + format_value(res.mu0_eps0, 17)});
  res.diagnostics.push_back(
      {DiagnosticKind::ConstantsCheck,
       "1/c² = " + format_value(res.inv_c_squared, 17)});

  if (is_singular(C, opt.singular_tolerance)) {
    res.error_message =
        "Capacitance matrix is singular and cannot be inverted.";
    res.diagnostics.push_back(
        {DiagnosticKind::SingularMatrix, res.error_message});
    return res;
  }

  // TEM approximation: [L] = mu0*eps0*[C]^-1
  res.L = res.mu0_eps0 * C.inverse();

  res.L11 = res.L(0, 0);
  res.L22 = res.L(1, 1);
  res.M = res.L(0, 1);

  if (!is_close(res.L(0, 1), res.L(1, 0), opt.symmetry_rtol,
                opt.symmetry_atol)) {
    res.diagnostics.push_back(
        {DiagnosticKind::AsymmetricMutual,
         "Mutual inductances L12 and L21 are not equal (L12 = " +
             format_value(res.L(0, 1), 6) +
             ", L21 = " + format_value(res.L(1, 0), 6) + ")."});
  }

  // No guard for L11*L22 <= 0; such input yields NaN.
  res.k = res.M / std::sqrt(res.L11 * res.L22);
  res.success = true;
  return res;
}

CouplingResult compute_coupling(const Eigen::MatrixXd &C,
                                const CouplingOptions &opt) {
  if (C.rows() != 2 || C.cols() != 2) {
    throw std::invalid_argument("Capacitance matrix must be 2x2, got " +
                                std::to_string(C.rows()) + "x" +
                                std::to_string(C.cols()));
  }
  Eigen::Matrix2d C2 = C;
  return compute_coupling(C2, opt);
}

Eigen::Matrix2d inductance_matrix(const Eigen::Matrix2d &C,
                                  double singular_tolerance) {
  require_finite(C);
  if (is_singular(C, singular_tolerance)) {
    throw std::runtime_error(
        "Capacitance matrix is singular and cannot be inverted");
  }
  return constants::mu0_eps0 * C.inverse();
}

Eigen::Matrix2d capacitance_from_inductance(const Eigen::Matrix2d &L,
                                            double singular_tolerance) {
  if (!L.allFinite()) {
    throw std::invalid_argument(
        "Inductance matrix contains NaN or infinite entries");
  }
  if (is_singular(L, singular_tolerance)) {
    throw std::runtime_error(
        "Inductance matrix is singular and cannot be inverted");
  }
  // The TEM relation is its own inverse: [C] = mu0*eps0*[L]^-1
  return constants::mu0_eps0 * L.inverse();
}

bool is_reciprocal(const Eigen::MatrixXd &M, double tolerance) {
  if (M.rows() != M.cols()) {
    return false;
  }
  return M.isApprox(M.transpose(), tolerance);
}

Eigen::Matrix2d extract_conductor_pair(const Eigen::MatrixXd &C, int i,
                                       int j) {
  if (C.rows() != C.cols()) {
    throw std::invalid_argument("Capacitance matrix must be square");
  }
  int n = static_cast<int>(C.rows());
  if (i < 0 || i >= n || j < 0 || j >= n) {
    throw std::invalid_argument("Conductor index out of range for " +
                                std::to_string(n) + "-conductor matrix");
  }
  if (i == j) {
    throw std::invalid_argument("Conductor pair must name two distinct "
                                "conductors");
  }

  Eigen::Matrix2d pair;
  pair << C(i, i), C(i, j), C(j, i), C(j, j);
  return pair;
}

} // namespace tlcouple
