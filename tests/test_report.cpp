#include <Eigen/Dense>
#include <cassert>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>

#include "tlcouple/report.hpp"

using namespace tlcouple;

namespace {
bool contains(const std::string &text, const std::string &needle) {
  return text.find(needle) != std::string::npos;
}
} // namespace

void test_report_example() {
  std::cout << "test_report_example..." << std::endl;

  Eigen::Matrix2d C;
  C << 1.25e-10, -4.90e-16, -4.90e-16, 1.23e-10;

  std::ostringstream os;
  auto res = write_report(os, C);
  std::string out = os.str();

  assert(res.success);
  assert(contains(out, "Capacitance Matrix (2×2 submatrix):"));
  assert(contains(out, "μ₀ε₀ = "));
  assert(contains(out, "1/c² = "));
  assert(contains(out, "Results:"));
  assert(contains(out, "Self-inductance of conductor 1 (L11) = "));
  assert(contains(out, "Coupling coefficient (k) = 3.951"));
  assert(contains(out, "e-06"));
  assert(contains(out, "Interpretation: Very weak coupling between the "
                       "conductors."));
  assert(!contains(out, "physically impossible"));
  assert(!contains(out, "Warning:"));

  std::cout << out;
}

void test_report_singular_skips_results() {
  std::cout << "test_report_singular_skips_results..." << std::endl;

  Eigen::Matrix2d C;
  C << 1.0, 1.0, 1.0, 1.0;

  std::ostringstream os;
  auto res = write_report(os, C);
  std::string out = os.str();

  assert(!res.success);
  assert(contains(out, "Error: Capacitance matrix is singular"));
  assert(!contains(out, "Results:"));
  assert(!contains(out, "Interpretation:"));

  std::cout << "  Results block skipped" << std::endl;
}

void test_report_implausible_k() {
  std::cout << "test_report_implausible_k..." << std::endl;

  // |C12| > sqrt(C11 * C22) gives |k| = 2
  Eigen::Matrix2d C;
  C << 1.0, 2.0, 2.0, 1.0;

  std::ostringstream os;
  auto res = write_report(os, C);
  std::string out = os.str();

  assert(res.success);
  assert(std::abs(std::abs(res.k) - 2.0) < 1e-12);
  assert(contains(out, "Warning: |k| > 1, which is physically impossible."));
  assert(contains(out, "This suggests an error in the data or calculations."));

  std::cout << "  Implausibility warning emitted for k = " << res.k
            << std::endl;
}

void test_report_strong_no_implausibility() {
  std::cout << "test_report_strong_no_implausibility..." << std::endl;

  Eigen::Matrix2d C;
  C << 1.0e-10, -0.95e-10, -0.95e-10, 1.0e-10;

  std::ostringstream os;
  write_report(os, C);
  std::string out = os.str();

  assert(contains(out, "Interpretation: Very strong coupling"));
  assert(!contains(out, "physically impossible"));
}

void test_report_asymmetric_warning() {
  std::cout << "test_report_asymmetric_warning..." << std::endl;

  Eigen::Matrix2d C;
  C << 1.0e-10, -1.0e-11, -2.0e-11, 1.0e-10;

  std::ostringstream os;
  write_report(os, C);
  std::string out = os.str();

  assert(contains(out, "Warning: Mutual inductances L12 and L21 are not "
                       "equal"));
  assert(contains(out, "Results:"));
}

void test_report_quiet_diagnostics() {
  std::cout << "test_report_quiet_diagnostics..." << std::endl;

  Eigen::Matrix2d C;
  C << 1.25e-10, -4.90e-16, -4.90e-16, 1.23e-10;

  ReportOptions opt;
  opt.print_diagnostics = false;
  opt.precision = 3;

  std::ostringstream os;
  write_report(os, C, opt);
  std::string out = os.str();

  assert(!contains(out, "μ₀ε₀"));
  assert(contains(out, "Coupling coefficient (k) = 3.952e-06"));
}

int main() {
  test_report_example();
  test_report_singular_skips_results();
  test_report_implausible_k();
  test_report_strong_no_implausibility();
  test_report_asymmetric_warning();
  test_report_quiet_diagnostics();
  std::cout << "All report tests passed!" << std::endl;
  return 0;
}
