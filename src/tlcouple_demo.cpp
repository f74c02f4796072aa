#include <iostream>

#include <Eigen/Core>

#include "tlcouple/coupling.hpp"
#include "tlcouple/report.hpp"

int main() {
  // Capacitance matrix of a 3-conductor system (F)
  const double C11 = 1.25e-10;
  const double C12 = -4.90e-16;
  const double C13 = -1.25e-10;
  const double C21 = -4.90e-16;
  const double C22 = 1.23e-10;
  const double C23 = -1.22e-10;
  const double C33 = 1.25e-10;

  Eigen::MatrixXd C(3, 3);
  C << C11, C12, C13,
       C21, C22, C23,
       C13, C23, C33;

  // Only conductors 1 and 2 take part in the coupling calculation.
  Eigen::Matrix2d C_pair = tlcouple::extract_conductor_pair(C, 0, 1);

  tlcouple::write_report(std::cout, C_pair);
  return 0;
}
