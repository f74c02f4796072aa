#pragma once

#include <cmath>

namespace tlcouple {
namespace constants {

constexpr double mu0 = 4.0 * M_PI * 1e-7; // permeability of free space (H/m)
constexpr double eps0 = 8.85418782e-12;   // permittivity of free space (F/m)
constexpr double c0 = 299792458.0;        // speed of light in vacuum (m/s)

/// Scale factor of the TEM relation [L] = mu0*eps0*[C]^-1 (s^2/m^2).
constexpr double mu0_eps0 = mu0 * eps0;

} // namespace constants
} // namespace tlcouple
