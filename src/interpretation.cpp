#include "tlcouple/interpretation.hpp"

#include <cmath>

namespace tlcouple {

CouplingBand classify_coupling(double k) {
  double mag = std::abs(k);
  if (mag < 0.01)
    return CouplingBand::VeryWeak;
  if (mag < 0.3)
    return CouplingBand::Weak;
  if (mag < 0.7)
    return CouplingBand::Moderate;
  if (mag < 0.9)
    return CouplingBand::Strong;
  return CouplingBand::VeryStrong;
}

std::string band_name(CouplingBand band) {
  switch (band) {
  case CouplingBand::VeryWeak:
    return "very weak";
  case CouplingBand::Weak:
    return "weak";
  case CouplingBand::Moderate:
    return "moderate";
  case CouplingBand::Strong:
    return "strong";
  case CouplingBand::VeryStrong:
    return "very strong";
  }
  return "unknown";
}

std::string band_description(CouplingBand band) {
  switch (band) {
  case CouplingBand::VeryWeak:
    return "Very weak coupling between the conductors.";
  case CouplingBand::Weak:
    return "Weak coupling between the conductors.";
  case CouplingBand::Moderate:
    return "Moderate coupling between the conductors.";
  case CouplingBand::Strong:
    return "Strong coupling between the conductors.";
  case CouplingBand::VeryStrong:
    return "Very strong coupling, approaching ideal coupling.";
  }
  return "Unknown coupling band.";
}

bool is_physically_plausible(double k) { return std::abs(k) <= 1.0; }

} // namespace tlcouple
