#pragma once

#include <string>

namespace tlcouple {

/// Qualitative strength of magnetic coupling, ordered weakest first.
enum class CouplingBand { VeryWeak, Weak, Moderate, Strong, VeryStrong };

/// Classify |k| into a coupling band.
/// Thresholds are 0.01, 0.3, 0.7 and 0.9 with strict less-than comparisons,
/// so a value exactly on a threshold falls into the stronger band.
CouplingBand classify_coupling(double k);

/// Short label of a band, e.g. "very weak".
std::string band_name(CouplingBand band);

/// Interpretation sentence printed in reports.
std::string band_description(CouplingBand band);

/// True when |k| <= 1. A NaN coefficient is never plausible.
bool is_physically_plausible(double k);

} // namespace tlcouple
