#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/gwbkit/constants.hpp
/// @brief Physical constants (cgs) and engine defaults for gwbkit.
///
/// Physical values follow CODATA 2018 / IAU 2015 nominal values.

namespace gwbkit::constants {

// ─── Physical Constants (cgs) ─────────────────────────────────────────────────

/// Newtonian gravitational constant [cm^3 g^-1 s^-2].
static constexpr double NWTG = 6.67430e-08;

/// Speed of light [cm s^-1].
static constexpr double SPLC = 2.99792458e+10;

/// Solar mass [g].
static constexpr double MSOL = 1.988409870698051e+33;

/// Parsec [cm].
static constexpr double PC = 3.0856775814913673e+18;

/// Megaparsec [cm].
static constexpr double MPC = 1.0e6 * PC;

/// Julian year [s].
static constexpr double YR = 3.15576e+07;

/// Schwarzschild radius per unit mass, 2G/c^2 [cm g^-1].
static constexpr double SCHW = 2.0 * NWTG / (SPLC * SPLC);

static constexpr double PI = 3.14159265358979323846;

// ─── Cosmology Defaults (Planck 2015) ─────────────────────────────────────────

/// Hubble constant [km s^-1 Mpc^-1].
static constexpr double DEFAULT_HUBBLE_CONST = 67.74;

/// Present-day matter density parameter (flat universe: Omega_L = 1 - Omega_m).
static constexpr double DEFAULT_OMEGA_MATTER = 0.3075;

// ─── Realization Engine Defaults ─────────────────────────────────────────────

/// Expected occupation above which Poisson draws are replaced by a Gaussian
/// with equal mean and variance.
static constexpr double DEFAULT_GAUSSIAN_THRESHOLD = 1e8;

/// Eccentricities below this value are treated as exactly circular: all GW
/// power is radiated in the n = 2 harmonic.
static constexpr double DEFAULT_MIN_ECCEN_CIRCULAR = 1e-4;

/// Default number of Monte-Carlo realizations.
static constexpr std::size_t DEFAULT_NREALS = 100;

/// Loudest single sources kept per frequency bin and realization.
static constexpr std::size_t DEFAULT_NLOUDEST = 5;

/// Default random seed for the realization streams.
static constexpr std::uint64_t DEFAULT_SEED = 20240917ULL;

/// Default comoving survey volume [cm^3]: a (100 Mpc)^3 box.
static constexpr double DEFAULT_SURVEY_VOLUME = MPC * MPC * MPC * 1.0e6;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace gwbkit::constants
