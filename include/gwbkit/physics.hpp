#pragma once

/// @file include/gwbkit/physics.hpp
/// @brief Kepler and gravitational-wave physics primitives.
///
/// # Module: Physics Primitives
///
/// ## Responsibility
/// Closed-form relations between orbital separation, orbital frequency,
/// redshift, chirp mass and GW strain, the eccentric-harmonic power
/// distribution g(n,e), and the "lambda factor" that converts a hardening
/// rate into a number of binaries per log-frequency interval.
///
/// ## Conventions
/// - cgs units throughout: cm, g, s.
/// - "orbital" frequencies are Kepler frequencies, GW frequencies of the
///   n-th harmonic are `n * f_orb`.
/// - `frst` is rest-frame, `fobs` is observer-frame: `fobs = frst / (1+z)`.
///
/// ## Guarantees
/// - All functions are pure and `noexcept`.
/// - Non-positive separations or masses produce NaN/Inf rather than errors;
///   callers are responsible for sanitising their inputs.
///
/// ## NOT Responsible For
/// - Cosmological distances (see include/gwbkit/cosmology.hpp)
/// - Track interpolation (see include/gwbkit/resampler.hpp)

#include "gwbkit/constants.hpp"

#include <optional>

namespace gwbkit::physics {

// ─── Kepler Relations ─────────────────────────────────────────────────────────

/// Rest-frame Kepler orbital frequency sqrt(G M) / (2 pi a^1.5) [Hz].
[[nodiscard]] double kepler_freq_from_sepa(double mtot, double sepa) noexcept;

/// Separation [cm] of a circular orbit with the given rest-frame orbital
/// frequency: (G M / (2 pi f)^2)^(1/3).
[[nodiscard]] double kepler_sepa_from_freq(double mtot, double freq) noexcept;

/// Observer-frame orbital frequency of a binary at redshift `redz`:
///
///     f = C sqrt(M) / a^1.5 / (1 + z),   C = sqrt(G) / (2 pi)
[[nodiscard]] double observed_frequency(double sepa, double mtot, double redz) noexcept;

/// Rest-frame frequency from an observer-frame frequency.
[[nodiscard]] double frst_from_fobs(double fobs, double redz) noexcept;

/// Observer-frame frequency from a rest-frame frequency.
[[nodiscard]] double fobs_from_frst(double frst, double redz) noexcept;

// ─── Masses ───────────────────────────────────────────────────────────────────

/// Chirp mass (m1 m2)^(3/5) / (m1 + m2)^(1/5).
[[nodiscard]] double chirp_mass(double m1, double m2) noexcept;

/// Total mass and mass ratio (q = min/max <= 1).
struct TotalMassRatio {
    double mtot;
    double mrat;
};

/// Component masses.
struct ComponentMasses {
    double m1;  ///< Primary (larger) mass
    double m2;  ///< Secondary mass
};

[[nodiscard]] TotalMassRatio  mtmr_from_m1m2(double m1, double m2) noexcept;
[[nodiscard]] ComponentMasses m1m2_from_mtmr(double mtot, double mrat) noexcept;

// ─── Radii and Timescales ─────────────────────────────────────────────────────

/// Schwarzschild radius 2 G M / c^2 [cm].
[[nodiscard]] double schwarzschild_radius(double mass) noexcept;

/// Inner-most stable circular orbit of the pair, `factor` Schwarzschild radii
/// of the total mass (3 by default).
[[nodiscard]] double rad_isco(double m1, double m2, double factor = 3.0) noexcept;

/// Time [s] for a circular binary to spiral in from `sepa` to its ISCO under
/// GW emission alone (Peters 1964).
[[nodiscard]] double time_to_merge_at_sepa(double m1, double m2, double sepa) noexcept;

// ─── GW Emission ──────────────────────────────────────────────────────────────

/// Sky- and polarisation-averaged strain amplitude of one circular source
/// (Sesana et al. 2004, Eq. 36):
///
///     h_s = 8 G^(5/3) pi^(2/3) / (sqrt(10) c^4) * Mc * (2 Mc f_orb)^(2/3) / d_c
///
/// # Arguments
/// * `mchirp`   — chirp mass [g]
/// * `dcom`     — comoving distance [cm]
/// * `frst_orb` — rest-frame orbital frequency [Hz]
[[nodiscard]] double gw_strain_source(double mchirp, double dcom, double frst_orb) noexcept;

/// Characteristic strain of one source observed for `dur_obs` seconds: the
/// source strain times the square root of the number of cycles spent near
/// `frst_orb`, clipped to the number of cycles the observation can see.
[[nodiscard]] double gw_char_strain(double hs, double dur_obs, double fobs_orb,
                                    double frst_orb, double dfdt) noexcept;

/// Frequency derivative implied by a separation derivative.
struct FrequencyDerivative {
    double dfdt;  ///< df/dt [Hz/s]
    double dfda;  ///< df/da = -(3/2) f / a  [Hz/cm]
};

/// Convert a hardening rate in separation into a hardening rate in
/// frequency via the derivative of the Kepler relation.
[[nodiscard]] FrequencyDerivative
dfdt_from_dadt(double dadt, double sepa, double frst_orb) noexcept;

/// Peters (1964) eccentricity enhancement F(e) of GW power.
[[nodiscard]] double gw_ecc_func(double eccen) noexcept;

/// GW-driven hardening rate da/dt [cm/s] (Peters 1964, Eq. 5.6). Negative.
[[nodiscard]] double gw_hardening_rate_dadt(double m1, double m2, double sepa,
                                            double eccen = 0.0) noexcept;

/// GW-driven eccentricity evolution de/dt [1/s] (Peters 1964, Eq. 5.8).
/// Same sign as da/dt.
[[nodiscard]] double gw_dedt(double m1, double m2, double sepa, double eccen) noexcept;

/// GW-driven hardening rate in rest-frame orbital frequency df/dt [Hz/s].
[[nodiscard]] double gw_hardening_rate_dfdt(double m1, double m2, double frst_orb,
                                            double eccen = 0.0) noexcept;

/// Fraction of total GW power radiated into the n-th harmonic of the orbital
/// frequency, g(n, e) (Peters & Mathews 1963, Eq. 20).
///
/// Summed over all n, g(n, e) equals `gw_ecc_func(e)`.
///
/// For `eccen < min_eccen` the binary is treated as circular: g = 1 for
/// n = 2 and 0 otherwise.  Returns 0 for n < 1.
[[nodiscard]] double eccentricity_harmonic_weight(
    int n, double eccen,
    double min_eccen = constants::DEFAULT_MIN_ECCEN_CIRCULAR) noexcept;

/// Number of binaries per unit log-frequency per unit comoving volume implied
/// by the local hardening rate (times the survey volume):
///
///     lambda = 4 pi c (1 + z) d_c^2 * f_rst / (df/dt)
///
/// # Returns
/// - `nullopt` when `dfdt` is exactly zero (a stalled binary) or the result
///   is not finite
[[nodiscard]] std::optional<double>
lambda_factor_dlnf(double frst_orb, double dfdt, double redz, double dcom) noexcept;

} // namespace gwbkit::physics
