#pragma once

/// @file include/gwbkit/cosmology.hpp
/// @brief Cosmological distance interface.
///
/// # Module: Cosmology
///
/// ## Responsibility
/// Map redshift to comoving distance for the strain and occupation
/// calculations. The rest of the library only ever sees a pure function
/// `z -> d_c(z)`, so callers may plug in any cosmology they like.
///
/// ## Guarantees
/// - `comoving_distance` is const and safe to call concurrently.
/// - `comoving_distance(z)` returns 0 for `z <= 0`.
///
/// ## NOT Responsible For
/// - Lookback times, ages or luminosity distances of external collaborators.

#include "gwbkit/constants.hpp"

#include <Eigen/Dense>

#include <functional>

namespace gwbkit::cosmology {

/// A callable mapping redshift to comoving distance [cm].
using DistanceFunction = std::function<double(double)>;

// ─── Cosmology ────────────────────────────────────────────────────────────────

/// Wraps a comoving-distance function.
///
/// # Example
/// ```cpp
/// auto cosmo = gwbkit::cosmology::Cosmology::make_flat_lcdm();
/// double dc  = cosmo.comoving_distance(1.0);   // ~1.05e28 cm
/// ```
class Cosmology {
public:
    /// Construct from an arbitrary distance function.
    explicit Cosmology(DistanceFunction dcom_fn);

    /// Comoving distance [cm] at redshift `redz`; 0 for `redz <= 0`.
    [[nodiscard]] double comoving_distance(double redz) const;

    // ── Factories ────────────────────────────────────────────────────────────

    /// Flat Lambda-CDM (radiation neglected):
    ///
    ///     d_c(z) = (c / H0) * integral_0^z dz' / sqrt(Om (1+z')^3 + 1 - Om)
    ///
    /// The integral is tabulated once in ln(1+z) up to `zmax` and linearly
    /// interpolated; larger redshifts are integrated directly.
    ///
    /// # Arguments
    /// * `hubble_const` — H0 [km/s/Mpc]
    /// * `omega_matter` — present-day matter density parameter, in (0, 1]
    /// * `zmax`         — upper end of the lookup table
    ///
    /// # Throws
    /// `std::invalid_argument` for non-positive H0, Om outside (0, 1] or
    /// non-positive zmax.
    [[nodiscard]] static Cosmology
    make_flat_lcdm(double hubble_const = constants::DEFAULT_HUBBLE_CONST,
                   double omega_matter = constants::DEFAULT_OMEGA_MATTER,
                   double zmax = 100.0);

    /// Low-redshift Hubble law d_c = c z / H0; handy for analytic checks.
    [[nodiscard]] static Cosmology
    make_hubble_law(double hubble_const = constants::DEFAULT_HUBBLE_CONST);

private:
    DistanceFunction dcom_fn_;
};

// ─── FlatLambdaCDM ────────────────────────────────────────────────────────────

/// Tabulated flat Lambda-CDM comoving distance.
class FlatLambdaCDM {
public:
    FlatLambdaCDM(double hubble_const, double omega_matter, double zmax,
                  Eigen::Index table_size = 4096);

    /// Comoving distance [cm].
    [[nodiscard]] double operator()(double redz) const;

    /// Dimensionless Hubble rate E(z) = H(z) / H0.
    [[nodiscard]] double efunc(double redz) const noexcept;

    /// Hubble distance c / H0 [cm].
    [[nodiscard]] double hubble_distance() const noexcept { return hubble_distance_; }

private:
    /// Direct Simpson integration of 1/E(z) from 0 to `redz`.
    [[nodiscard]] double integrate(double redz) const;

    double omega_matter_;
    double hubble_distance_;
    double xmax_;                 ///< ln(1 + zmax)
    Eigen::ArrayXd xgrid_;        ///< ln(1 + z) sample points
    Eigen::ArrayXd dcom_table_;   ///< d_c / d_H at each sample point
};

} // namespace gwbkit::cosmology
