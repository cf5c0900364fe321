/// @file src/cosmology/cosmology.cpp
/// @brief Comoving-distance implementations.

#include "gwbkit/cosmology.hpp"
#include "gwbkit/constants.hpp"

#include <fmt/format.h>

#include <cmath>
#include <memory>
#include <stdexcept>

namespace gwbkit::cosmology {

using namespace gwbkit::constants;

namespace {

/// c / H0 in cm, with H0 given in km/s/Mpc.
[[nodiscard]] double hubble_distance_cm(double hubble_const) noexcept {
    const double h0_per_sec = hubble_const * 1.0e5 / MPC;
    return SPLC / h0_per_sec;
}

}  // namespace

// ─── Cosmology ────────────────────────────────────────────────────────────────

Cosmology::Cosmology(DistanceFunction dcom_fn)
    : dcom_fn_(std::move(dcom_fn)) {
    if (!dcom_fn_) {
        throw std::invalid_argument("Cosmology: distance function must not be empty");
    }
}

double Cosmology::comoving_distance(double redz) const {
    if (!(redz > 0.0)) {
        return 0.0;
    }
    return dcom_fn_(redz);
}

Cosmology Cosmology::make_flat_lcdm(double hubble_const, double omega_matter, double zmax) {
    // Shared so copies of the Cosmology do not duplicate the table.
    auto model = std::make_shared<const FlatLambdaCDM>(hubble_const, omega_matter, zmax);
    return Cosmology([model](double redz) { return (*model)(redz); });
}

Cosmology Cosmology::make_hubble_law(double hubble_const) {
    if (!(hubble_const > 0.0)) {
        throw std::invalid_argument(fmt::format(
            "Cosmology::make_hubble_law: H0 must be positive (got {})", hubble_const));
    }
    const double dh = hubble_distance_cm(hubble_const);
    return Cosmology([dh](double redz) { return dh * redz; });
}

// ─── FlatLambdaCDM ────────────────────────────────────────────────────────────

FlatLambdaCDM::FlatLambdaCDM(double hubble_const, double omega_matter, double zmax,
                             Eigen::Index table_size)
    : omega_matter_(omega_matter),
      hubble_distance_(hubble_distance_cm(hubble_const)),
      xmax_(std::log1p(zmax)) {
    if (!(hubble_const > 0.0)) {
        throw std::invalid_argument(fmt::format(
            "FlatLambdaCDM: H0 must be positive (got {})", hubble_const));
    }
    if (!(omega_matter > 0.0) || omega_matter > 1.0) {
        throw std::invalid_argument(fmt::format(
            "FlatLambdaCDM: Omega_m must lie in (0, 1] (got {})", omega_matter));
    }
    if (!(zmax > 0.0) || table_size < 2) {
        throw std::invalid_argument(fmt::format(
            "FlatLambdaCDM: need zmax > 0 and at least 2 table points (got {}, {})",
            zmax, table_size));
    }

    // Tabulate in x = ln(1+z), where dz / E(z) = e^x / E(e^x - 1) dx.
    xgrid_ = Eigen::ArrayXd::LinSpaced(table_size, 0.0, xmax_);
    Eigen::ArrayXd integrand(table_size);
    for (Eigen::Index i = 0; i < table_size; ++i) {
        const double zp1 = std::exp(xgrid_(i));
        integrand(i) = zp1 / efunc(zp1 - 1.0);
    }

    dcom_table_ = Eigen::ArrayXd::Zero(table_size);
    const double dx = xgrid_(1) - xgrid_(0);
    for (Eigen::Index i = 1; i < table_size; ++i) {
        dcom_table_(i) = dcom_table_(i - 1) + 0.5 * dx * (integrand(i - 1) + integrand(i));
    }
}

double FlatLambdaCDM::efunc(double redz) const noexcept {
    const double zp1 = 1.0 + redz;
    return std::sqrt(omega_matter_ * zp1 * zp1 * zp1 + (1.0 - omega_matter_));
}

double FlatLambdaCDM::operator()(double redz) const {
    if (!(redz > 0.0)) {
        return 0.0;
    }
    const double x = std::log1p(redz);
    if (x >= xmax_) {
        return hubble_distance_ * integrate(redz);
    }

    const Eigen::Index n = xgrid_.size();
    const double dx = xgrid_(1) - xgrid_(0);
    auto lo = static_cast<Eigen::Index>(x / dx);
    if (lo >= n - 1) lo = n - 2;
    const double frac = (x - xgrid_(lo)) / dx;
    const double val = dcom_table_(lo) + frac * (dcom_table_(lo + 1) - dcom_table_(lo));
    return hubble_distance_ * val;
}

double FlatLambdaCDM::integrate(double redz) const {
    // Composite Simpson rule in x = ln(1+z); the interval count must be even.
    constexpr int NSTEPS = 2048;
    const double x1 = std::log1p(redz);
    const double h = x1 / NSTEPS;
    auto f = [this](double x) {
        const double zp1 = std::exp(x);
        return zp1 / efunc(zp1 - 1.0);
    };

    double sum = f(0.0) + f(x1);
    for (int i = 1; i < NSTEPS; ++i) {
        sum += ((i % 2 == 1) ? 4.0 : 2.0) * f(h * i);
    }
    return sum * h / 3.0;
}

} // namespace gwbkit::cosmology
