/// @file src/physics/kepler_gw.cpp
/// @brief Kepler relations, GW strain and hardening-rate conversions.

#include "gwbkit/physics.hpp"
#include "gwbkit/constants.hpp"

#include <algorithm>
#include <cmath>

namespace gwbkit::physics {

using namespace gwbkit::constants;

namespace {

// sqrt(G) / (2 pi)
const double KEPLER_FREQ_CONST = std::sqrt(NWTG) / (2.0 * PI);

// Sesana+2004 Eq. 36
const double GW_SRC_CONST = 8.0 * std::pow(NWTG, 5.0 / 3.0) * std::pow(PI, 2.0 / 3.0)
                            / std::sqrt(10.0) / std::pow(SPLC, 4.0);

// Peters 1964 Eq. 5.6 and 5.8
const double GW_DADT_SEP_CONST = -64.0 * std::pow(NWTG, 3.0) / 5.0 / std::pow(SPLC, 5.0);
const double GW_DEDT_ECC_CONST = -304.0 * std::pow(NWTG, 3.0) / 15.0 / std::pow(SPLC, 5.0);

}  // namespace

// ─── Kepler Relations ─────────────────────────────────────────────────────────

double kepler_freq_from_sepa(double mtot, double sepa) noexcept {
    return KEPLER_FREQ_CONST * std::sqrt(mtot) / std::pow(sepa, 1.5);
}

double kepler_sepa_from_freq(double mtot, double freq) noexcept {
    const double w = 2.0 * PI * freq;
    return std::cbrt(NWTG * mtot / (w * w));
}

double observed_frequency(double sepa, double mtot, double redz) noexcept {
    return KEPLER_FREQ_CONST * std::sqrt(mtot) / std::pow(sepa, 1.5) / (1.0 + redz);
}

double frst_from_fobs(double fobs, double redz) noexcept {
    return fobs * (1.0 + redz);
}

double fobs_from_frst(double frst, double redz) noexcept {
    return frst / (1.0 + redz);
}

// ─── Masses ───────────────────────────────────────────────────────────────────

double chirp_mass(double m1, double m2) noexcept {
    return std::pow(m1 * m2, 3.0 / 5.0) / std::pow(m1 + m2, 1.0 / 5.0);
}

TotalMassRatio mtmr_from_m1m2(double m1, double m2) noexcept {
    return TotalMassRatio{
        .mtot = m1 + m2,
        .mrat = std::min(m1, m2) / std::max(m1, m2),
    };
}

ComponentMasses m1m2_from_mtmr(double mtot, double mrat) noexcept {
    const double m1 = mtot / (1.0 + mrat);
    return ComponentMasses{.m1 = m1, .m2 = mtot - m1};
}

// ─── Radii and Timescales ─────────────────────────────────────────────────────

double schwarzschild_radius(double mass) noexcept {
    return SCHW * mass;
}

double rad_isco(double m1, double m2, double factor) noexcept {
    return factor * schwarzschild_radius(m1 + m2);
}

double time_to_merge_at_sepa(double m1, double m2, double sepa) noexcept {
    const double a1 = rad_isco(m1, m2);
    const double delta = std::pow(sepa, 4.0) - std::pow(a1, 4.0);
    return delta / (-GW_DADT_SEP_CONST * m1 * m2 * (m1 + m2));
}

// ─── GW Emission ──────────────────────────────────────────────────────────────

double gw_strain_source(double mchirp, double dcom, double frst_orb) noexcept {
    return GW_SRC_CONST * mchirp * std::pow(2.0 * mchirp * frst_orb, 2.0 / 3.0) / dcom;
}

double gw_char_strain(double hs, double dur_obs, double fobs_orb,
                      double frst_orb, double dfdt) noexcept {
    // Number of cycles near f, limited by what the observation can resolve.
    double ncycles = frst_orb * frst_orb / dfdt;
    ncycles = std::min(ncycles, dur_obs * fobs_orb);
    return hs * std::sqrt(ncycles);
}

FrequencyDerivative dfdt_from_dadt(double dadt, double sepa, double frst_orb) noexcept {
    const double dfda = -1.5 * (frst_orb / sepa);
    return FrequencyDerivative{.dfdt = dfda * dadt, .dfda = dfda};
}

double gw_ecc_func(double eccen) noexcept {
    const double e2 = eccen * eccen;
    const double num = 1.0 + (73.0 / 24.0) * e2 + (37.0 / 96.0) * e2 * e2;
    const double den = std::pow(1.0 - e2, 7.0 / 2.0);
    return num / den;
}

double gw_hardening_rate_dadt(double m1, double m2, double sepa, double eccen) noexcept {
    double dadt = GW_DADT_SEP_CONST * m1 * m2 * (m1 + m2) / std::pow(sepa, 3.0);
    if (eccen != 0.0) {
        dadt *= gw_ecc_func(eccen);
    }
    return dadt;
}

double gw_dedt(double m1, double m2, double sepa, double eccen) noexcept {
    const double e2 = eccen * eccen;
    double dedt = GW_DEDT_ECC_CONST * m1 * m2 * (m1 + m2) / std::pow(sepa, 4.0);
    dedt *= (1.0 + e2 * 121.0 / 304.0) * eccen / std::pow(1.0 - e2, 5.0 / 2.0);
    return dedt;
}

double gw_hardening_rate_dfdt(double m1, double m2, double frst_orb, double eccen) noexcept {
    const double sepa = kepler_sepa_from_freq(m1 + m2, frst_orb);
    const double dadt = gw_hardening_rate_dadt(m1, m2, sepa, eccen);
    return dfdt_from_dadt(dadt, sepa, frst_orb).dfdt;
}

// ─── Occupation ───────────────────────────────────────────────────────────────

std::optional<double>
lambda_factor_dlnf(double frst_orb, double dfdt, double redz, double dcom) noexcept {
    if (dfdt == 0.0) {
        return std::nullopt;
    }
    // Volume factor: comoving shell per unit light-travel time.
    const double vfac = 4.0 * PI * SPLC * (1.0 + redz) * dcom * dcom;
    // Time factor: rest-frame residence time per unit ln f.
    const double tfac = frst_orb / dfdt;
    const double lambda = vfac * tfac;
    if (!std::isfinite(lambda)) {
        return std::nullopt;
    }
    return lambda;
}

} // namespace gwbkit::physics
