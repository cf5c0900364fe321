/// @file src/physics/harmonics.cpp
/// @brief GW power distribution over eccentric-orbit harmonics, g(n, e).

#include "gwbkit/physics.hpp"

#include <gsl/gsl_errno.h>
#include <gsl/gsl_sf_bessel.h>

#include <limits>

namespace gwbkit::physics {

namespace {

/// J_k(n e) from GSL, any sign of k. GSL's default handler aborts on range
/// errors, so it is switched off once and the status is checked instead;
/// underflow of high orders at small argument is an exact zero here.
[[nodiscard]] double bessel_j(int k, double x) noexcept {
    static gsl_error_handler_t* const previous = gsl_set_error_handler_off();
    (void)previous;

    gsl_sf_result result;
    const int status = gsl_sf_bessel_Jn_e(k, x, &result);
    if (status == GSL_SUCCESS) {
        return result.val;
    }
    if (status == GSL_EUNDRFLW) {
        return 0.0;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

}  // namespace

double eccentricity_harmonic_weight(int n, double eccen, double min_eccen) noexcept {
    if (n < 1) {
        return 0.0;
    }
    // Circular limit: the harmonic series is numerically unstable as e -> 0.
    if (eccen < min_eccen) {
        return (n == 2) ? 1.0 : 0.0;
    }
    if (!(eccen < 1.0)) {
        return 0.0;
    }

    const double nn = static_cast<double>(n);
    const double ne = nn * eccen;
    const double jm2 = bessel_j(n - 2, ne);
    const double jm1 = bessel_j(n - 1, ne);
    const double j0  = bessel_j(n, ne);
    const double jp1 = bessel_j(n + 1, ne);
    const double jp2 = bessel_j(n + 2, ne);

    const double a = jm2 - 2.0 * eccen * jm1 + (2.0 / nn) * j0 + 2.0 * eccen * jp1 - jp2;
    const double b = jm2 - 2.0 * j0 + jp2;
    const double n2 = nn * nn;

    const double gg = (n2 * n2 / 32.0)
                    * (a * a + (1.0 - eccen * eccen) * b * b + (4.0 / (3.0 * n2)) * j0 * j0);
    return gg;
}

} // namespace gwbkit::physics
