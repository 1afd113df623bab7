#include "mbbfit/NormalizationCalibrator.hpp"
#include "mbbfit/Errors.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace mbbfit {

NormalizationCalibrator::NormalizationCalibrator(const LuminosityIntegrator& integrator,
                                                 const CalibrationOptions&   opt)
    : integrator_(integrator)
    , opt_(opt)
{
    if (!(opt_.tolerance > 0.0))
        throw std::invalid_argument("NormalizationCalibrator: tolerance must be positive");
    if (opt_.max_iterations < 1)
        throw std::invalid_argument("NormalizationCalibrator: max_iterations must be >= 1");
}

double NormalizationCalibrator::calibrate(double target_log_lum,
                                          double temperature,
                                          double beta,
                                          double z,
                                          int*   iterations) const
{
    auto residual = [&](double log_norm) {
        const double r = integrator_.log_luminosity({log_norm, temperature, beta}, z)
                       - target_log_lum;
        if (!std::isfinite(r)) {
            std::ostringstream s;
            s << "non-finite luminosity at logN=" << log_norm
              << " (T=" << temperature << ", beta=" << beta << ", z=" << z << ")";
            throw CalibrationNonConvergenceError(s.str());
        }
        return r;
    };

    double n_prev = opt_.initial_log_norm;
    double f_prev = residual(n_prev);
    if (iterations) *iterations = 1;
    if (std::abs(f_prev) < opt_.tolerance) return n_prev;

    /*  unit-slope first step, then secant                                 */
    double n_curr = n_prev - f_prev;

    for (int it = 1; it < opt_.max_iterations; ++it) {
        const double f_curr = residual(n_curr);
        if (iterations) *iterations = it + 1;

        if (opt_.verbose)
            std::cout << "[Calib] it " << it << "  logN = " << n_curr
                      << "  dlogL = " << f_curr << '\n';

        if (std::abs(f_curr) < opt_.tolerance) return n_curr;

        const double df = f_curr - f_prev;
        if (df == 0.0) {
            std::ostringstream s;
            s << "calibration stalled at logN=" << n_curr
              << " (luminosity insensitive to normalization, dlogL=" << f_curr << ")";
            throw CalibrationNonConvergenceError(s.str());
        }

        const double n_next = n_curr - f_curr * (n_curr - n_prev) / df;
        n_prev = n_curr;
        f_prev = f_curr;
        n_curr = n_next;
    }

    std::ostringstream s;
    s << "calibration did not reach log L = " << target_log_lum
      << " within " << opt_.max_iterations << " iterations (T=" << temperature
      << ", beta=" << beta << ", z=" << z << ")";
    throw CalibrationNonConvergenceError(s.str());
}

} // namespace mbbfit
