#pragma once
#include "LuminosityIntegrator.hpp"

namespace mbbfit {

struct CalibrationOptions {
    double initial_log_norm = 11.0;
    double tolerance        = 1e-4;     // dex
    int    max_iterations   = 10000;
    bool   verbose          = false;
};

/*  Find log N such that   log10 L(N, T, β, z) = target .
 *
 *  L ∝ 10^N for fixed T, β, z, so f(N) = log10 L − target is strictly
 *  increasing (slope one in exact arithmetic).  The secant iteration starts
 *  with a unit-slope step from initial_log_norm and normally converges in one
 *  or two evaluations; max_iterations bounds it if rounding ever breaks
 *  monotonicity.  Throws CalibrationNonConvergenceError.                    */
class NormalizationCalibrator {
public:
    NormalizationCalibrator(const LuminosityIntegrator& integrator,
                            const CalibrationOptions&   opt = {});

    /*  iterations, if given, receives the number of luminosity
     *  evaluations used.  No state is written: one calibrator may be shared
     *  between threads.                                                    */
    double calibrate(double target_log_lum,
                     double temperature,
                     double beta,
                     double z,
                     int*   iterations = nullptr) const;

private:
    const LuminosityIntegrator& integrator_;
    CalibrationOptions          opt_;
};

} // namespace mbbfit
