#pragma once
#include "LuminosityIntegrator.hpp"
#include "SpectralModel.hpp"
#include "Types.hpp"
#include <cstdint>
#include <random>

namespace mbbfit {

// 16th / 50th / 84th percentile of every chain column
struct PosteriorSummary {
    Vector p16;
    Vector p50;
    Vector p84;
};

struct PredictiveBand {
    Vector wavelength;   // µm
    Vector median;       // Jy
    Vector lower;        // 16th percentile
    Vector upper;        // 84th percentile
};

class PosteriorSummarizer {
public:
    /*  fixed_beta is used for two-column chains (β not sampled)           */
    PosteriorSummarizer(const SpectralModel& model,
                        double               fixed_beta,
                        std::uint64_t        seed = 0);

    /*  q in [0,100], linear interpolation between order statistics        */
    static double percentile(Vector values, double q);

    static PosteriorSummary summarize(const Matrix& chain);

    /*  Draw sample_count chain rows uniformly with replacement, evaluate
     *  the model at the given wavelengths (frame of redshift z) and reduce
     *  to the 16/50/84th percentile curve.                                */
    PredictiveBand predictive_band(const Matrix& chain,
                                   const Vector& wavelengths,
                                   int           sample_count = 200,
                                   double        z = 0.0);

    /*  log10 L_IR of every thin-th chain row                              */
    Vector derived_log_luminosity(const Matrix&               chain,
                                  const LuminosityIntegrator& integrator,
                                  double                      z,
                                  int                         thin = 10) const;

private:
    MbbParams params_from_row(const Matrix& chain, Eigen::Index row) const;

    SpectralModel   model_;
    double          fixed_beta_;
    std::mt19937_64 rng_;
};

} // namespace mbbfit
