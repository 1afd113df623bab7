#include "mbbfit/PosteriorSummarizer.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace mbbfit {

PosteriorSummarizer::PosteriorSummarizer(const SpectralModel& model,
                                         double               fixed_beta,
                                         std::uint64_t        seed)
    : model_(model)
    , fixed_beta_(fixed_beta)
    , rng_(seed != 0 ? seed : std::random_device{}())
{
}

double PosteriorSummarizer::percentile(Vector v, double q)
{
    const Eigen::Index n = v.size();
    if (n == 0)
        throw std::invalid_argument("percentile(): empty sample");
    if (!(q >= 0.0 && q <= 100.0))
        throw std::invalid_argument("percentile(): q must lie in [0,100]");

    std::sort(v.data(), v.data() + n);

    const double pos  = q / 100.0 * static_cast<double>(n - 1);
    const auto   lo   = static_cast<Eigen::Index>(std::floor(pos));
    const auto   hi   = std::min(lo + 1, n - 1);
    const double frac = pos - static_cast<double>(lo);
    return v[lo] + frac * (v[hi] - v[lo]);
}

PosteriorSummary PosteriorSummarizer::summarize(const Matrix& chain)
{
    if (chain.rows() == 0)
        throw std::invalid_argument("summarize(): empty chain");

    PosteriorSummary s;
    s.p16.resize(chain.cols());
    s.p50.resize(chain.cols());
    s.p84.resize(chain.cols());
    for (Eigen::Index d = 0; d < chain.cols(); ++d) {
        const Vector col = chain.col(d);
        s.p16[d] = percentile(col, 16.0);
        s.p50[d] = percentile(col, 50.0);
        s.p84[d] = percentile(col, 84.0);
    }
    return s;
}

MbbParams PosteriorSummarizer::params_from_row(const Matrix& chain, Eigen::Index row) const
{
    return {chain(row, 0), chain(row, 1), chain.cols() > 2 ? chain(row, 2) : fixed_beta_};
}

PredictiveBand PosteriorSummarizer::predictive_band(const Matrix& chain,
                                                    const Vector& wavelengths,
                                                    int           sample_count,
                                                    double        z)
{
    if (chain.rows() == 0 || chain.cols() < 2)
        throw std::invalid_argument("predictive_band(): chain needs rows and >= 2 columns");
    if (sample_count < 1)
        throw std::invalid_argument("predictive_band(): sample_count must be positive");

    /* ---- draws on this thread so the band is reproducible --------------- */
    std::uniform_int_distribution<Eigen::Index> pick(0, chain.rows() - 1);
    std::vector<Eigen::Index> draw(sample_count);
    for (auto& d : draw) d = pick(rng_);

    const Eigen::Index nwl = wavelengths.size();
    Matrix models(sample_count, nwl);

    std::exception_ptr failure;
    #pragma omp parallel for schedule(static) if (_OPENMP)
    for (int s = 0; s < sample_count; ++s) {
        try {
            models.row(s) = model_.evaluate(params_from_row(chain, draw[s]), wavelengths, z).transpose();
        } catch (...) {
            #pragma omp critical
            if (!failure) failure = std::current_exception();
        }
    }
    if (failure) std::rethrow_exception(failure);

    PredictiveBand band;
    band.wavelength = wavelengths;
    band.median.resize(nwl);
    band.lower.resize(nwl);
    band.upper.resize(nwl);
    for (Eigen::Index i = 0; i < nwl; ++i) {
        const Vector col = models.col(i);
        band.lower[i]  = percentile(col, 16.0);
        band.median[i] = percentile(col, 50.0);
        band.upper[i]  = percentile(col, 84.0);
    }
    return band;
}

Vector PosteriorSummarizer::derived_log_luminosity(const Matrix&               chain,
                                                   const LuminosityIntegrator& integrator,
                                                   double                      z,
                                                   int                         thin) const
{
    if (thin < 1)
        throw std::invalid_argument("derived_log_luminosity(): thin must be >= 1, got "
                                    + std::to_string(thin));

    const Eigen::Index n = (chain.rows() + thin - 1) / thin;
    Vector out(n);

    std::exception_ptr failure;
    #pragma omp parallel for schedule(dynamic, 16) if (_OPENMP)
    for (Eigen::Index i = 0; i < n; ++i) {
        try {
            out[i] = integrator.log_luminosity(params_from_row(chain, i * thin), z);
        } catch (...) {
            #pragma omp critical
            if (!failure) failure = std::current_exception();
        }
    }
    if (failure) std::rethrow_exception(failure);
    return out;
}

} // namespace mbbfit
