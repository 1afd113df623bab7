#pragma once
#include "Photometry.hpp"
#include "SpectralModel.hpp"
#include "Types.hpp"

namespace mbbfit {

/*  Flat box prior + Gaussian likelihood for θ = (log N, T[, β]).
 *  β is sampled only if θ has three components; otherwise fixed_beta is
 *  used.  Photometry is validated and masked at construction.              */
class PosteriorModel {
public:
    static constexpr double kTempMin = 10.0;     // K, exclusive
    static constexpr double kTempMax = 100.0;
    static constexpr double kBetaMin = 0.1;      // exclusive
    static constexpr double kBetaMax = 5.0;

    PosteriorModel(const Photometry& phot,
                   double            z,
                   ModelVariant      variant,
                   double            fixed_beta);

    double log_prior(const Vector& theta) const;
    double log_likelihood(const Vector& theta) const;
    double log_posterior(const Vector& theta) const;

    double operator()(const Vector& theta) const { return log_posterior(theta); }

    MbbParams params_from(const Vector& theta) const;

    const Photometry&    photometry() const { return phot_; }
    const SpectralModel& model()      const { return model_; }
    double               redshift()   const { return z_; }

private:
    Photometry    phot_;          // usable rows only
    double        z_;
    double        eval_z_;        // 0 for rest-frame photometry
    SpectralModel model_;
    double        fixed_beta_;
};

} // namespace mbbfit
