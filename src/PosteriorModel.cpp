#include "mbbfit/PosteriorModel.hpp"
#include "mbbfit/Errors.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace mbbfit {

namespace {
constexpr double kNegInf = -std::numeric_limits<double>::infinity();
}

PosteriorModel::PosteriorModel(const Photometry& phot,
                               double            z,
                               ModelVariant      variant,
                               double            fixed_beta)
    : phot_(phot.usable())
    , z_(z)
    , eval_z_(phot.frame == PhotometryFrame::Observed ? z : 0.0)
    , model_(variant)
    , fixed_beta_(fixed_beta)
{
}

MbbParams PosteriorModel::params_from(const Vector& theta) const
{
    if (theta.size() != 2 && theta.size() != 3)
        throw std::invalid_argument("PosteriorModel: parameter vector must have 2 or 3 entries");
    return {theta[0], theta[1], theta.size() > 2 ? theta[2] : fixed_beta_};
}

double PosteriorModel::log_prior(const Vector& theta) const
{
    if (theta.size() != 2 && theta.size() != 3)
        throw std::invalid_argument("PosteriorModel: parameter vector must have 2 or 3 entries");

    const double T = theta[1];
    if (!(T > kTempMin && T < kTempMax)) return kNegInf;

    if (theta.size() > 2) {
        const double beta = theta[2];
        if (!(beta > kBetaMin && beta < kBetaMax)) return kNegInf;
    }
    return 0.0;
}

double PosteriorModel::log_likelihood(const Vector& theta) const
{
    Vector ymodel;
    try {
        ymodel = model_.evaluate(params_from(theta), phot_.lambda, eval_z_);
    } catch (const ModelEvaluationError&) {
        return kNegInf;
    }

    const double chi2 = ((phot_.flux - ymodel).array() / phot_.sigma.array()).square().sum();
    const double lnlike = -0.5 * chi2;
    return std::isfinite(lnlike) ? lnlike : kNegInf;
}

double PosteriorModel::log_posterior(const Vector& theta) const
{
    const double lp = log_prior(theta);
    if (!std::isfinite(lp)) return kNegInf;
    return lp + log_likelihood(theta);
}

} // namespace mbbfit
