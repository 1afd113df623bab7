#include "mbbfit/ModifiedBlackbody.hpp"
#include "mbbfit/Errors.hpp"
#include "mbbfit/PosteriorModel.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace mbbfit {

void ModifiedBlackbody::check_physical(double temperature, double z)
{
    if (!(temperature > 0.0) || !std::isfinite(temperature))
        throw std::invalid_argument("ModifiedBlackbody: temperature must be positive");
    if (!(z > 0.0) || !std::isfinite(z))
        throw std::invalid_argument("ModifiedBlackbody: redshift must be positive");
}

ModifiedBlackbody::ModifiedBlackbody(double              log_lum,
                                     double              temperature,
                                     double              beta,
                                     double              z,
                                     ModelVariant        variant,
                                     const ModelOptions& opt)
    : opt_(opt)
    , model_(variant)
    , integrator_(model_, Cosmology(opt.cosmology), opt.integration)
    , log_norm_(opt.calibration.initial_log_norm)
    , temperature_(temperature)
    , beta_(beta)
    , z_(z)
    , log_lum_(0.0)
{
    check_physical(temperature, z);
    calibrate_and_assign(log_lum, temperature, beta);
}

ModifiedBlackbody::ModifiedBlackbody(NoCalibration, double log_norm, double temperature,
                                     double beta, double z, ModelVariant variant,
                                     const ModelOptions& opt)
    : opt_(opt)
    , model_(variant)
    , integrator_(model_, Cosmology(opt.cosmology), opt.integration)
    , log_norm_(log_norm)
    , temperature_(temperature)
    , beta_(beta)
    , z_(z)
    , log_lum_(0.0)
{
    check_physical(temperature, z);
    assign(log_norm, temperature, beta);
}

ModifiedBlackbody ModifiedBlackbody::from_normalization(double              log_norm,
                                                        double              temperature,
                                                        double              beta,
                                                        double              z,
                                                        ModelVariant        variant,
                                                        const ModelOptions& opt)
{
    return ModifiedBlackbody(NoCalibration{}, log_norm, temperature, beta, z, variant, opt);
}

void ModifiedBlackbody::assign(double log_norm, double temperature, double beta)
{
    check_physical(temperature, z_);
    const double lum = integrator_.log_luminosity({log_norm, temperature, beta}, z_);
    if (!std::isfinite(lum)) {
        std::ostringstream s;
        s << "luminosity is not finite for logN=" << log_norm << ", T=" << temperature
          << ", beta=" << beta;
        throw ModelEvaluationError(s.str());
    }
    log_norm_    = log_norm;
    temperature_ = temperature;
    beta_        = beta;
    log_lum_     = lum;
}

void ModifiedBlackbody::calibrate_and_assign(double log_lum, double temperature, double beta)
{
    check_physical(temperature, z_);
    const NormalizationCalibrator calib(integrator_, opt_.calibration);
    const double log_norm = calib.calibrate(log_lum, temperature, beta, z_);
    assign(log_norm, temperature, beta);
}

void ModifiedBlackbody::update(double log_norm, double temperature, double beta)
{
    assign(log_norm, temperature, beta);
    result_.reset();
}

void ModifiedBlackbody::update_L(double log_lum, double temperature, double beta)
{
    calibrate_and_assign(log_lum, temperature, beta);
    result_.reset();
}

void ModifiedBlackbody::fit(const Photometry& phot, const SamplerOptions& opt)
{
    const PosteriorModel posterior(phot, z_, model_.variant(), beta_);
    const bool fit_beta = posterior.photometry().size() >= 3;

    Vector init(fit_beta ? 3 : 2);
    if (fit_beta) init << log_norm_, temperature_, beta_;
    else          init << log_norm_, temperature_;

    if (opt.verbose)
        std::cout << "[mbbfit] fitting " << posterior.photometry().size()
                  << " photometric points, variant " << to_string(model_.variant())
                  << (fit_beta ? ", beta free" : ", beta fixed") << '\n';

    EnsembleSampler sampler([&posterior](const Vector& theta) {
                                return posterior.log_posterior(theta);
                            },
                            opt);
    FitResult result = sampler.run(init);
    result.fixed_beta = beta_;

    const PosteriorSummary s = PosteriorSummarizer::summarize(result.chain);
    assign(s.p50[0], s.p50[1], fit_beta ? s.p50[2] : beta_);
    result_ = std::move(result);

    if (opt.verbose)
        std::cout << "[mbbfit] logN = " << log_norm_ << ", T = " << temperature_
                  << " K, beta = " << beta_ << ", log L_IR = " << log_lum_ << '\n';
}

Vector ModifiedBlackbody::evaluate(const Vector& wavelengths, double z) const
{
    return model_.evaluate({log_norm_, temperature_, beta_}, wavelengths, z);
}

double ModifiedBlackbody::luminosity() const
{
    return integrator_.integrate({log_norm_, temperature_, beta_}, z_);
}

double ModifiedBlackbody::luminosity(const WavelengthBand& band) const
{
    return integrator_.integrate({log_norm_, temperature_, beta_}, z_, band);
}

const FitResult& ModifiedBlackbody::fit_result() const
{
    if (!result_)
        throw std::logic_error("ModifiedBlackbody: no fit has been run");
    return *result_;
}

PosteriorSummary ModifiedBlackbody::summary() const
{
    return PosteriorSummarizer::summarize(fit_result().chain);
}

PredictiveBand ModifiedBlackbody::predictive_band(const Vector& wavelengths,
                                                  int           sample_count,
                                                  double        z,
                                                  std::uint64_t seed) const
{
    const FitResult& r = fit_result();
    PosteriorSummarizer summarizer(model_, r.fixed_beta, seed);
    return summarizer.predictive_band(r.chain, wavelengths, sample_count, z);
}

Vector ModifiedBlackbody::derived_log_luminosity(int thin) const
{
    const FitResult& r = fit_result();
    const PosteriorSummarizer summarizer(model_, r.fixed_beta);
    return summarizer.derived_log_luminosity(r.chain, integrator_, z_, thin);
}

void ModifiedBlackbody::attach_fit(FitResult result)
{
    if (result.chain.cols() != 2 && result.chain.cols() != 3)
        throw std::invalid_argument("ModifiedBlackbody: chain must have 2 or 3 columns");
    result_ = std::move(result);
}

} // namespace mbbfit
