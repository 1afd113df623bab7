#include "mbbfit/FitConfig.hpp"
#include "mbbfit/Errors.hpp"
#include "mbbfit/JsonUtils.hpp"
#include <array>
#include <cmath>

namespace mbbfit {

namespace {

ModelVariant read_variant(const nlohmann::json& g, ModelVariant fallback)
{
    if (g.contains("variant"))
        return variant_from_string(g["variant"].get<std::string>());
    if (g.contains("opthin") || g.contains("pl"))
        return make_variant(g.value("opthin", true), g.value("pl", false));
    return fallback;
}

void read_model(const nlohmann::json& m, ModelOptions& opt)
{
    if (m.contains("cosmology")) {
        const auto& c = m["cosmology"];
        opt.cosmology.H0  = c.value("H0",  opt.cosmology.H0);
        opt.cosmology.Om0 = c.value("Om0", opt.cosmology.Om0);
    }
    if (m.contains("band")) {
        auto band = m["band"].get<std::array<double, 2>>();
        opt.integration.band = {band[0], band[1]};
    }
    opt.integration.grid_points = m.value("gridPoints", opt.integration.grid_points);

    if (m.contains("calibration")) {
        const auto& c = m["calibration"];
        opt.calibration.initial_log_norm = c.value("initialLogNorm", opt.calibration.initial_log_norm);
        opt.calibration.tolerance        = c.value("tolerance",      opt.calibration.tolerance);
        opt.calibration.max_iterations   = c.value("maxIterations",  opt.calibration.max_iterations);
        opt.calibration.verbose          = c.value("verbose",        opt.calibration.verbose);
    }
}

void read_sampler(const nlohmann::json& s, SamplerOptions& opt)
{
    opt.n_walkers     = s.value("walkers",      opt.n_walkers);
    opt.n_burn        = s.value("burnIn",       opt.n_burn);
    opt.n_production  = s.value("steps",        opt.n_production);
    opt.jitter        = s.value("jitter",       opt.jitter);
    opt.stretch_scale = s.value("stretchScale", opt.stretch_scale);
    opt.n_threads     = s.value("threads",      opt.n_threads);
    opt.seed          = s.value("seed",         opt.seed);
    opt.verbose       = s.value("verbose",      opt.verbose);
}

void read_band(const nlohmann::json& b, BandOptions& opt)
{
    opt.n_samples      = b.value("samples",       opt.n_samples);
    opt.lambda_min     = b.value("lambdaMin",     opt.lambda_min);
    opt.lambda_max     = b.value("lambdaMax",     opt.lambda_max);
    opt.n_points       = b.value("points",        opt.n_points);
    opt.observed_frame = b.value("observedFrame", opt.observed_frame);
}

void check(const FitConfig& c)
{
    if (c.photometry_path.empty())
        throw ConfigError("fit config: 'photometry' is required");
    if (!(c.initial.z > 0.0))
        throw ConfigError("fit config: 'initialGuess.z' must be a positive redshift");
    if (!(c.band.lambda_min > 0.0 && c.band.lambda_min < c.band.lambda_max) || c.band.n_points < 2)
        throw ConfigError("fit config: band needs 0 < lambdaMin < lambdaMax and points >= 2");
    if (c.band.n_samples < 1)
        throw ConfigError("fit config: band.samples must be positive");
    if (c.chain_thin < 1)
        throw ConfigError("fit config: 'chainThin' must be >= 1");
}

} // namespace

FitConfig fit_config_from_json(const nlohmann::json& j)
{
    FitConfig c;
    try {
        c.photometry_path = j.value("photometry", std::string{});
        const std::string frame = j.value("frame", std::string("rest"));
        if (frame == "rest")          c.frame = PhotometryFrame::Rest;
        else if (frame == "observed") c.frame = PhotometryFrame::Observed;
        else throw ConfigError("fit config: frame must be 'rest' or 'observed', got '" + frame + "'");

        c.output_path = j.value("outputPath", c.output_path);
        c.chain_thin  = j.value("chainThin",  c.chain_thin);

        if (j.contains("initialGuess")) {
            const auto& g = j["initialGuess"];
            c.initial.log_lum     = g.value("logL", c.initial.log_lum);
            c.initial.temperature = g.value("T",    c.initial.temperature);
            c.initial.beta        = g.value("beta", c.initial.beta);
            c.initial.z           = g.value("z",    c.initial.z);
            c.initial.variant     = read_variant(g, c.initial.variant);
        }
        if (j.contains("model"))   read_model(j["model"], c.model);
        if (j.contains("sampler")) read_sampler(j["sampler"], c.sampler);
        if (j.contains("band"))    read_band(j["band"], c.band);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("fit config: ") + e.what());
    }
    check(c);
    return c;
}

FitConfig load_fit_config(const std::string& path)
{
    nlohmann::json j = load_json(path);
    expand_env(j);
    return fit_config_from_json(j);
}

Vector band_wavelengths(const BandOptions& b)
{
    const Vector logs = Vector::LinSpaced(b.n_points, std::log10(b.lambda_min),
                                          std::log10(b.lambda_max));
    return logs.unaryExpr([](double x) { return std::pow(10.0, x); });
}

} // namespace mbbfit
