#pragma once
#include "EnsembleSampler.hpp"
#include "ModifiedBlackbody.hpp"
#include "Photometry.hpp"
#include "SpectralModel.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace mbbfit {

struct InitialGuess {
    double       log_lum     = 12.0;     // log10 L_sun, 8-1000 µm
    double       temperature = 35.0;     // K
    double       beta        = 1.8;
    double       z           = 0.0;      // required in the JSON
    ModelVariant variant     = ModelVariant::OpticallyThinGreybody;
};

// wavelength grid of the exported posterior-predictive band
struct BandOptions {
    int    n_samples      = 200;
    double lambda_min     = 10.0;      // µm, rest frame
    double lambda_max     = 10000.0;
    int    n_points       = 500;       // log-spaced
    bool   observed_frame = false;     // write λ·(1+z) and evaluate there
};

struct FitConfig {
    std::string     photometry_path;
    PhotometryFrame frame       = PhotometryFrame::Rest;
    std::string     output_path = "mbbfit_out";
    InitialGuess    initial;
    ModelOptions    model;
    SamplerOptions  sampler;
    BandOptions     band;
    int             chain_thin  = 10;   // rows kept in the exported chain / L posterior
};

/*  Every key is optional except "photometry" and "initialGuess.z".
 *  Throws ConfigError on missing keys, wrong types or bad values.          */
FitConfig fit_config_from_json(const nlohmann::json& j);
FitConfig load_fit_config(const std::string& path);

Vector band_wavelengths(const BandOptions& b);

} // namespace mbbfit
