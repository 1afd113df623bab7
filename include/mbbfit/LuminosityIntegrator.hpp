#pragma once
#include "Cosmology.hpp"
#include "SpectralModel.hpp"

namespace mbbfit {

struct WavelengthBand {
    double lo = 8.0;       // µm, rest frame
    double hi = 1000.0;
};

struct IntegrationOptions {
    WavelengthBand band;            // canonical L_IR band
    int            grid_points = 20000;
};

/*  Left-endpoint Riemann sum of S_ν over a linear frequency grid:
 *
 *        L = 4π D_L² / (1+z) · Σ_i S(ν_i) Δν_i
 *
 *  with S evaluated in the rest frame.  Returned in solar luminosities.    */
class LuminosityIntegrator {
public:
    LuminosityIntegrator(const SpectralModel&      model,
                         const Cosmology&          cosmo,
                         const IntegrationOptions& opt = {});

    double integrate(const MbbParams& p, double z) const;
    double integrate(const MbbParams& p, double z, const WavelengthBand& band) const;

    double log_luminosity(const MbbParams& p, double z) const;
    double log_luminosity(const MbbParams& p, double z, const WavelengthBand& band) const;

    const SpectralModel&      model() const { return model_; }
    const IntegrationOptions& options() const { return opt_; }

private:
    SpectralModel      model_;
    Cosmology          cosmo_;
    IntegrationOptions opt_;
};

} // namespace mbbfit
