#pragma once
#include "Cosmology.hpp"
#include "EnsembleSampler.hpp"
#include "LuminosityIntegrator.hpp"
#include "NormalizationCalibrator.hpp"
#include "Photometry.hpp"
#include "PosteriorSummarizer.hpp"
#include "SpectralModel.hpp"
#include "Types.hpp"
#include <optional>

namespace mbbfit {

struct ModelOptions {
    CosmologyParams    cosmology;
    IntegrationOptions integration;
    CalibrationOptions calibration;
};

/*  Live modified-blackbody state: (log N, T, β, z, variant) plus the
 *  8–1000 µm luminosity they imply.  log_luminosity() always equals the
 *  integral of the current parameters; every mutator restores this.
 *  Not safe for concurrent mutation.                                       */
class ModifiedBlackbody {
public:
    /*  calibrates log N so that the model reaches log_lum (log10 L_sun)    */
    ModifiedBlackbody(double              log_lum,
                      double              temperature,
                      double              beta,
                      double              z,
                      ModelVariant        variant = ModelVariant::OpticallyThinGreybody,
                      const ModelOptions& opt     = {});

    /*  no calibration: parameters are taken as given                       */
    static ModifiedBlackbody from_normalization(double              log_norm,
                                                double              temperature,
                                                double              beta,
                                                double              z,
                                                ModelVariant        variant,
                                                const ModelOptions& opt = {});

    /*  Sample the posterior for the given photometry and replace
     *  (log N, T, β) by the posterior medians.  β is sampled only when at
     *  least three usable points are present.  On error the state is left
     *  unchanged.                                                          */
    void fit(const Photometry& phot, const SamplerOptions& opt = {});

    /*  direct assignment, luminosity recomputed.  Both discard the stored
     *  fit, whose chain no longer describes the new state.                 */
    void update(double log_norm, double temperature, double beta);
    /*  new T, β; log N recalibrated to reach log_lum                       */
    void update_L(double log_lum, double temperature, double beta);

    /*  flux in Jy of the current parameters at wavelengths in the frame of
     *  redshift z (z = 0: rest frame)                                      */
    Vector evaluate(const Vector& wavelengths, double z = 0.0) const;

    double luminosity() const;                              // L_sun
    double luminosity(const WavelengthBand& band) const;

    double       log_luminosity() const { return log_lum_; }
    double       log_norm()       const { return log_norm_; }
    double       temperature()    const { return temperature_; }
    double       beta()           const { return beta_; }
    double       redshift()       const { return z_; }
    ModelVariant variant()        const { return model_.variant(); }
    bool         optically_thin() const { return is_optically_thin(model_.variant()); }
    bool         power_law()      const { return has_power_law(model_.variant()); }

    const ModelOptions&         options()    const { return opt_; }
    const SpectralModel&        model()      const { return model_; }
    const LuminosityIntegrator& integrator() const { return integrator_; }

    bool             has_fit()    const { return result_.has_value(); }
    const FitResult& fit_result() const;
    /*  p16/p50/p84 of the last fit, chain column order                     */
    PosteriorSummary summary() const;

    PredictiveBand predictive_band(const Vector& wavelengths,
                                   int           sample_count = 200,
                                   double        z            = 0.0,
                                   std::uint64_t seed         = 0) const;
    Vector derived_log_luminosity(int thin = 10) const;

    /*  used when restoring a full state blob                               */
    void attach_fit(FitResult result);

private:
    struct NoCalibration {};
    ModifiedBlackbody(NoCalibration, double log_norm, double temperature, double beta,
                      double z, ModelVariant variant, const ModelOptions& opt);

    static void check_physical(double temperature, double z);

    void assign(double log_norm, double temperature, double beta);
    void calibrate_and_assign(double log_lum, double temperature, double beta);

    ModelOptions             opt_;
    SpectralModel            model_;
    LuminosityIntegrator     integrator_;
    double                   log_norm_;
    double                   temperature_;
    double                   beta_;
    double                   z_;
    double                   log_lum_;
    std::optional<FitResult> result_;
};

} // namespace mbbfit
