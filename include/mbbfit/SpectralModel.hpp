#pragma once
#include "Types.hpp"
#include <string>

namespace mbbfit {

// Opacity treatment x short-wavelength behaviour. Chosen once per model.
enum class ModelVariant {
    OpticallyThinGreybody,
    OpticallyThinPowerLaw,
    GeneralOpacityGreybody,
    GeneralOpacityPowerLaw
};

ModelVariant make_variant(bool optically_thin, bool power_law);
bool         is_optically_thin(ModelVariant v);
bool         has_power_law(ModelVariant v);

std::string  to_string(ModelVariant v);          // "ot", "ot_pl", "go", "go_pl"
ModelVariant variant_from_string(const std::string& name);

struct MbbParams {
    double log_norm;      // log10 of the flux amplitude
    double temperature;   // K
    double beta;          // emissivity index
};

/*  Mid-IR power law that replaces the Wien side below the blend wavelength:
 *
 *        S(λ) = amplitude · (λ / blend_wavelength)^slope ,   λ < blend
 *
 *  amplitude and slope are fixed by value and first-derivative matching to
 *  the greybody at the blend wavelength.                                    */
struct PowerLawSegment {
    double blend_wavelength;   // µm, rest frame
    double amplitude;          // Jy
    double slope;              // d ln S / d ln λ
};

class SpectralModel {
public:
    // rest wavelength at which the general-opacity τ reaches unity
    static constexpr double kTauUnityWavelength = 200.0;   // µm
    // nominal mid-IR slope entering the blend-wavelength fit
    static constexpr double kNominalAlpha       = 2.0;

    explicit SpectralModel(ModelVariant v);

    ModelVariant variant() const { return variant_; }

    /*  Flux density in Jy at the given wavelengths (µm).  Wavelengths are
     *  taken in the frame of redshift z and divided by (1+z); pass z = 0 for
     *  rest-frame wavelengths.  Throws ModelEvaluationError on any
     *  non-finite result.                                                   */
    Vector evaluate(const MbbParams& p, const Vector& wavelengths, double z = 0.0) const;

    /*  pure greybody branch (no power law), rest frame                      */
    double greybody(const MbbParams& p, double rest_wavelength) const;
    /*  d ln S_greybody / d ln λ                                             */
    double greybody_log_slope(const MbbParams& p, double rest_wavelength) const;

    PowerLawSegment power_law_segment(const MbbParams& p) const;

    /*  Casey (2012) fitting formula for λ_c(α, T), in µm                    */
    static double blend_wavelength(double temperature, double alpha = kNominalAlpha);

    /*  B_ν(T) in W m^-2 Hz^-1 sr^-1                                         */
    static double planck(double nu, double temperature);

private:
    using OpacityFn = double (*)(double tau_base, double beta);

    ModelVariant variant_;
    OpacityFn    opacity_;          // ν-dependent emissivity factor
    OpacityFn    opacity_slope_;    // its d ln / d ln ν
    bool         power_law_;
};

} // namespace mbbfit
