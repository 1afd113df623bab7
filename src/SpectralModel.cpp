#include "mbbfit/SpectralModel.hpp"
#include "mbbfit/Constants.hpp"
#include "mbbfit/Errors.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace mbbfit {

namespace {

constexpr double kNu0 = constants::c_micron_hz / SpectralModel::kTauUnityWavelength;

/* ---- opacity strategies; x = ν/ν0 ------------------------------------- */
double thin_factor(double x, double beta)
{
    return std::pow(x, beta);
}

double thin_slope(double /*x*/, double beta)
{
    return beta;
}

double general_factor(double x, double beta)
{
    const double tau = std::pow(x, beta);
    return -std::expm1(-tau);                       // 1 - e^-τ
}

double general_slope(double x, double beta)
{
    const double tau = std::pow(x, beta);
    const double one_minus = -std::expm1(-tau);
    return beta * tau * std::exp(-tau) / one_minus;
}

/*  d ln B_ν / d ln ν = 3 - x e^x/(e^x - 1)                                  */
double planck_log_slope(double nu, double temperature)
{
    const double x = constants::h_planck * nu / (constants::k_boltz * temperature);
    return 3.0 - x / (-std::expm1(-x));
}

std::string describe(const MbbParams& p)
{
    std::ostringstream s;
    s << "logN=" << p.log_norm << ", T=" << p.temperature << ", beta=" << p.beta;
    return s.str();
}

} // namespace

/* ------------------------------------------------------------------------ */
/*  variant helpers                                                         */
/* ------------------------------------------------------------------------ */
ModelVariant make_variant(bool optically_thin, bool power_law)
{
    if (optically_thin)
        return power_law ? ModelVariant::OpticallyThinPowerLaw
                         : ModelVariant::OpticallyThinGreybody;
    return power_law ? ModelVariant::GeneralOpacityPowerLaw
                     : ModelVariant::GeneralOpacityGreybody;
}

bool is_optically_thin(ModelVariant v)
{
    switch (v) {
        case ModelVariant::OpticallyThinGreybody:
        case ModelVariant::OpticallyThinPowerLaw:  return true;
        case ModelVariant::GeneralOpacityGreybody:
        case ModelVariant::GeneralOpacityPowerLaw: return false;
    }
    throw UnsupportedVariantError("unknown model variant");
}

bool has_power_law(ModelVariant v)
{
    switch (v) {
        case ModelVariant::OpticallyThinPowerLaw:
        case ModelVariant::GeneralOpacityPowerLaw: return true;
        case ModelVariant::OpticallyThinGreybody:
        case ModelVariant::GeneralOpacityGreybody: return false;
    }
    throw UnsupportedVariantError("unknown model variant");
}

std::string to_string(ModelVariant v)
{
    switch (v) {
        case ModelVariant::OpticallyThinGreybody:  return "ot";
        case ModelVariant::OpticallyThinPowerLaw:  return "ot_pl";
        case ModelVariant::GeneralOpacityGreybody: return "go";
        case ModelVariant::GeneralOpacityPowerLaw: return "go_pl";
    }
    throw UnsupportedVariantError("unknown model variant");
}

ModelVariant variant_from_string(const std::string& name)
{
    if (name == "ot")    return ModelVariant::OpticallyThinGreybody;
    if (name == "ot_pl") return ModelVariant::OpticallyThinPowerLaw;
    if (name == "go")    return ModelVariant::GeneralOpacityGreybody;
    if (name == "go_pl") return ModelVariant::GeneralOpacityPowerLaw;
    throw UnsupportedVariantError("unsupported model variant '" + name +
                                  "' (expected ot, ot_pl, go or go_pl)");
}

/* ------------------------------------------------------------------------ */
/*  SpectralModel                                                           */
/* ------------------------------------------------------------------------ */
SpectralModel::SpectralModel(ModelVariant v)
    : variant_(v)
    , opacity_(is_optically_thin(v) ? &thin_factor : &general_factor)
    , opacity_slope_(is_optically_thin(v) ? &thin_slope : &general_slope)
    , power_law_(has_power_law(v))
{
}

double SpectralModel::planck(double nu, double temperature)
{
    const double x = constants::h_planck * nu / (constants::k_boltz * temperature);
    return 2.0 * constants::h_planck * nu * nu * nu
         / (constants::c_light * constants::c_light) / std::expm1(x);
}

double SpectralModel::blend_wavelength(double temperature, double alpha)
{
    constexpr double b1 = 26.68;
    constexpr double b2 = 6.246;
    constexpr double b3 = 1.905e-4;
    constexpr double b4 = 7.243e-5;
    const double a = b1 + b2 * alpha;
    return 1.0 / (1.0 / (a * a) + (b3 + b4 * alpha) * temperature);
}

double SpectralModel::greybody(const MbbParams& p, double rest_wavelength) const
{
    const double nu = constants::c_micron_hz / rest_wavelength;
    return std::pow(10.0, p.log_norm)
         * opacity_(nu / kNu0, p.beta)
         * planck(nu, p.temperature);
}

double SpectralModel::greybody_log_slope(const MbbParams& p, double rest_wavelength) const
{
    const double nu = constants::c_micron_hz / rest_wavelength;
    // d ln S/d ln λ = -d ln S/d ln ν
    return -(opacity_slope_(nu / kNu0, p.beta) + planck_log_slope(nu, p.temperature));
}

PowerLawSegment SpectralModel::power_law_segment(const MbbParams& p) const
{
    PowerLawSegment seg;
    seg.blend_wavelength = blend_wavelength(p.temperature);
    seg.amplitude        = greybody(p, seg.blend_wavelength);
    seg.slope            = greybody_log_slope(p, seg.blend_wavelength);
    return seg;
}

Vector SpectralModel::evaluate(const MbbParams& p, const Vector& wavelengths, double z) const
{
    if (!(z > -1.0))
        throw std::invalid_argument("SpectralModel::evaluate: redshift must exceed -1");

    const double zp1 = 1.0 + z;
    Vector flux(wavelengths.size());

    if (power_law_) {
        // segment depends on the parameters only: derive it once per call
        const PowerLawSegment seg = power_law_segment(p);
        for (Eigen::Index i = 0; i < wavelengths.size(); ++i) {
            const double lam = wavelengths[i] / zp1;
            flux[i] = (lam < seg.blend_wavelength)
                    ? seg.amplitude * std::pow(lam / seg.blend_wavelength, seg.slope)
                    : greybody(p, lam);
        }
    } else {
        for (Eigen::Index i = 0; i < wavelengths.size(); ++i)
            flux[i] = greybody(p, wavelengths[i] / zp1);
    }

    for (Eigen::Index i = 0; i < flux.size(); ++i) {
        if (!std::isfinite(flux[i])) {
            std::ostringstream s;
            s << "non-finite flux at lambda=" << wavelengths[i]
              << " um (" << describe(p) << ", variant " << to_string(variant_) << ")";
            throw ModelEvaluationError(s.str());
        }
    }
    return flux;
}

} // namespace mbbfit
