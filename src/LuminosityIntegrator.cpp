#include "mbbfit/LuminosityIntegrator.hpp"
#include "mbbfit/Constants.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace mbbfit {

LuminosityIntegrator::LuminosityIntegrator(const SpectralModel&      model,
                                           const Cosmology&          cosmo,
                                           const IntegrationOptions& opt)
    : model_(model)
    , cosmo_(cosmo)
    , opt_(opt)
{
    if (opt_.grid_points < 2)
        throw std::invalid_argument("LuminosityIntegrator: grid needs at least 2 points, got "
                                    + std::to_string(opt_.grid_points));
}

double LuminosityIntegrator::integrate(const MbbParams& p, double z) const
{
    return integrate(p, z, opt_.band);
}

double LuminosityIntegrator::integrate(const MbbParams& p, double z,
                                       const WavelengthBand& band) const
{
    if (!(band.lo > 0.0 && band.lo < band.hi))
        throw std::invalid_argument("LuminosityIntegrator: band must satisfy 0 < lo < hi, got ("
                                    + std::to_string(band.lo) + ", "
                                    + std::to_string(band.hi) + ")");
    if (!(z > 0.0))
        throw std::invalid_argument("LuminosityIntegrator: redshift must be positive "
                                    "(luminosity distance vanishes at z <= 0)");

    const double nu_lo = constants::c_micron_hz / band.hi;
    const double nu_hi = constants::c_micron_hz / band.lo;

    const Vector nu  = Vector::LinSpaced(opt_.grid_points, nu_lo, nu_hi);
    const Eigen::Index nbin = opt_.grid_points - 1;

    // left edge of every bin, as rest wavelength
    const Vector lam   = (constants::c_micron_hz / nu.head(nbin).array()).matrix();
    const Vector dnu   = nu.tail(nbin) - nu.head(nbin);
    const Vector flux  = model_.evaluate(p, lam, 0.0);

    const double sum_jy_hz = flux.dot(dnu);
    const double dl = cosmo_.luminosity_distance(z);

    const double watts = 4.0 * constants::pi * dl * dl
                       * sum_jy_hz * constants::jansky / (1.0 + z);
    return watts / constants::L_sun;
}

double LuminosityIntegrator::log_luminosity(const MbbParams& p, double z) const
{
    return std::log10(integrate(p, z, opt_.band));
}

double LuminosityIntegrator::log_luminosity(const MbbParams& p, double z,
                                            const WavelengthBand& band) const
{
    return std::log10(integrate(p, z, band));
}

} // namespace mbbfit
