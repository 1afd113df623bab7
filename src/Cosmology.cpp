#include "mbbfit/Cosmology.hpp"
#include "mbbfit/Constants.hpp"
#include <boost/math/quadrature/gauss_kronrod.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace mbbfit {

Cosmology::Cosmology(const CosmologyParams& p)
    : p_(p)
{
    if (!(p_.H0 > 0.0))
        throw std::invalid_argument("Cosmology: H0 must be positive");
    if (!(p_.Om0 >= 0.0 && p_.Om0 <= 1.0))
        throw std::invalid_argument("Cosmology: Om0 must lie in [0,1]");

    const double c_kms = constants::c_light * 1e-3;
    hubble_distance_ = c_kms / p_.H0 * constants::megaparsec;
}

double Cosmology::efunc(double z) const
{
    const double zp1 = 1.0 + z;
    return std::sqrt(p_.Om0 * zp1 * zp1 * zp1 + (1.0 - p_.Om0));
}

double Cosmology::comoving_distance(double z) const
{
    if (z < 0.0)
        throw std::invalid_argument("Cosmology: negative redshift " + std::to_string(z));
    if (z == 0.0) return 0.0;

    auto inv_e = [this](double zz) { return 1.0 / efunc(zz); };
    const double integral =
        boost::math::quadrature::gauss_kronrod<double, 61>::integrate(
            inv_e, 0.0, z, 15, 1e-12);
    return hubble_distance_ * integral;
}

double Cosmology::luminosity_distance(double z) const
{
    return (1.0 + z) * comoving_distance(z);
}

} // namespace mbbfit
