/// @file test_spectral_model.cpp
/// @brief Flux evaluation of the four modified-blackbody variants.

#include <gtest/gtest.h>

#include "mbbfit/Constants.hpp"
#include "mbbfit/Errors.hpp"
#include "mbbfit/SpectralModel.hpp"

#include <cmath>
#include <stdexcept>
#include <tuple>

using namespace mbbfit;

namespace {

const MbbParams kParams{11.6, 35.0, 1.8};

Vector wl(std::initializer_list<double> v)
{
    Vector out(static_cast<Eigen::Index>(v.size()));
    Eigen::Index i = 0;
    for (double x : v) out[i++] = x;
    return out;
}

double central_derivative(const SpectralModel& m, const MbbParams& p, double lam)
{
    const double h = lam * 1e-5;
    return (m.greybody(p, lam + h) - m.greybody(p, lam - h)) / (2.0 * h);
}

} // namespace

TEST(VariantTest, FlagsRoundTripThroughNames)
{
    for (bool thin : {true, false}) {
        for (bool pl : {true, false}) {
            const ModelVariant v = make_variant(thin, pl);
            EXPECT_EQ(is_optically_thin(v), thin);
            EXPECT_EQ(has_power_law(v), pl);
            EXPECT_EQ(variant_from_string(to_string(v)), v);
        }
    }
}

TEST(VariantTest, UnknownNameIsRejected)
{
    EXPECT_THROW(variant_from_string("thick"), UnsupportedVariantError);
    EXPECT_THROW(variant_from_string(""), UnsupportedVariantError);
}

TEST(SpectralModelTest, PlanckMatchesClosedForm)
{
    const double nu = 3.0e12, T = 35.0;
    const double x  = constants::h_planck * nu / (constants::k_boltz * T);
    const double expected = 2.0 * constants::h_planck * std::pow(nu, 3)
                          / std::pow(constants::c_light, 2) / (std::exp(x) - 1.0);
    EXPECT_NEAR(SpectralModel::planck(nu, T) / expected, 1.0, 1e-12);
}

TEST(SpectralModelTest, OpticallyThinFluxAtReferenceWavelength)
{
    // τ-scale wavelength: (ν/ν0)^β = 1, so S = 10^N B_ν(T)
    SpectralModel m(ModelVariant::OpticallyThinGreybody);
    const double lam = SpectralModel::kTauUnityWavelength;
    const double nu  = constants::c_micron_hz / lam;
    const Vector s   = m.evaluate(kParams, wl({lam}));
    EXPECT_NEAR(s[0] / (std::pow(10.0, kParams.log_norm) * SpectralModel::planck(nu, 35.0)),
                1.0, 1e-12);
}

TEST(SpectralModelTest, GeneralOpacityApproachesThinLimitAtLongWavelength)
{
    SpectralModel thin(ModelVariant::OpticallyThinGreybody);
    SpectralModel go(ModelVariant::GeneralOpacityGreybody);
    const Vector lam = wl({3000.0, 10000.0});
    const Vector a = thin.evaluate(kParams, lam);
    const Vector b = go.evaluate(kParams, lam);
    // τ = (200/λ)^1.8 < 0.01 -> relative difference ~ τ/2
    EXPECT_NEAR(b[0] / a[0], 1.0, 5e-3);
    EXPECT_NEAR(b[1] / a[1], 1.0, 5e-4);
}

TEST(SpectralModelTest, GeneralOpacityIsSuppressedWhereOpticallyThick)
{
    SpectralModel thin(ModelVariant::OpticallyThinGreybody);
    SpectralModel go(ModelVariant::GeneralOpacityGreybody);
    const Vector lam = wl({40.0});
    EXPECT_LT(go.evaluate(kParams, lam)[0], thin.evaluate(kParams, lam)[0]);
}

TEST(SpectralModelTest, RedshiftDividesWavelengths)
{
    SpectralModel m(ModelVariant::GeneralOpacityPowerLaw);
    const Vector rest = wl({20.0, 60.0, 150.0, 400.0});
    const Vector obs  = rest * 3.0;
    const Vector a = m.evaluate(kParams, rest, 0.0);
    const Vector b = m.evaluate(kParams, obs, 2.0);
    for (Eigen::Index i = 0; i < a.size(); ++i)
        EXPECT_NEAR(b[i] / a[i], 1.0, 1e-12);
}

TEST(SpectralModelTest, GreybodyVariantsIgnorePowerLawSegment)
{
    SpectralModel m(ModelVariant::OpticallyThinGreybody);
    const Vector lam = wl({10.0, 30.0});
    const Vector s = m.evaluate(kParams, lam);
    EXPECT_DOUBLE_EQ(s[0], m.greybody(kParams, 10.0));
    EXPECT_DOUBLE_EQ(s[1], m.greybody(kParams, 30.0));
}

TEST(SpectralModelTest, PowerLawRaisesShortWavelengthFlux)
{
    SpectralModel grey(ModelVariant::OpticallyThinGreybody);
    SpectralModel pl(ModelVariant::OpticallyThinPowerLaw);
    const Vector lam = wl({10.0, 500.0});
    const Vector a = grey.evaluate(kParams, lam);
    const Vector b = pl.evaluate(kParams, lam);
    EXPECT_GT(b[0], 10.0 * a[0]);        // hot-dust excess on the Wien side
    EXPECT_DOUBLE_EQ(b[1], a[1]);        // untouched above the blend
}

TEST(SpectralModelTest, BlendWavelengthFollowsTemperature)
{
    const double cold = SpectralModel::blend_wavelength(20.0);
    const double warm = SpectralModel::blend_wavelength(60.0);
    EXPECT_GT(cold, warm);
    EXPECT_NEAR(SpectralModel::blend_wavelength(35.0), 80.71, 0.05);
}

class PowerLawContinuityTest : public ::testing::TestWithParam<std::tuple<ModelVariant, double, double>> {};

TEST_P(PowerLawContinuityTest, ValueAndSlopeMatchAtBlend)
{
    const auto [variant, T, beta] = GetParam();
    SpectralModel m(variant);
    const MbbParams p{11.0, T, beta};
    const PowerLawSegment seg = m.power_law_segment(p);
    const double lc = seg.blend_wavelength;

    // value: greybody at λc vs the power law approached from below
    const double grey_value = m.greybody(p, lc);
    EXPECT_NEAR(seg.amplitude / grey_value, 1.0, 1e-12);

    const Vector just_below = m.evaluate(p, wl({lc * (1.0 - 1e-9)}));
    EXPECT_NEAR(just_below[0] / grey_value, 1.0, 1e-6);

    // first derivative: dS/dλ of the power law = slope·S/λ
    const double pl_deriv   = seg.slope * seg.amplitude / lc;
    const double grey_deriv = central_derivative(m, p, lc);
    EXPECT_NEAR(pl_deriv / grey_deriv, 1.0, 1e-6);
}

INSTANTIATE_TEST_SUITE_P(
    Variants, PowerLawContinuityTest,
    ::testing::Values(std::make_tuple(ModelVariant::OpticallyThinPowerLaw, 35.0, 1.8),
                      std::make_tuple(ModelVariant::OpticallyThinPowerLaw, 15.0, 0.5),
                      std::make_tuple(ModelVariant::OpticallyThinPowerLaw, 80.0, 3.0),
                      std::make_tuple(ModelVariant::GeneralOpacityPowerLaw, 35.0, 1.8),
                      std::make_tuple(ModelVariant::GeneralOpacityPowerLaw, 15.0, 0.5),
                      std::make_tuple(ModelVariant::GeneralOpacityPowerLaw, 80.0, 3.0)));

TEST(SpectralModelTest, NonFiniteFluxIsReported)
{
    SpectralModel m(ModelVariant::OpticallyThinGreybody);
    const MbbParams huge{400.0, 35.0, 1.8};           // 10^400 overflows
    EXPECT_THROW(m.evaluate(huge, wl({100.0})), ModelEvaluationError);
    EXPECT_THROW(m.evaluate(kParams, wl({0.0})), ModelEvaluationError);
}

TEST(SpectralModelTest, RedshiftBelowMinusOneIsRejected)
{
    SpectralModel m(ModelVariant::OpticallyThinGreybody);
    EXPECT_THROW(m.evaluate(kParams, wl({100.0}), -1.0), std::invalid_argument);
}
