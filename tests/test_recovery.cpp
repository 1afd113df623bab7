/// @file test_recovery.cpp
/// @brief End-to-end fits of synthetic photometry.

#include <gtest/gtest.h>

#include "mbbfit/MockPhotometry.hpp"
#include "mbbfit/ModifiedBlackbody.hpp"

#include <cmath>
#include <random>

using namespace mbbfit;

namespace {

Vector standard_bands()
{
    Vector wl(6);
    wl << 30.0, 50.0, 80.0, 120.0, 200.0, 300.0;
    return wl;
}

SamplerOptions quiet(std::uint64_t seed)
{
    SamplerOptions opt;
    opt.seed    = seed;
    opt.verbose = false;
    return opt;
}

} // namespace

TEST(MockPhotometryTest, NoiseFreeFluxesFollowTheModel)
{
    ModifiedBlackbody truth(12.0, 35.0, 1.8, 2.0);
    std::mt19937_64 rng(1);
    MockPhotometryConfig cfg;
    cfg.lambda    = standard_bands();
    cfg.add_noise = false;
    const Photometry p = make_mock_photometry(truth, cfg, rng);

    EXPECT_NEAR(p.flux[0] / 1.9992e-4, 1.0, 1e-2);
    EXPECT_NEAR(p.flux[2] / 9.5089e-3, 1.0, 1e-2);
    EXPECT_NEAR(p.flux[5] / 9.6389e-4, 1.0, 1e-2);
    for (Eigen::Index i = 0; i < p.size(); ++i)
        EXPECT_DOUBLE_EQ(p.sigma[i], p.flux[i] / 10.0);
}

TEST(MockPhotometryTest, ObservedFrameShiftsWavelengths)
{
    ModifiedBlackbody truth(12.0, 35.0, 1.8, 2.0);
    std::mt19937_64 rng(1);
    MockPhotometryConfig rest;
    rest.lambda    = standard_bands();
    rest.add_noise = false;
    MockPhotometryConfig obs = rest;
    obs.lambda = rest.lambda * 3.0;
    obs.frame  = PhotometryFrame::Observed;

    const Photometry a = make_mock_photometry(truth, rest, rng);
    const Photometry b = make_mock_photometry(truth, obs, rng);
    EXPECT_EQ(b.frame, PhotometryFrame::Observed);
    for (Eigen::Index i = 0; i < a.size(); ++i)
        EXPECT_NEAR(b.flux[i] / a.flux[i], 1.0, 1e-12);
}

TEST(RecoveryTest, NoiseFreeOpticallyThinSource)
{
    ModifiedBlackbody truth(12.0, 35.0, 1.8, 2.0);
    std::mt19937_64 rng(7);
    MockPhotometryConfig cfg;
    cfg.lambda    = standard_bands();
    cfg.add_noise = false;
    const Photometry phot = make_mock_photometry(truth, cfg, rng);

    ModifiedBlackbody fit(11.8, 30.0, 1.5, 2.0);
    fit.fit(phot, quiet(20240601));

    ASSERT_TRUE(fit.has_fit());
    const FitResult& r = fit.fit_result();
    EXPECT_EQ(r.dim(), 3);
    EXPECT_EQ(r.chain.rows(), 180 * 2000);
    EXPECT_GT(r.mean_acceptance(), 0.15);
    EXPECT_LT(r.mean_acceptance(), 0.85);

    const PosteriorSummary s = fit.summary();
    const double t_width = s.p84[1] - s.p16[1];
    const double b_width = s.p84[2] - s.p16[2];
    EXPECT_GT(t_width, 0.0);
    EXPECT_NEAR(fit.temperature(), 35.0, t_width);
    EXPECT_NEAR(fit.beta(), 1.8, b_width);
    EXPECT_NEAR(fit.log_luminosity(), 12.0, 0.1);

    // medians are adopted as the new state
    EXPECT_DOUBLE_EQ(fit.temperature(), s.p50[1]);
    EXPECT_NEAR(fit.log_luminosity(),
                fit.integrator().log_luminosity({s.p50[0], s.p50[1], s.p50[2]}, 2.0), 1e-12);

    const Vector logL = fit.derived_log_luminosity(100);
    EXPECT_EQ(logL.size(), 180 * 2000 / 100);
    EXPECT_NEAR(PosteriorSummarizer::percentile(logL, 50.0), 12.0, 0.1);
}

TEST(RecoveryTest, RepeatedNoisyTrialsCoverTruth)
{
    ModifiedBlackbody truth(12.0, 35.0, 1.8, 2.0);
    MockPhotometryConfig cfg;
    cfg.lambda = standard_bands();

    // default sampler: 180 walkers, 300 burn-in, 2000 production steps
    constexpr int kTrials = 40;
    int covered_t = 0;
    int covered_beta = 0;
    for (int trial = 0; trial < kTrials; ++trial) {
        std::mt19937_64 rng(1000 + trial);
        const Photometry phot = make_mock_photometry(truth, cfg, rng);

        ModifiedBlackbody fit(11.8, 30.0, 1.5, 2.0);
        fit.fit(phot, quiet(500 + trial));

        const PosteriorSummary s = fit.summary();
        if (s.p16[1] <= 35.0 && 35.0 <= s.p84[1]) ++covered_t;
        if (s.p16[2] <= 1.8 && 1.8 <= s.p84[2]) ++covered_beta;
    }
    // exact marginals cover T in ~78% and beta in ~66% of realisations
    const double coverage = static_cast<double>(covered_t + covered_beta) / (2.0 * kTrials);
    EXPECT_GE(coverage, 0.5) << "T " << covered_t << "/" << kTrials
                              << ", beta " << covered_beta << "/" << kTrials;
}

TEST(RecoveryTest, NoisyObservedFramePhotometry)
{
    ModifiedBlackbody truth(12.0, 35.0, 1.8, 2.0, ModelVariant::GeneralOpacityGreybody);
    std::mt19937_64 rng(11);
    MockPhotometryConfig cfg;
    cfg.lambda = standard_bands() * 3.0;
    cfg.frame  = PhotometryFrame::Observed;
    cfg.snr    = 20.0;
    const Photometry phot = make_mock_photometry(truth, cfg, rng);

    ModifiedBlackbody fit(11.8, 30.0, 1.5, 2.0, ModelVariant::GeneralOpacityGreybody);
    SamplerOptions opt = quiet(5);
    opt.n_walkers    = 60;
    opt.n_burn       = 400;
    opt.n_production = 800;
    fit.fit(phot, opt);

    // a single noisy realisation: only ask for a sensible neighbourhood
    EXPECT_NEAR(fit.temperature(), 35.0, 12.0);
    EXPECT_NEAR(fit.log_luminosity(), 12.0, 0.3);
}

TEST(RecoveryTest, TwoPointsFixBeta)
{
    ModifiedBlackbody truth(12.0, 35.0, 1.8, 2.0);
    std::mt19937_64 rng(3);
    MockPhotometryConfig cfg;
    cfg.lambda.resize(2);
    cfg.lambda << 80.0, 200.0;
    cfg.add_noise = false;
    const Photometry phot = make_mock_photometry(truth, cfg, rng);

    ModifiedBlackbody fit(11.8, 30.0, 1.8, 2.0);
    SamplerOptions opt = quiet(9);
    opt.n_walkers    = 20;
    opt.n_burn       = 200;
    opt.n_production = 300;
    fit.fit(phot, opt);

    EXPECT_EQ(fit.fit_result().dim(), 2);
    EXPECT_DOUBLE_EQ(fit.beta(), 1.8);
    EXPECT_NEAR(fit.temperature(), 35.0, 5.0);
}

TEST(RecoveryTest, PredictiveBandBracketsTheTruth)
{
    ModifiedBlackbody truth(12.0, 35.0, 1.8, 2.0);
    std::mt19937_64 rng(21);
    MockPhotometryConfig cfg;
    cfg.lambda    = standard_bands();
    cfg.add_noise = false;
    const Photometry phot = make_mock_photometry(truth, cfg, rng);

    ModifiedBlackbody fit(11.8, 30.0, 1.5, 2.0);
    SamplerOptions opt = quiet(17);
    opt.n_walkers    = 60;
    opt.n_production = 1000;
    fit.fit(phot, opt);

    Vector wl(3);
    wl << 60.0, 100.0, 150.0;
    const PredictiveBand band = fit.predictive_band(wl, 400, 0.0, 4);
    const Vector exact = truth.evaluate(wl);
    for (Eigen::Index i = 0; i < wl.size(); ++i) {
        const double pad = 0.5 * (band.upper[i] - band.lower[i]);
        EXPECT_GE(exact[i], band.lower[i] - pad);
        EXPECT_LE(exact[i], band.upper[i] + pad);
    }
}
