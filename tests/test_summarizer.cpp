/// @file test_summarizer.cpp
/// @brief Percentile summaries and posterior-predictive bands.

#include <gtest/gtest.h>

#include "mbbfit/PosteriorSummarizer.hpp"

#include <cmath>
#include <stdexcept>

using namespace mbbfit;

namespace {

Vector values(std::initializer_list<double> v)
{
    Vector out(static_cast<Eigen::Index>(v.size()));
    Eigen::Index i = 0;
    for (double x : v) out[i++] = x;
    return out;
}

} // namespace

TEST(PercentileTest, LinearInterpolationBetweenOrderStatistics)
{
    const Vector v = values({4.0, 1.0, 3.0, 2.0});
    EXPECT_DOUBLE_EQ(PosteriorSummarizer::percentile(v, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(PosteriorSummarizer::percentile(v, 100.0), 4.0);
    EXPECT_DOUBLE_EQ(PosteriorSummarizer::percentile(v, 50.0), 2.5);
    EXPECT_NEAR(PosteriorSummarizer::percentile(v, 16.0), 1.48, 1e-12);
    EXPECT_NEAR(PosteriorSummarizer::percentile(v, 84.0), 3.52, 1e-12);
}

TEST(PercentileTest, SingleValueAndErrors)
{
    EXPECT_DOUBLE_EQ(PosteriorSummarizer::percentile(values({7.0}), 84.0), 7.0);
    EXPECT_THROW(PosteriorSummarizer::percentile(Vector(), 50.0), std::invalid_argument);
    EXPECT_THROW(PosteriorSummarizer::percentile(values({1.0, 2.0}), 101.0), std::invalid_argument);
}

TEST(SummarizeTest, ColumnsAreIndependent)
{
    Matrix chain(5, 3);
    chain << 11.0, 30.0, 1.0,
             11.1, 40.0, 2.0,
             11.2, 20.0, 3.0,
             11.3, 50.0, 4.0,
             11.4, 10.0, 5.0;
    const PosteriorSummary s = PosteriorSummarizer::summarize(chain);
    EXPECT_NEAR(s.p50[0], 11.2, 1e-12);
    EXPECT_DOUBLE_EQ(s.p50[1], 30.0);
    EXPECT_DOUBLE_EQ(s.p50[2], 3.0);
    EXPECT_NEAR(s.p16[2], 1.64, 1e-12);
    EXPECT_NEAR(s.p84[2], 4.36, 1e-12);
    EXPECT_THROW(PosteriorSummarizer::summarize(Matrix(0, 3)), std::invalid_argument);
}

TEST(PredictiveBandTest, DegenerateChainCollapsesBand)
{
    const SpectralModel model(ModelVariant::OpticallyThinPowerLaw);
    const MbbParams p{11.6, 35.0, 1.8};
    Matrix chain(50, 3);
    chain.col(0).setConstant(p.log_norm);
    chain.col(1).setConstant(p.temperature);
    chain.col(2).setConstant(p.beta);

    const Vector wl = values({20.0, 60.0, 100.0, 300.0, 1000.0});
    PosteriorSummarizer summarizer(model, 1.0, 5);
    const PredictiveBand band = summarizer.predictive_band(chain, wl, 64);
    const Vector expected = model.evaluate(p, wl);

    ASSERT_EQ(band.median.size(), wl.size());
    for (Eigen::Index i = 0; i < wl.size(); ++i) {
        EXPECT_DOUBLE_EQ(band.median[i], expected[i]);
        EXPECT_DOUBLE_EQ(band.lower[i], expected[i]);
        EXPECT_DOUBLE_EQ(band.upper[i], expected[i]);
    }
}

TEST(PredictiveBandTest, TwoColumnChainUsesFixedBetaAndOrdersBand)
{
    const SpectralModel model(ModelVariant::GeneralOpacityGreybody);
    Matrix chain(200, 2);
    for (Eigen::Index r = 0; r < chain.rows(); ++r) {
        chain(r, 0) = 11.5 + 0.001 * static_cast<double>(r % 20);
        chain(r, 1) = 30.0 + 0.05 * static_cast<double>(r % 40);
    }
    const Vector wl = values({50.0, 150.0, 500.0});
    PosteriorSummarizer summarizer(model, 1.5, 9);
    const PredictiveBand band = summarizer.predictive_band(chain, wl, 300, 1.0);

    for (Eigen::Index i = 0; i < wl.size(); ++i) {
        EXPECT_LE(band.lower[i], band.median[i]);
        EXPECT_LE(band.median[i], band.upper[i]);
        EXPECT_GT(band.lower[i], 0.0);
    }
}

TEST(PredictiveBandTest, SameSeedSameBand)
{
    const SpectralModel model(ModelVariant::OpticallyThinGreybody);
    Matrix chain(100, 3);
    for (Eigen::Index r = 0; r < chain.rows(); ++r)
        chain.row(r) << 11.0 + 0.01 * r, 25.0 + 0.2 * r, 1.2 + 0.01 * r;

    const Vector wl = values({70.0, 250.0});
    PosteriorSummarizer a(model, 1.8, 42);
    PosteriorSummarizer b(model, 1.8, 42);
    const PredictiveBand ba = a.predictive_band(chain, wl, 50);
    const PredictiveBand bb = b.predictive_band(chain, wl, 50);
    EXPECT_TRUE(ba.median == bb.median);
    EXPECT_TRUE(ba.upper == bb.upper);
}

TEST(PredictiveBandTest, RejectsBadInput)
{
    PosteriorSummarizer summarizer(SpectralModel(ModelVariant::OpticallyThinGreybody), 1.8, 1);
    const Vector wl = values({100.0});
    EXPECT_THROW(summarizer.predictive_band(Matrix(0, 3), wl), std::invalid_argument);
    EXPECT_THROW(summarizer.predictive_band(Matrix::Ones(4, 3), wl, 0), std::invalid_argument);
}

TEST(DerivedLuminosityTest, ThinnedRowsMatchIntegrator)
{
    const SpectralModel model(ModelVariant::OpticallyThinGreybody);
    const LuminosityIntegrator integ(model, Cosmology());
    Matrix chain(25, 3);
    for (Eigen::Index r = 0; r < chain.rows(); ++r)
        chain.row(r) << 11.0 + 0.02 * r, 30.0 + 0.5 * r, 1.5 + 0.01 * r;

    const PosteriorSummarizer summarizer(model, 1.8, 3);
    const Vector logL = summarizer.derived_log_luminosity(chain, integ, 2.0, 10);
    ASSERT_EQ(logL.size(), 3);
    for (Eigen::Index i = 0; i < 3; ++i) {
        const Eigen::Index r = i * 10;
        EXPECT_DOUBLE_EQ(logL[i],
                         integ.log_luminosity({chain(r, 0), chain(r, 1), chain(r, 2)}, 2.0));
    }
    EXPECT_THROW(summarizer.derived_log_luminosity(chain, integ, 2.0, 0), std::invalid_argument);
}
