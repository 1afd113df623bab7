#include "mbbfit/MockPhotometry.hpp"
#include <stdexcept>

namespace mbbfit {

Photometry make_mock_photometry(const ModifiedBlackbody&    mbb,
                                const MockPhotometryConfig& cfg,
                                std::mt19937_64&            rng)
{
    if (!(cfg.snr > 0.0))
        throw std::invalid_argument("make_mock_photometry: snr must be positive");

    const double z_eval = cfg.frame == PhotometryFrame::Observed ? mbb.redshift() : 0.0;

    Photometry p;
    p.frame  = cfg.frame;
    p.lambda = cfg.lambda;
    p.flux   = mbb.evaluate(cfg.lambda, z_eval);
    p.sigma  = p.flux / cfg.snr;

    if (cfg.add_noise) {
        std::normal_distribution<> noise_dist(0.0, 1.0);
        for (Eigen::Index i = 0; i < p.flux.size(); ++i)
            p.flux[i] += p.sigma[i] * noise_dist(rng);
    }
    return p;
}

} // namespace mbbfit
