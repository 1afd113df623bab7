#pragma once
#include "ModifiedBlackbody.hpp"
#include "Photometry.hpp"
#include <random>

namespace mbbfit {

struct MockPhotometryConfig {
    Vector lambda;             // µm, in the requested frame
    double snr       = 10.0;   // σ = flux / snr
    bool   add_noise = true;   // false: exact model fluxes, σ still flux/snr
    PhotometryFrame frame = PhotometryFrame::Rest;
};

/*  Synthetic photometry drawn from the current state of mbb.              */
Photometry make_mock_photometry(const ModifiedBlackbody&    mbb,
                                const MockPhotometryConfig& cfg,
                                std::mt19937_64&            rng);

} // namespace mbbfit
