#pragma once
#include "Types.hpp"
#include <string>

namespace mbbfit {

enum class PhotometryFrame {
    Rest,        // wavelengths already divided by (1+z)
    Observed
};

// Sparse broadband photometry: three aligned columns
struct Photometry {
    Vector          lambda;    // µm
    Vector          flux;      // Jy
    Vector          sigma;     // 1-σ uncertainties, Jy
    PhotometryFrame frame = PhotometryFrame::Rest;

    Eigen::Index size() const { return lambda.size(); }

    /*  Drop non-detections / invalid rows (negative λ, flux or σ) and check
     *  what remains.  Throws InvalidPhotometryError on mismatched column
     *  lengths, non-finite entries, zero λ or σ, or an empty result.        */
    Photometry usable() const;

    /*  copy with wavelengths divided by (1+z); no-op for rest-frame input   */
    Photometry to_rest_frame(double z) const;
};

/*  ASCII table  λ[µm]  flux[Jy]  σ[Jy], '#' comments, any whitespace.      */
Photometry load_photometry(const std::string& path,
                           PhotometryFrame    frame = PhotometryFrame::Rest);

void write_photometry(const std::string& path, const Photometry& phot);

} // namespace mbbfit
