#include "mbbfit/Photometry.hpp"
#include "mbbfit/Errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace mbbfit {

Photometry Photometry::usable() const
{
    const Eigen::Index n = lambda.size();
    if (flux.size() != n || sigma.size() != n) {
        std::ostringstream s;
        s << "photometry columns differ in length (lambda " << n
          << ", flux " << flux.size() << ", sigma " << sigma.size() << ")";
        throw InvalidPhotometryError(s.str());
    }

    std::vector<Eigen::Index> keep;
    keep.reserve(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        if (!std::isfinite(lambda[i]) || !std::isfinite(flux[i]) || !std::isfinite(sigma[i])) {
            std::ostringstream s;
            s << "non-finite photometry entry in row " << i;
            throw InvalidPhotometryError(s.str());
        }
        if (lambda[i] < 0.0 || flux[i] < 0.0 || sigma[i] < 0.0) continue;   // non-detection

        if (lambda[i] == 0.0 || sigma[i] == 0.0) {
            std::ostringstream s;
            s << "row " << i << " has zero " << (lambda[i] == 0.0 ? "wavelength" : "uncertainty");
            throw InvalidPhotometryError(s.str());
        }
        keep.push_back(i);
    }
    if (keep.empty())
        throw InvalidPhotometryError("no usable photometric points after masking");

    Photometry out;
    out.frame = frame;
    out.lambda.resize(keep.size());
    out.flux.resize(keep.size());
    out.sigma.resize(keep.size());
    for (std::size_t k = 0; k < keep.size(); ++k) {
        out.lambda[k] = lambda[keep[k]];
        out.flux[k]   = flux[keep[k]];
        out.sigma[k]  = sigma[keep[k]];
    }
    return out;
}

Photometry Photometry::to_rest_frame(double z) const
{
    Photometry out = *this;
    if (frame == PhotometryFrame::Observed) {
        out.lambda /= (1.0 + z);
        out.frame = PhotometryFrame::Rest;
    }
    return out;
}

Photometry load_photometry(const std::string& path, PhotometryFrame frame)
{
    std::ifstream in(path);
    if (!in)
        throw InvalidPhotometryError("Cannot open '" + path + "'");

    std::vector<std::array<double, 3>> rows;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line))
    {
        ++lineno;
        auto it = std::find_if_not(line.begin(), line.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; });
        if (it == line.end()) continue;           // blank line
        if (*it == '#') continue;                 // comment

        std::istringstream ss(line);
        std::array<double, 3> row{};
        if (!(ss >> row[0] >> row[1] >> row[2]))
            throw InvalidPhotometryError(path + ":" + std::to_string(lineno)
                                         + ": expected three numeric columns");
        rows.push_back(row);
    }
    if (rows.empty())
        throw InvalidPhotometryError("File '" + path + "' contains no photometry");

    Photometry p;
    p.frame = frame;
    p.lambda.resize(rows.size());
    p.flux.resize(rows.size());
    p.sigma.resize(rows.size());
    for (std::size_t k = 0; k < rows.size(); ++k) {
        p.lambda[k] = rows[k][0];
        p.flux[k]   = rows[k][1];
        p.sigma[k]  = rows[k][2];
    }
    return p;
}

void write_photometry(const std::string& path, const Photometry& phot)
{
    std::ofstream out(path);
    if (!out)
        throw std::runtime_error("Cannot write '" + path + "'");

    out << "# lambda[um]  flux[Jy]  sigma[Jy]"
        << (phot.frame == PhotometryFrame::Observed ? "  (observed frame)" : "  (rest frame)")
        << '\n';
    out << std::setprecision(10);
    for (Eigen::Index i = 0; i < phot.size(); ++i)
        out << phot.lambda[i] << '\t' << phot.flux[i] << '\t' << phot.sigma[i] << '\n';
}

} // namespace mbbfit
