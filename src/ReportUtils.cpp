#include "mbbfit/ReportUtils.hpp"
#include "mbbfit/StateIO.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;

namespace mbbfit {

static std::ofstream open_out(const std::string& path)
{
    std::ofstream f(path, std::ios::trunc);
    if (!f) throw std::runtime_error("Cannot write '" + path + "'");
    return f;
}

void write_band(const std::string& path, const PredictiveBand& band)
{
    auto f = open_out(path);
    f << "# lambda[um]  median[Jy]  p16[Jy]  p84[Jy]\n";
    f << std::setprecision(10);
    for (Eigen::Index i = 0; i < band.wavelength.size(); ++i)
        f << band.wavelength[i] << '\t' << band.median[i] << '\t'
          << band.lower[i] << '\t' << band.upper[i] << '\n';
}

void write_chain(const std::string& path,
                 const FitResult&   result,
                 const Vector&      log_lum,
                 int                thin)
{
    auto f = open_out(path);
    f << "# logN  T" << (result.dim() > 2 ? "  beta" : "") << "  log_prob  logL_IR\n";
    f << std::setprecision(10);
    Eigen::Index k = 0;
    for (Eigen::Index r = 0; r < result.chain.rows(); r += thin, ++k) {
        for (Eigen::Index d = 0; d < result.chain.cols(); ++d)
            f << result.chain(r, d) << '\t';
        f << result.log_prob[r] << '\t' << log_lum[k] << '\n';
    }
}

void generate_results(const std::string&       out_dir,
                      const ModifiedBlackbody& mbb,
                      const BandOptions&       band,
                      int                      chain_thin,
                      std::uint64_t            seed)
{
    fs::create_directories(out_dir);

    const FitResult&       result = mbb.fit_result();
    const PosteriorSummary summ   = mbb.summary();
    const Vector           log_lum = mbb.derived_log_luminosity(chain_thin);

    /* ---------------------------  (1) parameter table ------------------*/
    std::vector<std::tuple<std::string, double, double, double>> rows;
    const char* names[3] = {"logN", "T", "beta"};
    for (int d = 0; d < result.dim(); ++d)
        rows.emplace_back(names[d], summ.p16[d], summ.p50[d], summ.p84[d]);
    rows.emplace_back("logL_IR",
                      PosteriorSummarizer::percentile(log_lum, 16.0),
                      PosteriorSummarizer::percentile(log_lum, 50.0),
                      PosteriorSummarizer::percentile(log_lum, 84.0));
    {
        auto csv = open_out(out_dir + "/fit_parameters.csv");
        csv << "parameter,p16,p50,p84\n";
        for (auto& t : rows)
            csv << std::get<0>(t) << ','
                << std::setprecision(10) << std::get<1>(t) << ','
                << std::setprecision(10) << std::get<2>(t) << ','
                << std::setprecision(10) << std::get<3>(t) << '\n';
        csv << "acceptance," << result.mean_acceptance() << ",,\n";
    }

    std::cout << "\n  parameter        p50      -err      +err\n";
    for (auto& t : rows)
        std::cout << "  " << std::left << std::setw(10) << std::get<0>(t) << std::right
                  << std::fixed << std::setprecision(3)
                  << std::setw(10) << std::get<2>(t)
                  << std::setw(10) << std::get<2>(t) - std::get<1>(t)
                  << std::setw(10) << std::get<3>(t) - std::get<2>(t)
                  << std::defaultfloat << '\n';
    if (result.dim() < 3)
        std::cout << "  beta fixed at " << mbb.beta() << '\n';

    /* ---------------------------  (2) predictive band ------------------*/
    Vector lam = band_wavelengths(band);
    const double z_eval = band.observed_frame ? mbb.redshift() : 0.0;
    if (band.observed_frame) lam *= (1.0 + mbb.redshift());
    write_band(out_dir + "/sed_band.txt",
               mbb.predictive_band(lam, band.n_samples, z_eval, seed));

    /* ---------------------------  (3) chain + state --------------------*/
    write_chain(out_dir + "/chain.txt", result, log_lum, chain_thin);
    save_state(mbb, out_dir + "/state.txt");
    save_full_state(mbb, out_dir + "/state.cbor");

    std::cout << "\nResults written to " << fs::path(out_dir).string() << '\n';
}

} // namespace mbbfit
