#include "mbbfit/FitConfig.hpp"
#include "mbbfit/ModifiedBlackbody.hpp"
#include "mbbfit/Photometry.hpp"
#include "mbbfit/ReportUtils.hpp"
#include <cxxopts.hpp>
#include <Eigen/Core>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <thread>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace fs = std::filesystem;
using namespace mbbfit;

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("mbbfit", "Modified-blackbody fit of far-infrared photometry");
        opts.add_options()
            ("fit", "Fit configuration JSON", cxxopts::value<std::string>())
            ("threads", "Number of threads (0 = all cores)", cxxopts::value<int>()->default_value("-1"))
            ("seed", "Random seed (0 = non-deterministic)", cxxopts::value<std::uint64_t>())
            ("quiet", "Suppress sampler progress output")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("fit")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        FitConfig cfg = load_fit_config(cli["fit"].as<std::string>());

        // command line overrides the config file
        if (cli["threads"].as<int>() >= 0)
            cfg.sampler.n_threads = static_cast<unsigned>(cli["threads"].as<int>());
        if (cli.count("seed"))
            cfg.sampler.seed = cli["seed"].as<std::uint64_t>();
        if (cli.count("quiet"))
            cfg.sampler.verbose = false;

        unsigned nthreads = cfg.sampler.n_threads;
        if (nthreads == 0) nthreads = std::thread::hardware_concurrency();
#ifdef _OPENMP
        omp_set_num_threads(static_cast<int>(nthreads));
#endif
        Eigen::setNbThreads(1);     // parallelism lives in the sampler

        Photometry phot = load_photometry(cfg.photometry_path, cfg.frame);
        std::cout << "Loaded: " << fs::path(cfg.photometry_path).filename()
                  << " (" << phot.size() << " points)\n";

        const InitialGuess& g = cfg.initial;
        ModifiedBlackbody mbb(g.log_lum, g.temperature, g.beta, g.z, g.variant, cfg.model);
        std::cout << "Initial model: logN = " << mbb.log_norm() << ", T = " << mbb.temperature()
                  << " K, beta = " << mbb.beta() << ", log L_IR = " << mbb.log_luminosity()
                  << " (variant " << to_string(mbb.variant()) << ", z = " << mbb.redshift() << ")\n";

        mbb.fit(phot, cfg.sampler);

        generate_results(cfg.output_path, mbb, cfg.band, cfg.chain_thin, cfg.sampler.seed);

        std::cout << "\nFit completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(end_time - start_time).count();

    int hours = duration / 3600;
    int minutes = (duration % 3600) / 60;
    int seconds = duration % 60;

    std::cout << "\nTook: ";
    if (hours > 0) std::cout << hours << "h ";
    if (minutes > 0 || hours > 0) std::cout << minutes << "m ";
    std::cout << seconds << "s\n";

    return 0;
}
