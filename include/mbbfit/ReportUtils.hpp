#pragma once
#include "FitConfig.hpp"
#include "ModifiedBlackbody.hpp"
#include "PosteriorSummarizer.hpp"
#include <cstdint>
#include <string>

namespace mbbfit {

/* --------------------------------------------------------------------- */
/*              individual writers (text, one header line)               */
/* --------------------------------------------------------------------- */
void write_band(const std::string& path, const PredictiveBand& band);

/*  every thin-th chain row plus its log-posterior and log L_IR          */
void write_chain(const std::string& path,
                 const FitResult&   result,
                 const Vector&      log_lum,
                 int                thin);

/* --------------------------------------------------------------------- */
/*      High-level helper:  create *all* results at the very end         */
/* --------------------------------------------------------------------- */
/*  fit_parameters.csv, sed_band.txt, chain.txt, state.txt, state.cbor   */
void generate_results(const std::string&       out_dir,
                      const ModifiedBlackbody& mbb,
                      const BandOptions&       band,
                      int                      chain_thin,
                      std::uint64_t            seed);

} // namespace mbbfit
