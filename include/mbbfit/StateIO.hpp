#pragma once
#include "ModifiedBlackbody.hpp"
#include <string>

namespace mbbfit {

/*  Two-line text record:
 *
 *      # L    T    beta    z    opthin    pl
 *      12.0012<TAB>35.0<TAB>1.8<TAB>2.0<TAB>True<TAB>False<TAB>
 *
 *  Numbers are rounded to four decimals.  Loading re-runs the calibration,
 *  so L is reproduced to the calibration tolerance.                        */
void              save_state(const ModifiedBlackbody& mbb, const std::string& path);
ModifiedBlackbody load_state(const std::string& path, const ModelOptions& opt = {});

/*  Chain-inclusive state as a CBOR blob: model parameters, model options
 *  and, when present, the complete FitResult.  Restoring does not
 *  recalibrate.  Throws StateFormatError on malformed input.               */
void              save_full_state(const ModifiedBlackbody& mbb, const std::string& path);
ModifiedBlackbody restore_full_state(const std::string& path);

} // namespace mbbfit
