#pragma once
#include <stdexcept>
#include <string>

namespace mbbfit {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/* bad shapes, zero/negative sigma, nothing left after masking */
struct InvalidPhotometryError : Error {
    using Error::Error;
};

/* secant loop hit its iteration cap or stalled */
struct CalibrationNonConvergenceError : Error {
    using Error::Error;
};

/* non-finite flux for in-range parameters */
struct ModelEvaluationError : Error {
    using Error::Error;
};

struct UnsupportedVariantError : Error {
    using Error::Error;
};

/* malformed state file or state blob */
struct StateFormatError : Error {
    using Error::Error;
};

struct ConfigError : Error {
    using Error::Error;
};

} // namespace mbbfit
