#pragma once
#include "ThreadPool.hpp"
#include "Types.hpp"
#include <cstdint>
#include <functional>
#include <random>

namespace mbbfit {

struct SamplerOptions {
    int           n_walkers     = 180;
    int           n_burn        = 300;
    int           n_production  = 2000;
    double        jitter        = 1e-7;    // σ of the initial Gaussian ball
    double        stretch_scale = 2.0;     // Goodman & Weare "a"
    unsigned      n_threads     = 0;       // 0 = hardware concurrency
    std::uint64_t seed          = 0;       // 0 = non-deterministic
    bool          verbose       = true;
};

struct FitResult {
    Matrix chain;             // (n_steps*n_walkers) × dim, row = step*n_walkers + walker
    Vector log_prob;          // one per chain row
    Matrix final_positions;   // n_walkers × dim
    Vector final_log_prob;    // n_walkers
    Vector acceptance;        // production acceptance fraction per walker
    int    n_walkers = 0;
    int    n_steps   = 0;
    double fixed_beta = 0.0;  // β held fixed when the chain has no β column

    int    dim() const { return static_cast<int>(chain.cols()); }
    double mean_acceptance() const;
};

/*  Affine-invariant ensemble sampler (Goodman & Weare 2010), stretch move
 *  with the red/blue split of Foreman-Mackey et al. (2013).  Proposals for
 *  one half of the ensemble are evaluated concurrently on the pool; every
 *  random number is drawn on the calling thread.                           */
class EnsembleSampler {
public:
    using LogProb = std::function<double(const Vector&)>;

    struct Ensemble {
        Matrix positions;     // n_walkers × dim
        Vector log_prob;
    };

    EnsembleSampler(LogProb log_prob, const SamplerOptions& opt = {});

    /*  burn-in (discarded) followed by production from its end state       */
    FitResult run(const Vector& initial);

    Ensemble initial_ensemble(const Vector& center);

    /*  advance n_steps; chain rows are recorded when result != nullptr     */
    Ensemble advance(Ensemble start, int n_steps, FitResult* result, const char* label);

    const SamplerOptions& options() const { return opt_; }

private:
    void   stretch_move(Ensemble& e, Eigen::VectorXi& accepted);
    Vector evaluate(const Matrix& positions);

    LogProb         log_prob_;
    SamplerOptions  opt_;
    ThreadPool      pool_;
    std::mt19937_64 rng_;
};

} // namespace mbbfit
