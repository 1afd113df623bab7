#include "mbbfit/EnsembleSampler.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>

namespace mbbfit {

double FitResult::mean_acceptance() const
{
    return acceptance.size() ? acceptance.mean() : 0.0;
}

static std::mt19937_64 make_rng(std::uint64_t seed)
{
    if (seed != 0) return std::mt19937_64(seed);
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
}

EnsembleSampler::EnsembleSampler(LogProb log_prob, const SamplerOptions& opt)
    : log_prob_(std::move(log_prob))
    , opt_(opt)
    , pool_(opt.n_threads)
    , rng_(make_rng(opt.seed))
{
    if (opt_.n_walkers < 2 || opt_.n_walkers % 2 != 0)
        throw std::invalid_argument("EnsembleSampler: walker count must be even and >= 2, got "
                                    + std::to_string(opt_.n_walkers));
    if (opt_.n_burn < 0 || opt_.n_production < 1)
        throw std::invalid_argument("EnsembleSampler: need n_burn >= 0 and n_production >= 1");
    if (!(opt_.jitter >= 0.0))
        throw std::invalid_argument("EnsembleSampler: jitter must be non-negative");
    if (!(opt_.stretch_scale > 1.0))
        throw std::invalid_argument("EnsembleSampler: stretch scale must exceed 1");
}

Vector EnsembleSampler::evaluate(const Matrix& positions)
{
    const auto lp = pool_.map(static_cast<std::size_t>(positions.rows()),
                              [&](std::size_t k) {
                                  return log_prob_(positions.row(static_cast<Eigen::Index>(k)).transpose());
                              });
    return Eigen::Map<const Vector>(lp.data(), static_cast<Eigen::Index>(lp.size()));
}

EnsembleSampler::Ensemble EnsembleSampler::initial_ensemble(const Vector& center)
{
    const int dim = static_cast<int>(center.size());
    if (opt_.n_walkers < 2 * dim)
        throw std::invalid_argument("EnsembleSampler: need at least 2*dim = "
                                    + std::to_string(2 * dim) + " walkers");

    std::normal_distribution<double> gauss(0.0, 1.0);
    Ensemble e;
    e.positions.resize(opt_.n_walkers, dim);
    for (int k = 0; k < opt_.n_walkers; ++k)
        for (int d = 0; d < dim; ++d)
            e.positions(k, d) = center[d] + opt_.jitter * gauss(rng_);

    e.log_prob = evaluate(e.positions);

    if (e.log_prob.array().isNaN().any())
        throw std::invalid_argument("EnsembleSampler: log-probability is NaN for the initial ensemble");
    if (!e.log_prob.array().isFinite().any())
        throw std::invalid_argument("EnsembleSampler: every initial walker lies outside the "
                                    "prior support; move the starting point");
    return e;
}

void EnsembleSampler::stretch_move(Ensemble& e, Eigen::VectorXi& accepted)
{
    const int n    = static_cast<int>(e.positions.rows());
    const int dim  = static_cast<int>(e.positions.cols());
    const int half = n / 2;
    const double a = opt_.stretch_scale;

    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng_);

    std::uniform_real_distribution<double> unif(0.0, 1.0);
    std::uniform_int_distribution<int>     pick(0, half - 1);

    for (int pass = 0; pass < 2; ++pass) {
        const int* active = order.data() + (pass == 0 ? 0 : half);
        const int* other  = order.data() + (pass == 0 ? half : 0);

        Matrix proposal(half, dim);
        Vector zz(half);
        for (int i = 0; i < half; ++i) {
            const int k = active[i];
            const int j = other[pick(rng_)];
            const double u = unif(rng_);
            const double z = ((a - 1.0) * u + 1.0) * ((a - 1.0) * u + 1.0) / a;
            zz[i] = z;
            proposal.row(i) = e.positions.row(j) + z * (e.positions.row(k) - e.positions.row(j));
        }

        const Vector lp_new = evaluate(proposal);

        for (int i = 0; i < half; ++i) {
            const int k = active[i];
            const double lnq = (dim - 1) * std::log(zz[i]) + lp_new[i] - e.log_prob[k];
            // NaN (both -inf) compares false: rejected
            if (lnq > std::log(unif(rng_))) {
                e.positions.row(k) = proposal.row(i);
                e.log_prob[k]      = lp_new[i];
                ++accepted[k];
            }
        }
    }
}

EnsembleSampler::Ensemble EnsembleSampler::advance(Ensemble e, int n_steps,
                                                   FitResult* result, const char* label)
{
    const int n   = static_cast<int>(e.positions.rows());
    const int dim = static_cast<int>(e.positions.cols());

    if (result) {
        result->chain.resize(static_cast<Eigen::Index>(n_steps) * n, dim);
        result->log_prob.resize(static_cast<Eigen::Index>(n_steps) * n);
        result->n_walkers = n;
        result->n_steps   = n_steps;
    }

    Eigen::VectorXi accepted = Eigen::VectorXi::Zero(n);
    const int report_every = std::max(1, n_steps / 10);

    for (int step = 0; step < n_steps; ++step) {
        stretch_move(e, accepted);

        if (result) {
            const Eigen::Index row0 = static_cast<Eigen::Index>(step) * n;
            result->chain.middleRows(row0, n) = e.positions;
            result->log_prob.segment(row0, n) = e.log_prob;
        }

        if (opt_.verbose && ((step + 1) % report_every == 0 || step + 1 == n_steps))
            std::cout << "[MCMC] " << label << ' ' << std::setw(3)
                      << (100 * (step + 1)) / n_steps << "%  (" << (step + 1)
                      << '/' << n_steps << ")\n";
    }

    if (result && n_steps > 0)
        result->acceptance = accepted.cast<double>() / static_cast<double>(n_steps);

    return e;
}

FitResult EnsembleSampler::run(const Vector& initial)
{
    if (opt_.verbose)
        std::cout << "[MCMC] " << opt_.n_walkers << " walkers, dim " << initial.size()
                  << ", " << pool_.size() << " worker threads\n";

    Ensemble e = initial_ensemble(initial);

    if (opt_.verbose) std::cout << "[MCMC] Running burn-in...\n";
    e = advance(std::move(e), opt_.n_burn, nullptr, "burn-in");

    if (opt_.verbose) std::cout << "[MCMC] Running production...\n";
    FitResult result;
    e = advance(std::move(e), opt_.n_production, &result, "production");

    result.final_positions = e.positions;
    result.final_log_prob  = e.log_prob;

    if (opt_.verbose)
        std::cout << "[MCMC] Done. Mean acceptance fraction "
                  << std::fixed << std::setprecision(3) << result.mean_acceptance()
                  << std::defaultfloat << "\n";
    return result;
}

} // namespace mbbfit
