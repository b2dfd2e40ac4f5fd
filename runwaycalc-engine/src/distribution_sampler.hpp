#ifndef RUNWAYCALC_DISTRIBUTION_SAMPLER_HPP
#define RUNWAYCALC_DISTRIBUTION_SAMPLER_HPP

#include "driver_spec.hpp"
#include <cstdint>
#include <map>
#include <random>
#include <string>

namespace runwaycalc {

// Pseudo-random source used for every draw. Trials own their generator so
// a fixed seed reproduces results independent of thread scheduling.
using RandomEngine = std::mt19937_64;

// Values sampled for one trial, keyed by driver id
using DriverValues = std::map<std::string, double>;

// Log-space parameters whose lognormal has the requested arithmetic mean/std dev
struct LogNormalParams {
    double mu;
    double sigma;
};

// DistributionSampler: draws one bounded value per call.
// Results are clamped into [min, max]; out-of-range draws are never re-sampled.
class DistributionSampler {
public:
    // One draw for a driver, clamped to its range
    static double sample(const DriverSpec& driver, RandomEngine& rng);

    // One draw for every driver in the map
    static DriverValues sample_all(const std::map<std::string, DriverSpec>& drivers,
                                   RandomEngine& rng);

    // Engine for trial `trial_index` of a run seeded with `seed`
    static RandomEngine trial_engine(uint64_t seed, uint64_t trial_index);

    // Unclamped primitives, exposed for testing
    static double uniform01(RandomEngine& rng);                 // (0, 1)
    static double standard_normal(RandomEngine& rng);           // Box-Muller
    static double triangular(double min, double mode, double max, double u);
    static double standard_gamma(double shape, RandomEngine& rng);  // Gamma(shape, 1)
    static double standard_beta(double alpha, double beta, RandomEngine& rng);  // [0, 1]
    static LogNormalParams lognormal_params(double mean, double std_dev);

    static double clamp(double value, double min, double max);
};

} // namespace runwaycalc

#endif // RUNWAYCALC_DISTRIBUTION_SAMPLER_HPP
