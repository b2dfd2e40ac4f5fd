#include "distribution_sampler.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace runwaycalc {

namespace {

constexpr double TWO_PI = 6.283185307179586476925286766559;

// 2^-53: spacing of doubles in [0.5, 1)
constexpr double INV_2_POW_53 = 1.0 / 9007199254740992.0;

} // anonymous namespace

double DistributionSampler::uniform01(RandomEngine& rng) {
    // Top 53 bits, offset by half a step so the result is never 0 or 1
    const uint64_t bits = rng() >> 11;
    return (static_cast<double>(bits) + 0.5) * INV_2_POW_53;
}

double DistributionSampler::standard_normal(RandomEngine& rng) {
    // Box-Muller transform; only the cosine branch is used so draws
    // carry no state between calls
    const double u1 = uniform01(rng);
    const double u2 = uniform01(rng);
    return std::sqrt(-2.0 * std::log(u1)) * std::cos(TWO_PI * u2);
}

double DistributionSampler::triangular(double min, double mode, double max, double u) {
    const double range = max - min;
    if (range <= 0.0) {
        return min;
    }

    // Inverse CDF of the triangular distribution
    const double mode_fraction = (mode - min) / range;
    if (u < mode_fraction) {
        return min + std::sqrt(u * range * (mode - min));
    }
    return max - std::sqrt((1.0 - u) * range * (max - mode));
}

double DistributionSampler::standard_gamma(double shape, RandomEngine& rng) {
    if (!(shape > 0.0)) {
        throw std::invalid_argument("gamma shape must be positive");
    }

    // Shape below 1: boost to shape + 1 and rescale by U^(1/shape)
    if (shape < 1.0) {
        const double boosted = standard_gamma(shape + 1.0, rng);
        return boosted * std::pow(uniform01(rng), 1.0 / shape);
    }

    // Marsaglia-Tsang squeeze/rejection
    const double d = shape - 1.0 / 3.0;
    const double c = 1.0 / std::sqrt(9.0 * d);
    while (true) {
        double x = 0.0;
        double v = 0.0;
        do {
            x = standard_normal(rng);
            v = 1.0 + c * x;
        } while (v <= 0.0);

        v = v * v * v;
        const double u = uniform01(rng);
        const double x_sq = x * x;
        if (u < 1.0 - 0.0331 * x_sq * x_sq) {
            return d * v;
        }
        if (std::log(u) < 0.5 * x_sq + d * (1.0 - v + std::log(v))) {
            return d * v;
        }
    }
}

double DistributionSampler::standard_beta(double alpha, double beta, RandomEngine& rng) {
    // X / (X + Y) with X ~ Gamma(alpha), Y ~ Gamma(beta)
    const double x = standard_gamma(alpha, rng);
    const double y = standard_gamma(beta, rng);
    const double sum = x + y;
    if (sum <= 0.0) {
        return alpha / (alpha + beta);
    }
    return x / sum;
}

LogNormalParams DistributionSampler::lognormal_params(double mean, double std_dev) {
    if (mean <= 0.0) {
        throw std::invalid_argument("lognormal mean must be positive");
    }
    // E[X] = exp(mu + sigma^2/2), Var[X] = (exp(sigma^2) - 1) * E[X]^2
    const double variance_ratio = (std_dev * std_dev) / (mean * mean);
    const double sigma_sq = std::log1p(variance_ratio);

    LogNormalParams params;
    params.sigma = std::sqrt(sigma_sq);
    params.mu = std::log(mean) - 0.5 * sigma_sq;
    return params;
}

double DistributionSampler::clamp(double value, double min, double max) {
    return std::max(min, std::min(max, value));
}

double DistributionSampler::sample(const DriverSpec& driver, RandomEngine& rng) {
    double value = driver.mean;

    switch (driver.distribution) {
        case Distribution::Normal:
            value = driver.mean + driver.std_dev * standard_normal(rng);
            break;

        case Distribution::LogNormal: {
            LogNormalParams params = lognormal_params(driver.mean, driver.std_dev);
            value = std::exp(params.mu + params.sigma * standard_normal(rng));
            break;
        }

        case Distribution::Triangular:
            value = triangular(driver.min, driver.mean, driver.max, uniform01(rng));
            break;

        case Distribution::Uniform:
            value = driver.min + (driver.max - driver.min) * uniform01(rng);
            break;

        case Distribution::Beta:
            value = driver.min + (driver.max - driver.min) *
                    standard_beta(driver.alpha, driver.beta, rng);
            break;

        case Distribution::Gamma:
            value = driver.scale * standard_gamma(driver.shape, rng);
            break;

        default:
            throw std::invalid_argument("Unsupported distribution for driver " + driver.id);
    }

    return clamp(value, driver.min, driver.max);
}

DriverValues DistributionSampler::sample_all(
    const std::map<std::string, DriverSpec>& drivers, RandomEngine& rng)
{
    // Map iteration order is the key order, so the draw sequence is stable
    DriverValues values;
    for (const auto& [id, driver] : drivers) {
        values.emplace(id, sample(driver, rng));
    }
    return values;
}

RandomEngine DistributionSampler::trial_engine(uint64_t seed, uint64_t trial_index) {
    std::seed_seq seq{
        static_cast<uint32_t>(seed & 0xFFFFFFFFu),
        static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(trial_index & 0xFFFFFFFFu),
        static_cast<uint32_t>(trial_index >> 32)
    };
    return RandomEngine(seq);
}

} // namespace runwaycalc
