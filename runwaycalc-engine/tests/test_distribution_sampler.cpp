#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>
#include "../src/distribution_sampler.hpp"
#include "../src/percentile_aggregator.hpp"

using namespace runwaycalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

std::vector<double> draw(const DriverSpec& driver, size_t n, uint64_t seed = 42) {
    RandomEngine rng(seed);
    std::vector<double> values;
    values.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        values.push_back(DistributionSampler::sample(driver, rng));
    }
    return values;
}

} // anonymous namespace

// ============================================================================
// Bounds
// ============================================================================

TEST_CASE("Normal draws stay within bounds", "[sampler]") {
    DriverSpec driver("revenue_growth", Distribution::Normal, 8.0, 3.0, 2.0, 15.0);
    auto values = draw(driver, 10000);

    for (double v : values) {
        REQUIRE(v >= 2.0);
        REQUIRE(v <= 15.0);
    }
}

TEST_CASE("Every distribution respects [min, max]", "[sampler]") {
    std::vector<DriverSpec> drivers = {
        DriverSpec("a", Distribution::Normal, 0.0, 10.0, -1.0, 1.0),
        DriverSpec("b", Distribution::LogNormal, 5.0, 4.0, 1.0, 8.0),
        DriverSpec("c", Distribution::Triangular, 3.0, 0.0, 1.0, 6.0),
        DriverSpec("d", Distribution::Uniform, 50.0, 0.0, 0.0, 100.0),
        DriverSpec("e", Distribution::Beta, 15.0, 2.0, 10.0, 20.0),
        DriverSpec("f", Distribution::Gamma, 2.0, 1.4, 0.5, 4.0)
    };

    for (const auto& driver : drivers) {
        for (double v : draw(driver, 5000)) {
            REQUIRE(std::isfinite(v));
            REQUIRE(v >= driver.min);
            REQUIRE(v <= driver.max);
        }
    }
}

TEST_CASE("Degenerate range always yields the single value", "[sampler]") {
    DriverSpec driver("fixed", Distribution::Normal, 5.0, 2.0, 5.0, 5.0);
    for (double v : draw(driver, 100)) {
        REQUIRE(v == 5.0);
    }
}

TEST_CASE("Zero standard deviation yields the mean", "[sampler]") {
    DriverSpec driver("flat", Distribution::Normal, 7.5, 0.0, 0.0, 10.0);
    for (double v : draw(driver, 100)) {
        REQUIRE(v == 7.5);
    }
}

// ============================================================================
// Moments
// ============================================================================

TEST_CASE("Normal sample moments", "[sampler]") {
    // Bounds far enough out that clamping is negligible
    DriverSpec driver("x", Distribution::Normal, 100.0, 10.0, 0.0, 200.0);
    auto values = draw(driver, 20000);

    double mean = stats::calculate_mean(values);
    double sd = stats::calculate_std_dev(values, mean);
    REQUIRE_THAT(mean, WithinAbs(100.0, 0.5));
    REQUIRE_THAT(sd, WithinRel(10.0, 0.05));
}

TEST_CASE("Lognormal parameters reproduce the arithmetic mean", "[sampler]") {
    LogNormalParams params = DistributionSampler::lognormal_params(50.0, 10.0);
    double implied_mean = std::exp(params.mu + 0.5 * params.sigma * params.sigma);
    REQUIRE_THAT(implied_mean, WithinRel(50.0, 1e-12));

    DriverSpec driver("x", Distribution::LogNormal, 50.0, 10.0, 0.0, 1000.0);
    auto values = draw(driver, 20000);
    REQUIRE_THAT(stats::calculate_mean(values), WithinRel(50.0, 0.02));

    REQUIRE_THROWS_AS(DistributionSampler::lognormal_params(0.0, 1.0), std::invalid_argument);
}

TEST_CASE("Triangular inverse CDF", "[sampler]") {
    REQUIRE(DistributionSampler::triangular(1.0, 3.0, 6.0, 0.0) == 1.0);
    REQUIRE_THAT(DistributionSampler::triangular(1.0, 3.0, 6.0, 1.0), WithinAbs(6.0, 1e-12));
    // CDF at the mode is (mode - min) / (max - min)
    REQUIRE_THAT(DistributionSampler::triangular(1.0, 3.0, 6.0, 0.4), WithinAbs(3.0, 1e-12));

    DriverSpec driver("x", Distribution::Triangular, 3.0, 0.0, 1.0, 6.0);
    auto values = draw(driver, 20000);
    // Mean of a triangular distribution is (min + mode + max) / 3
    REQUIRE_THAT(stats::calculate_mean(values), WithinAbs(10.0 / 3.0, 0.05));
}

TEST_CASE("Beta draws are scaled onto the driver range", "[sampler]") {
    DriverSpec driver("market_share", Distribution::Beta, 0.0, 0.0, 0.0, 1.0);
    driver.alpha = 2.0;
    driver.beta = 5.0;
    driver.mean = 2.0 / 7.0;
    auto values = draw(driver, 20000);

    REQUIRE_THAT(stats::calculate_mean(values), WithinAbs(2.0 / 7.0, 0.01));

    // Same shape on [100, 200] shifts and stretches the mean
    driver.min = 100.0;
    driver.max = 200.0;
    driver.mean = 100.0 + 100.0 * 2.0 / 7.0;
    REQUIRE_THAT(stats::calculate_mean(draw(driver, 20000)), WithinAbs(128.57, 1.0));
}

TEST_CASE("Gamma sample moments", "[sampler]") {
    DriverSpec driver("payment_lag", Distribution::Gamma, 6.0, 0.0, 0.0, 1000.0);
    driver.shape = 3.0;
    driver.scale = 2.0;
    auto values = draw(driver, 20000);

    // Mean shape * scale, variance shape * scale^2
    double mean = stats::calculate_mean(values);
    REQUIRE_THAT(mean, WithinAbs(6.0, 0.15));
    REQUIRE_THAT(stats::calculate_std_dev(values, mean), WithinRel(std::sqrt(12.0), 0.05));
}

TEST_CASE("Gamma with shape below one", "[sampler]") {
    RandomEngine rng(11);
    std::vector<double> values;
    for (int i = 0; i < 20000; ++i) {
        double v = DistributionSampler::standard_gamma(0.5, rng);
        REQUIRE(v >= 0.0);
        values.push_back(v);
    }
    REQUIRE_THAT(stats::calculate_mean(values), WithinAbs(0.5, 0.03));

    REQUIRE_THROWS_AS(DistributionSampler::standard_gamma(0.0, rng), std::invalid_argument);
}

TEST_CASE("Uniform01 is strictly inside (0, 1)", "[sampler]") {
    RandomEngine rng(7);
    for (int i = 0; i < 10000; ++i) {
        double u = DistributionSampler::uniform01(rng);
        REQUIRE(u > 0.0);
        REQUIRE(u < 1.0);
    }
}

// ============================================================================
// Reproducibility
// ============================================================================

TEST_CASE("Trial engines are reproducible and independent", "[sampler]") {
    RandomEngine a = DistributionSampler::trial_engine(42, 7);
    RandomEngine b = DistributionSampler::trial_engine(42, 7);
    RandomEngine c = DistributionSampler::trial_engine(42, 8);
    RandomEngine d = DistributionSampler::trial_engine(43, 7);

    uint64_t first_a = a();
    REQUIRE(first_a == b());
    REQUIRE(first_a != c());
    REQUIRE(first_a != d());
}

TEST_CASE("sample_all draws one value per driver", "[sampler]") {
    std::map<std::string, DriverSpec> drivers;
    drivers["churn_rate"] = DriverSpec("churn_rate", Distribution::Triangular, 3.0, 0.0, 1.0, 6.0);
    drivers["revenue_growth"] = DriverSpec("revenue_growth", Distribution::Normal, 8.0, 3.0, 2.0, 15.0);

    RandomEngine rng1 = DistributionSampler::trial_engine(1, 0);
    RandomEngine rng2 = DistributionSampler::trial_engine(1, 0);
    DriverValues v1 = DistributionSampler::sample_all(drivers, rng1);
    DriverValues v2 = DistributionSampler::sample_all(drivers, rng2);

    REQUIRE(v1.size() == 2);
    REQUIRE(v1.count("churn_rate") == 1);
    REQUIRE(v1.count("revenue_growth") == 1);
    REQUIRE(v1 == v2);
}
