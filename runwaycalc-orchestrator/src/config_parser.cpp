#include "config_parser.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace runwaycalc {
namespace orchestrator {

namespace {

// First present key among the aliases, or nullptr
const json* find_member(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) {
            return &(*it);
        }
    }
    return nullptr;
}

std::optional<double> get_number(const json& obj, std::initializer_list<const char*> keys,
                                 const std::string& field) {
    const json* value = find_member(obj, keys);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_number()) {
        throw ConfigParseError(field + " must be a number, got " + value->type_name());
    }
    return value->get<double>();
}

std::optional<long long> get_integer(const json& obj, std::initializer_list<const char*> keys,
                                     const std::string& field) {
    const json* value = find_member(obj, keys);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_number_integer()) {
        return value->get<long long>();
    }
    if (value->is_number_float()) {
        double d = value->get<double>();
        if (std::isfinite(d) && std::floor(d) == d &&
            std::fabs(d) < static_cast<double>(std::numeric_limits<long long>::max())) {
            return static_cast<long long>(d);
        }
    }
    throw ConfigParseError(field + " must be an integer, got " + value->dump());
}

std::optional<std::string> get_string(const json& obj, std::initializer_list<const char*> keys,
                                      const std::string& field) {
    const json* value = find_member(obj, keys);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        throw ConfigParseError(field + " must be a string, got " + value->type_name());
    }
    return value->get<std::string>();
}

int clamp_to_int(long long value) {
    if (value > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (value < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(value);
}

void parse_baseline(const json& baseline_json, BaselineAssumptions& baseline) {
    if (!baseline_json.is_object()) {
        throw ConfigParseError(std::string("baselineAssumptions must be an object, got ") +
                               baseline_json.type_name());
    }

    json extra = json::object();
    for (auto it = baseline_json.begin(); it != baseline_json.end(); ++it) {
        if (it.value().is_number()) {
            baseline.set(it.key(), it.value().get<double>());
        } else {
            extra[it.key()] = it.value();
        }
    }
    baseline.set_extra(std::move(extra));
}

} // anonymous namespace

uint64_t fnv1a_64(const std::string& data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::vector<std::string> month_labels_from(const std::string& start_month, int horizon_months) {
    int year = 0;
    int month = 0;
    char dash = 0;
    std::istringstream iss(start_month);
    if (start_month.size() != 7 || !(iss >> year >> dash >> month) || dash != '-' ||
        month < 1 || month > 12) {
        throw std::invalid_argument("startMonth must be formatted as YYYY-MM, got '" +
                                    start_month + "'");
    }

    if (horizon_months < 0 || horizon_months > SimulationConfig::MAX_HORIZON_MONTHS) {
        throw std::invalid_argument("cannot label " + std::to_string(horizon_months) +
                                    " months (at most " +
                                    std::to_string(SimulationConfig::MAX_HORIZON_MONTHS) + ")");
    }

    std::vector<std::string> labels;
    labels.reserve(static_cast<size_t>(horizon_months));
    for (int m = 0; m < horizon_months; ++m) {
        int index = (month - 1) + m;
        int y = year + index / 12;
        int mo = index % 12 + 1;
        std::ostringstream label;
        label << y << "-" << (mo < 10 ? "0" : "") << mo;
        labels.push_back(label.str());
    }
    return labels;
}

DriverSpec parse_driver(const std::string& id, const json& driver_json,
                        std::vector<ValidationIssue>& issues) {
    const std::string prefix = "drivers." + id;
    if (!driver_json.is_object()) {
        throw ConfigParseError(prefix + " must be an object, got " + driver_json.type_name());
    }

    DriverSpec driver;
    driver.id = id;

    if (auto name = get_string(driver_json, {"name", "label"}, prefix + ".name")) {
        // Array payloads may use "name" as the id; only keep it as a label if it differs
        if (*name != id) {
            driver.name = *name;
        }
    }

    std::string dist_name = get_string(driver_json, {"distribution", "dist"},
                                       prefix + ".distribution").value_or("normal");
    try {
        driver.distribution = distribution_from_string(dist_name);
    } catch (const std::invalid_argument&) {
        issues.emplace_back(prefix + ".distribution",
                            "unknown distribution '" + dist_name +
                            "' (expected normal, lognormal, triangular, uniform, beta or gamma)");
    }

    auto mean = get_number(driver_json, {"mean", "mu", "mode"}, prefix + ".mean");
    auto std_dev = get_number(driver_json, {"stdDev", "std", "sigma", "std_dev"}, prefix + ".stdDev");
    auto min = get_number(driver_json, {"min"}, prefix + ".min");
    auto max = get_number(driver_json, {"max"}, prefix + ".max");

    if (driver.distribution == Distribution::Beta) {
        if (!min) {
            issues.emplace_back(prefix + ".min", "min is required for beta drivers");
        }
        if (!max) {
            issues.emplace_back(prefix + ".max", "max is required for beta drivers");
        }
        driver.alpha = get_number(driver_json, {"alpha"}, prefix + ".alpha").value_or(2.0);
        driver.beta = get_number(driver_json, {"beta"}, prefix + ".beta").value_or(2.0);
        driver.min = min.value_or(0.0);
        driver.max = max.value_or(1.0);

        // Moments of Beta(alpha, beta) scaled onto [min, max]
        const double a = driver.alpha;
        const double b = driver.beta;
        const double range = driver.max - driver.min;
        if (a > 0.0 && b > 0.0) {
            driver.mean = mean.value_or(driver.min + range * a / (a + b));
            driver.std_dev = std_dev.value_or(
                range * std::sqrt(a * b / ((a + b) * (a + b) * (a + b + 1.0))));
        } else {
            driver.mean = mean.value_or(driver.min);
            driver.std_dev = std_dev.value_or(0.0);
        }

    } else if (driver.distribution == Distribution::Gamma) {
        auto shape = get_number(driver_json, {"shape", "k"}, prefix + ".shape");
        auto scale = get_number(driver_json, {"scale", "theta"}, prefix + ".scale");

        // Without explicit parameters, match the given mean and stdDev
        if (!shape && !scale && mean && std_dev && *mean > 0.0 && *std_dev > 0.0) {
            shape = (*mean * *mean) / (*std_dev * *std_dev);
            scale = (*std_dev * *std_dev) / *mean;
        }
        driver.shape = shape.value_or(2.0);
        driver.scale = scale.value_or(1.0);

        driver.mean = mean.value_or(driver.shape * driver.scale);
        driver.std_dev = std_dev.value_or(std::sqrt(std::max(driver.shape, 0.0)) * driver.scale);
        driver.min = min.value_or(0.0);
        driver.max = max.value_or(driver.mean + 3.0 * driver.std_dev);

    } else {
        if (!mean) {
            issues.emplace_back(prefix + ".mean", "mean is required");
        }
        driver.mean = mean.value_or(0.0);

        const bool needs_std_dev = driver.distribution == Distribution::Normal ||
                                   driver.distribution == Distribution::LogNormal;
        if (!std_dev && needs_std_dev) {
            issues.emplace_back(prefix + ".stdDev",
                                "stdDev is required for " +
                                distribution_to_string(driver.distribution) + " drivers");
        }
        driver.std_dev = std_dev.value_or(0.0);

        if (needs_std_dev) {
            double spread = 3.0 * driver.std_dev;
            double default_min = driver.mean - spread;
            if (driver.distribution == Distribution::LogNormal) {
                default_min = std::max(0.0, default_min);
            }
            driver.min = min.value_or(default_min);
            driver.max = max.value_or(driver.mean + spread);
        } else {
            if (!min) {
                issues.emplace_back(prefix + ".min", "min is required for bounded distributions");
            }
            if (!max) {
                issues.emplace_back(prefix + ".max", "max is required for bounded distributions");
            }
            driver.min = min.value_or(driver.mean);
            driver.max = max.value_or(driver.mean);
        }
    }

    driver.unit = get_string(driver_json, {"unit"}, prefix + ".unit").value_or("");
    if (auto weight = get_string(driver_json, {"impactWeight", "impact"}, prefix + ".impactWeight")) {
        driver.impact_weight = impact_weight_from_string(*weight);
    }

    return driver;
}

SimulationConfig parse_simulation_config(const json& payload) {
    if (!payload.is_object()) {
        throw ConfigParseError(std::string("Simulation payload must be a JSON object, got ") +
                               payload.type_name());
    }

    SimulationConfig config;
    std::vector<ValidationIssue> issues;

    try {
        if (auto n = get_integer(payload, {"numSimulations", "num_simulations"}, "numSimulations")) {
            config.num_simulations = clamp_to_int(*n);
        } else {
            issues.emplace_back("numSimulations", "numSimulations is required");
        }

        if (auto h = get_integer(payload, {"horizonMonths", "months"}, "horizonMonths")) {
            config.horizon_months = clamp_to_int(*h);
        }

        if (auto s = get_integer(payload, {"sensitivitySamples"}, "sensitivitySamples")) {
            config.sensitivity_samples = clamp_to_int(*s);
        }

        if (auto b = get_integer(payload, {"batchSize"}, "batchSize")) {
            config.batch_size = clamp_to_int(*b);
        }

        if (const json* seed = find_member(payload, {"seed", "randomSeed"})) {
            if (seed->is_number_unsigned()) {
                config.seed = seed->get<uint64_t>();
            } else if (seed->is_number_integer()) {
                issues.emplace_back("seed", "seed must be a non-negative integer");
            } else {
                throw ConfigParseError("seed must be an integer, got " + seed->dump());
            }
        }

        // Drivers: object keyed by id, or array of objects carrying the id
        const json* drivers = find_member(payload, {"drivers"});
        if (!drivers) {
            issues.emplace_back("drivers", "drivers is required");
        } else if (drivers->is_object()) {
            for (auto it = drivers->begin(); it != drivers->end(); ++it) {
                config.add_driver(parse_driver(it.key(), it.value(), issues));
            }
        } else if (drivers->is_array()) {
            for (size_t i = 0; i < drivers->size(); ++i) {
                const json& entry = (*drivers)[i];
                if (!entry.is_object()) {
                    throw ConfigParseError("drivers[" + std::to_string(i) + "] must be an object");
                }
                auto id = get_string(entry, {"id", "name", "key"},
                                     "drivers[" + std::to_string(i) + "].id");
                if (!id || id->empty()) {
                    issues.emplace_back("drivers[" + std::to_string(i) + "].id",
                                        "driver id is required");
                    continue;
                }
                if (config.drivers.count(*id)) {
                    issues.emplace_back("drivers." + *id, "duplicate driver id");
                    continue;
                }
                config.add_driver(parse_driver(*id, entry, issues));
            }
        } else {
            throw ConfigParseError(std::string("drivers must be an object or array, got ") +
                                   drivers->type_name());
        }

        if (const json* baseline = find_member(payload, {"baselineAssumptions", "baseline"})) {
            parse_baseline(*baseline, config.baseline);
        }

        // Labels are only built for a horizon that validation will accept;
        // otherwise the horizonMonths issue reports the problem
        auto start = get_string(payload, {"startMonth"}, "startMonth");
        if (start && config.horizon_months >= SimulationConfig::MIN_HORIZON_MONTHS &&
            config.horizon_months <= SimulationConfig::MAX_HORIZON_MONTHS) {
            try {
                config.month_labels = month_labels_from(*start, config.horizon_months);
            } catch (const std::invalid_argument& e) {
                issues.emplace_back("startMonth", e.what());
            }
        }

    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    // Semantic checks run even when parsing already found problems so the
    // caller gets every issue in one error
    for (auto& issue : collect_validation_issues(config)) {
        bool duplicate = false;
        for (const auto& existing : issues) {
            if (existing.field == issue.field) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            issues.push_back(std::move(issue));
        }
    }

    if (!issues.empty()) {
        throw ValidationError(std::move(issues));
    }

    return config;
}

SimulationConfig parse_simulation_config_from_string(const std::string& json_string) {
    json payload;
    try {
        payload = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
    return parse_simulation_config(payload);
}

SimulationConfig parse_simulation_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_simulation_config_from_string(buffer.str());
}

json config_to_canonical_json(const SimulationConfig& config) {
    json drivers = json::object();
    for (const auto& [id, driver] : config.drivers) {
        drivers[id] = {
            {"distribution", distribution_to_string(driver.distribution)},
            {"mean", driver.mean},
            {"stdDev", driver.std_dev},
            {"min", driver.min},
            {"max", driver.max},
            {"unit", driver.unit}
        };
        if (driver.distribution == Distribution::Beta) {
            drivers[id]["alpha"] = driver.alpha;
            drivers[id]["beta"] = driver.beta;
        } else if (driver.distribution == Distribution::Gamma) {
            drivers[id]["shape"] = driver.shape;
            drivers[id]["scale"] = driver.scale;
        }
    }

    json baseline = json::object();
    for (const auto& [name, value] : config.baseline.values()) {
        baseline[name] = value;
    }
    for (auto it = config.baseline.extra().begin(); it != config.baseline.extra().end(); ++it) {
        baseline[it.key()] = it.value();
    }

    // nlohmann::json objects are key-sorted, so dump() is canonical
    return json{
        {"numSimulations", config.num_simulations},
        {"horizonMonths", config.horizon_months},
        {"sensitivitySamples", config.sensitivity_samples},
        {"drivers", drivers},
        {"baselineAssumptions", baseline}
    };
}

uint64_t fingerprint(const SimulationConfig& config) {
    return fnv1a_64(config_to_canonical_json(config).dump());
}

} // namespace orchestrator
} // namespace runwaycalc
