#ifndef RUNWAYCALC_BASELINE_ASSUMPTIONS_HPP
#define RUNWAYCALC_BASELINE_ASSUMPTIONS_HPP

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace runwaycalc {

// BaselineAssumptions: the model layer's inputs for the monthly formula.
// Numeric values are addressable by name so sampled drivers can replace
// their baseline counterparts; anything else is carried as opaque JSON.
class BaselineAssumptions {
public:
    BaselineAssumptions();

    void set(const std::string& name, double value);
    bool has(const std::string& name) const;

    // Throws std::out_of_range if the value is missing
    double get(const std::string& name) const;
    double get(const std::string& name, double fallback) const;

    const std::map<std::string, double>& values() const { return values_; }

    // Opaque members (non-numeric) passed through untouched
    const nlohmann::json& extra() const { return extra_; }
    void set_extra(nlohmann::json extra);

    size_t size() const { return values_.size(); }

private:
    std::map<std::string, double> values_;
    nlohmann::json extra_;
};

} // namespace runwaycalc

#endif // RUNWAYCALC_BASELINE_ASSUMPTIONS_HPP
