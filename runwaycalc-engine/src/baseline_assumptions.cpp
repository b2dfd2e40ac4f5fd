#include "baseline_assumptions.hpp"
#include <stdexcept>
#include <utility>

namespace runwaycalc {

BaselineAssumptions::BaselineAssumptions() : extra_(nlohmann::json::object()) {}

void BaselineAssumptions::set(const std::string& name, double value) {
    values_[name] = value;
}

bool BaselineAssumptions::has(const std::string& name) const {
    return values_.find(name) != values_.end();
}

double BaselineAssumptions::get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::out_of_range("Baseline assumption not found: " + name);
    }
    return it->second;
}

double BaselineAssumptions::get(const std::string& name, double fallback) const {
    auto it = values_.find(name);
    return it == values_.end() ? fallback : it->second;
}

void BaselineAssumptions::set_extra(nlohmann::json extra) {
    extra_ = std::move(extra);
}

} // namespace runwaycalc
