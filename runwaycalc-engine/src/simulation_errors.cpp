#include "simulation_errors.hpp"
#include <iomanip>
#include <sstream>
#include <utility>

namespace runwaycalc {

// ============================================================================
// ValidationError Implementation
// ============================================================================

ValidationError::ValidationError(std::vector<ValidationIssue> issues)
    : SimulationError(format(issues)), issues_(std::move(issues)) {}

std::string ValidationError::format(const std::vector<ValidationIssue>& issues) {
    std::ostringstream oss;
    oss << "Invalid simulation config (" << issues.size()
        << (issues.size() == 1 ? " issue" : " issues") << ")";
    for (const auto& issue : issues) {
        oss << "; " << issue.field << ": " << issue.message;
    }
    return oss.str();
}

// ============================================================================
// SimulationIntegrityError Implementation
// ============================================================================

SimulationIntegrityError::SimulationIntegrityError(
    size_t discarded, size_t attempted, double threshold,
    std::vector<std::map<std::string, double>> samples)
    : SimulationError(format(discarded, attempted, threshold, samples)),
      discarded_(discarded),
      attempted_(attempted),
      threshold_(threshold),
      samples_(std::move(samples)) {}

double SimulationIntegrityError::discard_ratio() const {
    if (attempted_ == 0) {
        return 0.0;
    }
    return static_cast<double>(discarded_) / static_cast<double>(attempted_);
}

std::string SimulationIntegrityError::format(
    size_t discarded, size_t attempted, double threshold,
    const std::vector<std::map<std::string, double>>& samples)
{
    std::ostringstream oss;
    double ratio = attempted > 0
        ? static_cast<double>(discarded) / static_cast<double>(attempted)
        : 0.0;
    oss << "Simulation integrity check failed: " << discarded << " of " << attempted
        << " trials produced non-finite values (" << std::fixed << std::setprecision(2)
        << ratio * 100.0 << "% > " << threshold * 100.0 << "% allowed)";

    if (!samples.empty()) {
        oss << "; sample failing drivers:";
        for (const auto& sample : samples) {
            oss << " {";
            bool first = true;
            for (const auto& [driver, value] : sample) {
                if (!first) oss << ", ";
                oss << driver << "=" << std::setprecision(4) << value;
                first = false;
            }
            oss << "}";
        }
    }
    return oss.str();
}

} // namespace runwaycalc
