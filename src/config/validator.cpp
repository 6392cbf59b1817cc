#include <qcsim/config/validator.hpp>

#include <cmath>

#include <fmt/core.h>

#include <qcsim/quantum/simulator.hpp>

namespace qcsim::config {

static constexpr int kMaxWorkers = 256;

bool validate_max_qubits(int max_qubits, std::string& err) {
    if (max_qubits < 1 || max_qubits > quantum::kMaxSupportedQubits) {
        err = fmt::format("max_qubits out of range (1-{}): {}", quantum::kMaxSupportedQubits,
                          max_qubits);
        return false;
    }
    return true;
}

bool validate_workers(int workers, std::string& err) {
    if (workers < 0 || workers > kMaxWorkers) {
        err = fmt::format("workers out of range (0-{}): {}", kMaxWorkers, workers);
        return false;
    }
    return true;
}

bool validate_norm_tolerance(double tolerance, std::string& err) {
    if (!std::isfinite(tolerance) || tolerance <= 0.0) {
        err = fmt::format("norm_tolerance must be a positive number: {}", tolerance);
        return false;
    }
    return true;
}

bool validate_output(const std::string& output, std::string& err) {
    if (output != "text" && output != "json") {
        err = fmt::format("output must be 'text' or 'json': '{}'", output);
        return false;
    }
    return true;
}

} // namespace qcsim::config
