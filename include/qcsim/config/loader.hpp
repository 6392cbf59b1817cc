#pragma once

#include <string>
#include <vector>

#include <qcsim/config/types.hpp>

namespace qcsim::config {

// Read configuration from file (JSON or key=value). Missing file is not an error.
// Returns list of validation errors (empty if ok); a JSON file with errors is not applied.
std::vector<std::string> load_from_file(SimConfig& cfg, const std::string& path);

// Apply QCSIM_* environment variables (MAX_QUBITS, WORKERS, NORM_TOLERANCE, OUTPUT).
// Returns errors for values that do not parse.
std::vector<std::string> apply_env_overrides(SimConfig& cfg);

// Validate final config (ranges, output format). Returns list of errors.
std::vector<std::string> validate_final(const SimConfig& cfg);

} // namespace qcsim::config
