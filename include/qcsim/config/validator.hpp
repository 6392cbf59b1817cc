#pragma once

#include <string>

namespace qcsim::config {

// Qubit ceiling must be in [1, kMaxSupportedQubits]
bool validate_max_qubits(int max_qubits, std::string& err);

// Worker count in [0, 256]; 0 means "one per hardware thread"
bool validate_workers(int workers, std::string& err);

bool validate_norm_tolerance(double tolerance, std::string& err);

// "text" or "json"
bool validate_output(const std::string& output, std::string& err);

} // namespace qcsim::config
