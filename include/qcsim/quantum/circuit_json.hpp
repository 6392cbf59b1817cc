#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "qcsim/quantum/circuit.hpp"
#include "qcsim/quantum/statistics.hpp"

namespace qcsim::quantum {

// Malformed circuit document (missing field, wrong JSON type, unknown gate name)
class CircuitFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Document format:
// {"qubits": 2,
//  "gates": [{"type": "H", "qubits": [0]}, {"type": "RX", "qubits": [1], "parameters": [1.57]}],
//  "measurements": [{"qubit": 0, "basis": "computational"}]}
//
// Gates go through Circuit::add_gate, so invalid indices raise SimulationError.
Circuit circuit_from_json(const nlohmann::json& j);
Circuit circuit_from_string(const std::string& text);
Circuit circuit_from_file(const std::string& path);

nlohmann::json circuit_to_json(const Circuit& circuit);

// amplitudes as [re, im] pairs when include_amplitudes is set
nlohmann::json summary_to_json(const QuantumState& state, const Circuit& circuit,
                               const StateSummary& summary, bool include_amplitudes);

} // namespace qcsim::quantum
