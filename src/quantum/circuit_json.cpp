#include <qcsim/quantum/circuit_json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

#include <fmt/core.h>

using json = nlohmann::json;

namespace qcsim::quantum {

// Narrow a JSON integer to int; values outside int raise `code`
static int to_int(const json& v, ErrorCode code, const std::string& field) {
    bool fits;
    if (v.is_number_unsigned()) {
        fits = v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    } else {
        std::int64_t value = v.get<std::int64_t>();
        fits = value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
    }
    if (!fits) {
        throw SimulationError(code, fmt::format("{} value {} is out of range", field, v.dump()));
    }
    return v.get<int>();
}

static Gate gate_from_json(const json& g, std::size_t index) {
    if (!g.is_object()) {
        throw CircuitFormatError(fmt::format("gates[{}] must be an object", index));
    }
    if (!g.contains("type") || !g.at("type").is_string()) {
        throw CircuitFormatError(fmt::format("gates[{}].type must be a string", index));
    }
    std::string name = g.at("type").get<std::string>();
    auto type = parse_gate_type(name);
    if (!type) {
        throw CircuitFormatError(fmt::format("gates[{}]: unknown gate type '{}'", index, name));
    }
    if (!g.contains("qubits") || !g.at("qubits").is_array()) {
        throw CircuitFormatError(fmt::format("gates[{}].qubits must be an array", index));
    }

    Gate gate{*type, {}, {}};
    for (const auto& q : g.at("qubits")) {
        if (!q.is_number_integer()) {
            throw CircuitFormatError(fmt::format("gates[{}].qubits must hold integers", index));
        }
        gate.qubits.push_back(to_int(q, ErrorCode::InvalidQubitIndex, fmt::format("gates[{}].qubits", index)));
    }
    if (g.contains("parameters")) {
        if (!g.at("parameters").is_array()) {
            throw CircuitFormatError(fmt::format("gates[{}].parameters must be an array", index));
        }
        for (const auto& p : g.at("parameters")) {
            if (!p.is_number()) {
                throw CircuitFormatError(fmt::format("gates[{}].parameters must hold numbers", index));
            }
            gate.parameters.push_back(p.get<double>());
        }
    }
    return gate;
}

static Measurement measurement_from_json(const json& m, std::size_t index) {
    if (!m.is_object() || !m.contains("qubit") || !m.at("qubit").is_number_integer()) {
        throw CircuitFormatError(fmt::format("measurements[{}].qubit must be an integer", index));
    }
    Measurement out{to_int(m.at("qubit"), ErrorCode::InvalidQubitIndex, fmt::format("measurements[{}].qubit", index)),
                    MeasurementBasis::Computational, std::nullopt};
    if (m.contains("basis")) {
        if (!m.at("basis").is_string()) {
            throw CircuitFormatError(fmt::format("measurements[{}].basis must be a string", index));
        }
        std::string name = m.at("basis").get<std::string>();
        auto basis = parse_basis(name);
        if (!basis) {
            throw CircuitFormatError(fmt::format("measurements[{}]: unknown basis '{}'", index, name));
        }
        out.basis = *basis;
    }
    if (m.contains("angle")) {
        if (!m.at("angle").is_number()) {
            throw CircuitFormatError(fmt::format("measurements[{}].angle must be a number", index));
        }
        out.angle = m.at("angle").get<double>();
    }
    return out;
}

Circuit circuit_from_json(const json& j) {
    if (!j.is_object()) {
        throw CircuitFormatError("circuit document must be a JSON object");
    }
    if (!j.contains("qubits") || !j.at("qubits").is_number_integer()) {
        throw CircuitFormatError("'qubits' must be an integer");
    }

    int num_qubits = to_int(j.at("qubits"), ErrorCode::InvalidQubitCount, "qubits");

    std::vector<Measurement> measurements;
    if (j.contains("measurements")) {
        if (!j.at("measurements").is_array()) {
            throw CircuitFormatError("'measurements' must be an array");
        }
        const auto& arr = j.at("measurements");
        for (std::size_t i = 0; i < arr.size(); ++i) {
            measurements.push_back(measurement_from_json(arr[i], i));
        }
    }

    Circuit circuit(num_qubits, std::move(measurements));

    if (j.contains("gates")) {
        if (!j.at("gates").is_array()) {
            throw CircuitFormatError("'gates' must be an array");
        }
        const auto& arr = j.at("gates");
        for (std::size_t i = 0; i < arr.size(); ++i) {
            circuit.add_gate(gate_from_json(arr[i], i));
        }
    }
    return circuit;
}

Circuit circuit_from_string(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw CircuitFormatError(fmt::format("invalid JSON: {}", ex.what()));
    }
    return circuit_from_json(j);
}

Circuit circuit_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        throw CircuitFormatError(fmt::format("cannot open circuit file '{}'", path));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return circuit_from_string(buffer.str());
}

json circuit_to_json(const Circuit& circuit) {
    json gates = json::array();
    for (const auto& gate : circuit.gates()) {
        json g = {{"type", gate_name(gate.type)}, {"qubits", gate.qubits}};
        if (!gate.parameters.empty()) g["parameters"] = gate.parameters;
        gates.push_back(std::move(g));
    }

    json measurements = json::array();
    for (const auto& m : circuit.measurements()) {
        json jm = {{"qubit", m.qubit}, {"basis", basis_name(m.basis)}};
        if (m.angle) jm["angle"] = *m.angle;
        measurements.push_back(std::move(jm));
    }

    return {{"qubits", circuit.num_qubits()}, {"gates", gates}, {"measurements", measurements}};
}

json summary_to_json(const QuantumState& state, const Circuit& circuit,
                     const StateSummary& summary, bool include_amplitudes) {
    json out;
    out["qubits"] = state.num_qubits;
    out["gates"] = circuit.gates().size();
    out["depth"] = circuit.depth();
    out["probabilities"] = state.probabilities;
    out["entanglement"] = summary.entanglement;
    out["coherence"] = summary.coherence;
    out["norm_deviation"] = summary.norm_deviation;

    if (include_amplitudes) {
        json amps = json::array();
        for (const auto& a : state.amplitudes) {
            amps.push_back({a.real(), a.imag()});
        }
        out["amplitudes"] = amps;
    }

    json meas = json::array();
    const auto& specs = circuit.measurements();
    for (std::size_t i = 0; i < specs.size() && i < summary.measurement_probabilities.size(); ++i) {
        meas.push_back({{"qubit", specs[i].qubit},
                        {"basis", basis_name(specs[i].basis)},
                        {"p0", summary.measurement_probabilities[i][0]},
                        {"p1", summary.measurement_probabilities[i][1]}});
    }
    out["measurements"] = meas;
    return out;
}

} // namespace qcsim::quantum
