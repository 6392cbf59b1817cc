/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qcsim/quantum/circuit.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace qcsim {
namespace quantum {

const char* gate_name(GateType type) {
    switch (type) {
        case GateType::H: return "H";
        case GateType::X: return "X";
        case GateType::Y: return "Y";
        case GateType::Z: return "Z";
        case GateType::CNOT: return "CNOT";
        case GateType::RX: return "RX";
        case GateType::RY: return "RY";
        case GateType::RZ: return "RZ";
        case GateType::SWAP: return "SWAP";
        case GateType::CZ: return "CZ";
        case GateType::Toffoli: return "Toffoli";
    }
    return "UNKNOWN";
}

std::optional<GateType> parse_gate_type(const std::string& name) {
    static const GateType all[] = {
        GateType::H, GateType::X, GateType::Y, GateType::Z, GateType::CNOT,
        GateType::RX, GateType::RY, GateType::RZ, GateType::SWAP, GateType::CZ,
        GateType::Toffoli};
    for (GateType t : all) {
        if (name == gate_name(t)) return t;
    }
    if (name == "CX") return GateType::CNOT;
    if (name == "CCX" || name == "TOFFOLI") return GateType::Toffoli;
    return std::nullopt;
}

std::size_t gate_arity(GateType type) {
    switch (type) {
        case GateType::H:
        case GateType::X:
        case GateType::Y:
        case GateType::Z:
        case GateType::RX:
        case GateType::RY:
        case GateType::RZ:
            return 1;
        case GateType::CNOT:
        case GateType::SWAP:
        case GateType::CZ:
            return 2;
        case GateType::Toffoli:
            return 3;
    }
    return 0;
}

std::size_t gate_parameter_count(GateType type) {
    switch (type) {
        case GateType::RX:
        case GateType::RY:
        case GateType::RZ:
            return 1;
        case GateType::H:
        case GateType::X:
        case GateType::Y:
        case GateType::Z:
        case GateType::CNOT:
        case GateType::SWAP:
        case GateType::CZ:
        case GateType::Toffoli:
            return 0;
    }
    return 0;
}

const char* basis_name(MeasurementBasis basis) {
    switch (basis) {
        case MeasurementBasis::Computational: return "computational";
        case MeasurementBasis::Hadamard: return "hadamard";
        case MeasurementBasis::Custom: return "custom";
    }
    return "unknown";
}

std::optional<MeasurementBasis> parse_basis(const std::string& name) {
    if (name == "computational") return MeasurementBasis::Computational;
    if (name == "hadamard") return MeasurementBasis::Hadamard;
    if (name == "custom") return MeasurementBasis::Custom;
    return std::nullopt;
}

Circuit::Circuit(int num_qubits, std::vector<Measurement> measurements)
    : num_qubits_(num_qubits) {
    if (num_qubits < 1) {
        throw SimulationError(ErrorCode::InvalidQubitCount,
                              fmt::format("Invalid number of qubits: {}", num_qubits));
    }
    for (const auto& m : measurements) {
        validate_measurement(m);
    }
    measurements_ = std::move(measurements);
}

void Circuit::validate_measurement(const Measurement& m) const {
    if (m.qubit < 0 || m.qubit >= num_qubits_) {
        throw SimulationError(ErrorCode::InvalidQubitIndex,
                              fmt::format("Measurement qubit {} out of range [0, {})",
                                          m.qubit, num_qubits_));
    }
    if (m.basis == MeasurementBasis::Custom && !m.angle.has_value()) {
        throw SimulationError(ErrorCode::InvalidParameterCount,
                              fmt::format("Custom-basis measurement on qubit {} needs an angle",
                                          m.qubit));
    }
}

void Circuit::validate_gate(const Gate& gate) const {
    const char* name = gate_name(gate.type);

    if (gate.qubits.size() != gate_arity(gate.type)) {
        throw SimulationError(ErrorCode::InvalidGateArity,
                              fmt::format("{} takes {} qubit(s), got {}", name,
                                          gate_arity(gate.type), gate.qubits.size()));
    }
    for (int q : gate.qubits) {
        if (q < 0 || q >= num_qubits_) {
            throw SimulationError(ErrorCode::InvalidQubitIndex,
                                  fmt::format("{} qubit {} out of range [0, {})", name, q,
                                              num_qubits_));
        }
    }
    for (std::size_t i = 0; i < gate.qubits.size(); ++i) {
        for (std::size_t j = i + 1; j < gate.qubits.size(); ++j) {
            if (gate.qubits[i] == gate.qubits[j]) {
                throw SimulationError(ErrorCode::InvalidQubitIndex,
                                      fmt::format("{} qubits must be distinct (qubit {} repeated)",
                                                  name, gate.qubits[i]));
            }
        }
    }
    if (gate.parameters.size() != gate_parameter_count(gate.type)) {
        throw SimulationError(ErrorCode::InvalidParameterCount,
                              fmt::format("{} takes {} parameter(s), got {}", name,
                                          gate_parameter_count(gate.type),
                                          gate.parameters.size()));
    }
}

void Circuit::add_gate(const Gate& gate) {
    validate_gate(gate);
    gates_.push_back(gate);
}

Circuit& Circuit::h(int qubit) { add_gate({GateType::H, {qubit}, {}}); return *this; }
Circuit& Circuit::x(int qubit) { add_gate({GateType::X, {qubit}, {}}); return *this; }
Circuit& Circuit::y(int qubit) { add_gate({GateType::Y, {qubit}, {}}); return *this; }
Circuit& Circuit::z(int qubit) { add_gate({GateType::Z, {qubit}, {}}); return *this; }

Circuit& Circuit::cnot(int control, int target) {
    add_gate({GateType::CNOT, {control, target}, {}});
    return *this;
}

Circuit& Circuit::rx(int qubit, double angle) { add_gate({GateType::RX, {qubit}, {angle}}); return *this; }
Circuit& Circuit::ry(int qubit, double angle) { add_gate({GateType::RY, {qubit}, {angle}}); return *this; }
Circuit& Circuit::rz(int qubit, double angle) { add_gate({GateType::RZ, {qubit}, {angle}}); return *this; }

Circuit& Circuit::swap(int a, int b) {
    add_gate({GateType::SWAP, {a, b}, {}});
    return *this;
}

Circuit& Circuit::cz(int control, int target) {
    add_gate({GateType::CZ, {control, target}, {}});
    return *this;
}

Circuit& Circuit::toffoli(int control_a, int control_b, int target) {
    add_gate({GateType::Toffoli, {control_a, control_b, target}, {}});
    return *this;
}

std::size_t Circuit::depth() const {
    std::vector<std::size_t> frontier(static_cast<std::size_t>(num_qubits_), 0);
    std::size_t depth = 0;
    for (const auto& gate : gates_) {
        std::size_t layer = 0;
        for (int q : gate.qubits) {
            layer = std::max(layer, frontier[static_cast<std::size_t>(q)]);
        }
        ++layer;
        for (int q : gate.qubits) {
            frontier[static_cast<std::size_t>(q)] = layer;
        }
        depth = std::max(depth, layer);
    }
    return depth;
}

std::size_t Circuit::rotation_count() const {
    return static_cast<std::size_t>(std::count_if(gates_.begin(), gates_.end(), [](const Gate& g) {
        return gate_parameter_count(g.type) == 1;
    }));
}

Circuit Circuit::rebind_rotations(const std::vector<double>& angles) const {
    if (angles.size() != rotation_count()) {
        throw SimulationError(ErrorCode::InvalidParameterCount,
                              fmt::format("Circuit has {} rotation gate(s), got {} angle(s)",
                                          rotation_count(), angles.size()));
    }
    Circuit out = *this;
    std::size_t next = 0;
    for (auto& gate : out.gates_) {
        if (gate_parameter_count(gate.type) == 1) {
            gate.parameters[0] = angles[next++];
        }
    }
    return out;
}

} // namespace quantum
} // namespace qcsim
