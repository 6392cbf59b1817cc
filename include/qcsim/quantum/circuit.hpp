/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#ifndef QCSIM_QUANTUM_CIRCUIT_HPP
#define QCSIM_QUANTUM_CIRCUIT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "qcsim/quantum/errors.hpp"

namespace qcsim {
namespace quantum {

/**
 * @brief Quantum gate types
 *
 * Consumers switch over this enum without a default label; the build uses
 * -Werror=switch so a new kind must be handled everywhere.
 */
enum class GateType {
    H,        // Hadamard
    X,        // Pauli-X
    Y,        // Pauli-Y
    Z,        // Pauli-Z
    CNOT,     // Controlled-NOT, qubits = {control, target}
    RX,       // Rotation around X axis
    RY,       // Rotation around Y axis
    RZ,       // Rotation around Z axis
    SWAP,     // declared, not simulated
    CZ,       // declared, not simulated
    Toffoli   // declared, not simulated, qubits = {control, control, target}
};

const char* gate_name(GateType type);
std::optional<GateType> parse_gate_type(const std::string& name);

// Number of qubit indices a gate of this kind takes (1, 2 or 3)
std::size_t gate_arity(GateType type);

// Number of real parameters a gate of this kind takes (1 for rotations)
std::size_t gate_parameter_count(GateType type);

/**
 * @brief Single quantum gate operation
 */
struct Gate {
    GateType type;
    std::vector<int> qubits;
    std::vector<double> parameters;  // rotation angle in radians for RX/RY/RZ

    bool operator==(const Gate& other) const {
        return type == other.type && qubits == other.qubits && parameters == other.parameters;
    }
};

enum class MeasurementBasis {
    Computational,  // Z axis
    Hadamard,       // X axis
    Custom          // axis at `angle` from Z toward X
};

const char* basis_name(MeasurementBasis basis);
std::optional<MeasurementBasis> parse_basis(const std::string& name);

struct Measurement {
    int qubit;
    MeasurementBasis basis{MeasurementBasis::Computational};
    std::optional<double> angle;

    bool operator==(const Measurement& other) const {
        return qubit == other.qubit && basis == other.basis && angle == other.angle;
    }
};

/**
 * @brief Quantum circuit: qubit count, ordered gates, measurement specs
 *
 * Gates are validated on insertion, so a built circuit always satisfies
 * "every gate index is in [0, n)". Simulators only read it.
 */
class Circuit {
public:
    explicit Circuit(int num_qubits, std::vector<Measurement> measurements = {});

    // Appends the gate; throws SimulationError and leaves the circuit untouched on failure
    void add_gate(const Gate& gate);

    Circuit& h(int qubit);
    Circuit& x(int qubit);
    Circuit& y(int qubit);
    Circuit& z(int qubit);
    Circuit& cnot(int control, int target);
    Circuit& rx(int qubit, double angle);
    Circuit& ry(int qubit, double angle);
    Circuit& rz(int qubit, double angle);
    Circuit& swap(int a, int b);
    Circuit& cz(int control, int target);
    Circuit& toffoli(int control_a, int control_b, int target);

    int num_qubits() const { return num_qubits_; }
    const std::vector<Gate>& gates() const { return gates_; }
    const std::vector<Measurement>& measurements() const { return measurements_; }

    // Layer count with every gate placed as early as its qubits allow
    std::size_t depth() const;

    std::size_t rotation_count() const;

    /**
     * Copy of this circuit with the rotation gates (in order) re-bound to
     * `angles`. Used by parameter sweeps; *this is not modified.
     *
     * @throws SimulationError(InvalidParameterCount) on a count mismatch
     */
    Circuit rebind_rotations(const std::vector<double>& angles) const;

    bool operator==(const Circuit& other) const {
        return num_qubits_ == other.num_qubits_ && gates_ == other.gates_ &&
               measurements_ == other.measurements_;
    }

private:
    void validate_gate(const Gate& gate) const;
    void validate_measurement(const Measurement& m) const;

    int num_qubits_;
    std::vector<Gate> gates_;
    std::vector<Measurement> measurements_;
};

} // namespace quantum
} // namespace qcsim

#endif // QCSIM_QUANTUM_CIRCUIT_HPP
