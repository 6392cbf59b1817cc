/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qcsim/quantum/simulator.hpp"

namespace qcsim {
namespace quantum {

/**
 * Dense state-vector simulator on the CPU
 *
 * Memory: 16 * 2^n bytes per simulated state. Time: O(gates * 2^n).
 * Each simulate() call owns its amplitude vector; batch mode runs distinct
 * circuits on separate worker threads.
 */
class CPUSimulator : public IQuantumSimulator {
public:
    /**
     * @param max_qubits Qubit ceiling checked before allocation, in [1, kMaxSupportedQubits]
     * @param workers    Threads used by simulate_batch (0 = hardware concurrency)
     *
     * @throws std::invalid_argument if max_qubits is out of range
     */
    explicit CPUSimulator(int max_qubits, unsigned workers = 0);

    QuantumState simulate(const Circuit& circuit) const override;
    std::vector<QuantumState> simulate_batch(const std::vector<Circuit>& circuits) const override;

    int max_qubits() const override { return max_qubits_; }
    bool supports_batch() const override { return true; }
    std::string backend_name() const override { return "CPU_BASIC"; }

    unsigned workers() const { return workers_; }

private:
    static void apply_gate(StateVector& state, const Gate& gate);

    static void apply_hadamard(StateVector& state, int qubit);
    static void apply_pauli_x(StateVector& state, int qubit);
    static void apply_pauli_y(StateVector& state, int qubit);
    static void apply_pauli_z(StateVector& state, int qubit);
    static void apply_cnot(StateVector& state, int control, int target);
    static void apply_rotation_x(StateVector& state, int qubit, double angle);
    static void apply_rotation_y(StateVector& state, int qubit, double angle);
    static void apply_rotation_z(StateVector& state, int qubit, double angle);

    int max_qubits_;
    unsigned workers_;
};

} // namespace quantum
} // namespace qcsim
