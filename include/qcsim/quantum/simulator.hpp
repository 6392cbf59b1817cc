/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <complex>
#include <memory>
#include <string>
#include <vector>

#include "qcsim/quantum/circuit.hpp"

namespace qcsim {
namespace quantum {

using Complex = std::complex<double>;
using StateVector = std::vector<Complex>;

// Largest register any backend accepts: 2^30 amplitudes = 16 GiB
constexpr int kMaxSupportedQubits = 30;

/**
 * Result of one simulation run
 *
 * amplitudes[i] belongs to the basis state whose qubit q equals (i >> q) & 1.
 * probabilities[i] = |amplitudes[i]|^2. The state is never renormalized;
 * use norm_deviation() (statistics.hpp) to inspect accumulated drift.
 */
struct QuantumState {
    int num_qubits{0};
    StateVector amplitudes;
    std::vector<double> probabilities;
};

/**
 * Abstract quantum simulator interface
 *
 * Implementations hold configuration only. simulate() allocates a fresh
 * state per call, so one instance may serve concurrent callers.
 */
class IQuantumSimulator {
public:
    virtual ~IQuantumSimulator() = default;

    /**
     * @throws SimulationError(QubitCountExceeded) before allocation if the
     *         circuit is larger than max_qubits()
     * @throws SimulationError(UnsupportedGate) for gate kinds with no kernel
     */
    virtual QuantumState simulate(const Circuit& circuit) const = 0;

    // Results keep input order; rethrows the first failure (by index)
    virtual std::vector<QuantumState> simulate_batch(const std::vector<Circuit>& circuits) const = 0;

    virtual int max_qubits() const = 0;
    virtual bool supports_batch() const = 0;
    virtual std::string backend_name() const = 0;
};

// workers == 0 selects std::thread::hardware_concurrency()
std::unique_ptr<IQuantumSimulator> create_cpu_simulator(int max_qubits, unsigned workers = 0);

} // namespace quantum
} // namespace qcsim
