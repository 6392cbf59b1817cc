/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qcsim/quantum/cpu_simulator.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>

namespace qcsim {
namespace quantum {

namespace {

struct ThreadJoiner {
    std::vector<std::thread> threads;
    ~ThreadJoiner() {
        for (auto& th : threads) {
            if (th.joinable()) th.join();
        }
    }
};

const double kInvSqrt2 = 1.0 / std::sqrt(2.0);

unsigned resolve_workers(unsigned requested) {
    if (requested > 0) return requested;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

} // namespace

CPUSimulator::CPUSimulator(int max_qubits, unsigned workers)
    : max_qubits_(max_qubits)
    , workers_(resolve_workers(workers)) {
    if (max_qubits < 1 || max_qubits > kMaxSupportedQubits) {
        throw std::invalid_argument(fmt::format(
            "max_qubits must be in [1, {}], got {}", kMaxSupportedQubits, max_qubits));
    }
}

QuantumState CPUSimulator::simulate(const Circuit& circuit) const {
    if (circuit.num_qubits() > max_qubits_) {
        throw SimulationError(ErrorCode::QubitCountExceeded,
                              fmt::format("Circuit has {} qubits, simulator ceiling is {}",
                                          circuit.num_qubits(), max_qubits_));
    }

    // Initialize to |00...0⟩ state
    QuantumState result;
    result.num_qubits = circuit.num_qubits();
    result.amplitudes.assign(std::size_t{1} << circuit.num_qubits(), Complex(0.0, 0.0));  // 2^n
    result.amplitudes[0] = Complex(1.0, 0.0);

    for (const auto& gate : circuit.gates()) {
        apply_gate(result.amplitudes, gate);
    }

    result.probabilities.resize(result.amplitudes.size());
    std::transform(result.amplitudes.begin(), result.amplitudes.end(),
                   result.probabilities.begin(), [](const Complex& a) { return std::norm(a); });
    return result;
}

std::vector<QuantumState> CPUSimulator::simulate_batch(const std::vector<Circuit>& circuits) const {
    std::vector<QuantumState> results(circuits.size());
    std::vector<std::exception_ptr> errors(circuits.size());
    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        for (std::size_t i = next.fetch_add(1); i < circuits.size(); i = next.fetch_add(1)) {
            try {
                results[i] = simulate(circuits[i]);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        }
    };

    std::size_t thread_count = std::min<std::size_t>(workers_, circuits.size());
    if (thread_count <= 1) {
        worker();
    } else {
        // Joins whatever was started, also when a later thread fails to spawn
        ThreadJoiner pool;
        pool.threads.reserve(thread_count);
        for (std::size_t t = 0; t < thread_count; ++t) {
            pool.threads.emplace_back(worker);
        }
    }

    for (const auto& err : errors) {
        if (err) std::rethrow_exception(err);
    }
    return results;
}

void CPUSimulator::apply_gate(StateVector& state, const Gate& gate) {
    switch (gate.type) {
        case GateType::H:
            apply_hadamard(state, gate.qubits[0]);
            return;
        case GateType::X:
            apply_pauli_x(state, gate.qubits[0]);
            return;
        case GateType::Y:
            apply_pauli_y(state, gate.qubits[0]);
            return;
        case GateType::Z:
            apply_pauli_z(state, gate.qubits[0]);
            return;
        case GateType::CNOT:
            apply_cnot(state, gate.qubits[0], gate.qubits[1]);
            return;
        case GateType::RX:
            apply_rotation_x(state, gate.qubits[0], gate.parameters[0]);
            return;
        case GateType::RY:
            apply_rotation_y(state, gate.qubits[0], gate.parameters[0]);
            return;
        case GateType::RZ:
            apply_rotation_z(state, gate.qubits[0], gate.parameters[0]);
            return;
        case GateType::SWAP:
        case GateType::CZ:
        case GateType::Toffoli:
            throw SimulationError(ErrorCode::UnsupportedGate,
                                  fmt::format("{} gate is not supported by the {} backend",
                                              gate_name(gate.type), "CPU_BASIC"));
    }
    throw SimulationError(ErrorCode::UnsupportedGate, "Unknown gate type");
}

// Single-qubit kernels visit each pair (i, i | mask) once, from the member
// whose target bit is 0, and read both amplitudes before writing either.

void CPUSimulator::apply_hadamard(StateVector& state, int qubit) {
    size_t qubit_mask = 1ULL << qubit;

    for (size_t i = 0; i < state.size(); ++i) {
        if ((i & qubit_mask) == 0) {
            size_t j = i | qubit_mask;

            Complex alpha = state[i];
            Complex beta = state[j];

            state[i] = (alpha + beta) * kInvSqrt2;
            state[j] = (alpha - beta) * kInvSqrt2;
        }
    }
}

void CPUSimulator::apply_pauli_x(StateVector& state, int qubit) {
    size_t qubit_mask = 1ULL << qubit;

    for (size_t i = 0; i < state.size(); ++i) {
        if ((i & qubit_mask) == 0) {
            std::swap(state[i], state[i | qubit_mask]);
        }
    }
}

void CPUSimulator::apply_pauli_y(StateVector& state, int qubit) {
    size_t qubit_mask = 1ULL << qubit;

    for (size_t i = 0; i < state.size(); ++i) {
        if ((i & qubit_mask) == 0) {
            size_t j = i | qubit_mask;

            Complex alpha = state[i];
            Complex beta = state[j];

            // Y = [[0, -i], [i, 0]]
            state[i] = Complex(beta.imag(), -beta.real());
            state[j] = Complex(-alpha.imag(), alpha.real());
        }
    }
}

void CPUSimulator::apply_pauli_z(StateVector& state, int qubit) {
    size_t qubit_mask = 1ULL << qubit;

    for (size_t i = 0; i < state.size(); ++i) {
        if ((i & qubit_mask) != 0) {
            state[i] = -state[i];
        }
    }
}

void CPUSimulator::apply_cnot(StateVector& state, int control, int target) {
    size_t control_mask = 1ULL << control;
    size_t target_mask = 1ULL << target;

    for (size_t i = 0; i < state.size(); ++i) {
        // control is 1 and target is 0: swap with the target-flipped partner once
        if ((i & control_mask) != 0 && (i & target_mask) == 0) {
            std::swap(state[i], state[i | target_mask]);
        }
    }
}

void CPUSimulator::apply_rotation_x(StateVector& state, int qubit, double angle) {
    double cos_half = std::cos(angle / 2.0);
    double sin_half = std::sin(angle / 2.0);

    size_t qubit_mask = 1ULL << qubit;

    for (size_t i = 0; i < state.size(); ++i) {
        if ((i & qubit_mask) == 0) {
            size_t j = i | qubit_mask;

            Complex alpha = state[i];
            Complex beta = state[j];

            state[i] = cos_half * alpha - Complex(0, sin_half) * beta;
            state[j] = cos_half * beta - Complex(0, sin_half) * alpha;
        }
    }
}

void CPUSimulator::apply_rotation_y(StateVector& state, int qubit, double angle) {
    double cos_half = std::cos(angle / 2.0);
    double sin_half = std::sin(angle / 2.0);

    size_t qubit_mask = 1ULL << qubit;

    for (size_t i = 0; i < state.size(); ++i) {
        if ((i & qubit_mask) == 0) {
            size_t j = i | qubit_mask;

            Complex alpha = state[i];
            Complex beta = state[j];

            state[i] = cos_half * alpha - sin_half * beta;
            state[j] = sin_half * alpha + cos_half * beta;
        }
    }
}

void CPUSimulator::apply_rotation_z(StateVector& state, int qubit, double angle) {
    // diag(e^{-iθ/2}, e^{iθ/2}); pure phase, no pairing
    const Complex phase0 = std::polar(1.0, -angle / 2.0);
    const Complex phase1 = std::polar(1.0, angle / 2.0);

    size_t qubit_mask = 1ULL << qubit;

    for (size_t i = 0; i < state.size(); ++i) {
        state[i] *= (i & qubit_mask) == 0 ? phase0 : phase1;
    }
}

std::unique_ptr<IQuantumSimulator> create_cpu_simulator(int max_qubits, unsigned workers) {
    return std::make_unique<CPUSimulator>(max_qubits, workers);
}

} // namespace quantum
} // namespace qcsim
