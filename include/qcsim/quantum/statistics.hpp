/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <vector>

#include "qcsim/quantum/simulator.hpp"

namespace qcsim {
namespace quantum {

/**
 * Reduced density matrix of one qubit: [[p0, c], [conj(c), p1]]
 */
struct SingleQubitDensity {
    double p0{0.0};
    double p1{0.0};
    Complex coherence{0.0, 0.0};
};

SingleQubitDensity reduce_to_qubit(const QuantumState& state, int qubit);

/**
 * Entanglement entropy (bits) between qubit 0 and the rest of the register.
 *
 * Von Neumann entropy of qubit 0's reduced density matrix. For a pure state
 * this is the bipartite entanglement of {q0} vs {q1..qn-1}; it says nothing
 * about entanglement inside the rest of the register. 0 for a 1-qubit state.
 */
double entanglement(const QuantumState& state);

// Binary Shannon entropy of qubit q's computational-basis marginal, p1 = 1 - p0
double marginal_entropy(const QuantumState& state, int qubit);

/**
 * Mean of |a_i * conj(a_j)| over all unordered pairs i < j.
 *
 * Uses sum_{i<j} |a_i||a_j| = ((sum |a_i|)^2 - sum |a_i|^2) / 2, so the cost
 * is linear in the state size.
 */
double coherence(const QuantumState& state);

double expectation_z(const QuantumState& state, int qubit);
double expectation_x(const QuantumState& state, int qubit);

// {P(0), P(1)} for measuring m.qubit in m's basis
std::array<double, 2> outcome_probabilities(const QuantumState& state, const Measurement& m);

double norm(const QuantumState& state);

// |norm - 1|; exposes floating-point drift without correcting it
double norm_deviation(const QuantumState& state);

struct StateSummary {
    double entanglement{0.0};
    double coherence{0.0};
    double norm_deviation{0.0};
    std::vector<std::array<double, 2>> measurement_probabilities;  // one per measurement spec
};

StateSummary summarize(const QuantumState& state, const std::vector<Measurement>& measurements);

} // namespace quantum
} // namespace qcsim
