/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qcsim/quantum/statistics.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace qcsim {
namespace quantum {

namespace {

void check_qubit(const QuantumState& state, int qubit) {
    if (qubit < 0 || qubit >= state.num_qubits) {
        throw SimulationError(ErrorCode::InvalidQubitIndex,
                              fmt::format("Qubit {} out of range [0, {})", qubit, state.num_qubits));
    }
}

// -x log2(x), with the 0 log 0 = 0 convention; eigenvalues that rounding
// pushed outside (0, 1) contribute nothing
double entropy_term(double x) {
    return (x > 0.0 && x < 1.0) ? -x * std::log2(x) : 0.0;
}

} // namespace

SingleQubitDensity reduce_to_qubit(const QuantumState& state, int qubit) {
    check_qubit(state, qubit);
    size_t qubit_mask = 1ULL << qubit;

    SingleQubitDensity rho;
    for (size_t i = 0; i < state.amplitudes.size(); ++i) {
        if ((i & qubit_mask) == 0) {
            const Complex& alpha = state.amplitudes[i];
            const Complex& beta = state.amplitudes[i | qubit_mask];
            rho.p0 += std::norm(alpha);
            rho.p1 += std::norm(beta);
            rho.coherence += alpha * std::conj(beta);
        }
    }
    return rho;
}

double entanglement(const QuantumState& state) {
    if (state.num_qubits < 2) return 0.0;

    SingleQubitDensity rho = reduce_to_qubit(state, 0);
    double trace = rho.p0 + rho.p1;
    double diff = rho.p0 - rho.p1;
    double radius = std::sqrt(diff * diff + 4.0 * std::norm(rho.coherence));

    double lambda_hi = 0.5 * (trace + radius);
    double lambda_lo = 0.5 * (trace - radius);
    return entropy_term(lambda_hi) + entropy_term(lambda_lo);
}

double marginal_entropy(const QuantumState& state, int qubit) {
    check_qubit(state, qubit);
    size_t qubit_mask = 1ULL << qubit;

    double p0 = 0.0;
    for (size_t i = 0; i < state.probabilities.size(); ++i) {
        if ((i & qubit_mask) == 0) p0 += state.probabilities[i];
    }
    double p1 = 1.0 - p0;
    if (p0 <= 0.0 || p1 <= 0.0) return 0.0;
    return -p0 * std::log2(p0) - p1 * std::log2(p1);
}

double coherence(const QuantumState& state) {
    const std::size_t n = state.amplitudes.size();
    if (n < 2) return 0.0;

    double sum_abs = 0.0;
    double sum_sq = 0.0;
    for (const auto& a : state.amplitudes) {
        double m = std::abs(a);
        sum_abs += m;
        sum_sq += m * m;
    }
    double pair_sum = std::max(0.0, 0.5 * (sum_abs * sum_abs - sum_sq));
    double pairs = 0.5 * static_cast<double>(n) * static_cast<double>(n - 1);
    return pair_sum / pairs;
}

double expectation_z(const QuantumState& state, int qubit) {
    SingleQubitDensity rho = reduce_to_qubit(state, qubit);
    return rho.p0 - rho.p1;
}

double expectation_x(const QuantumState& state, int qubit) {
    SingleQubitDensity rho = reduce_to_qubit(state, qubit);
    return 2.0 * rho.coherence.real();
}

std::array<double, 2> outcome_probabilities(const QuantumState& state, const Measurement& m) {
    SingleQubitDensity rho = reduce_to_qubit(state, m.qubit);
    double trace = rho.p0 + rho.p1;

    double theta = 0.0;
    switch (m.basis) {
        case MeasurementBasis::Computational:
            return {rho.p0, rho.p1};
        case MeasurementBasis::Hadamard:
            theta = M_PI / 2.0;
            break;
        case MeasurementBasis::Custom:
            if (!m.angle) {
                throw SimulationError(ErrorCode::InvalidParameterCount,
                                      "Custom-basis measurement needs an angle");
            }
            theta = *m.angle;
            break;
    }

    // Projector onto (I + cos θ Z + sin θ X) / 2
    double z = rho.p0 - rho.p1;
    double x = 2.0 * rho.coherence.real();
    double p_plus = 0.5 * (trace + std::cos(theta) * z + std::sin(theta) * x);
    return {p_plus, trace - p_plus};
}

double norm(const QuantumState& state) {
    double total = 0.0;
    for (const auto& a : state.amplitudes) {
        total += std::norm(a);
    }
    return total;
}

double norm_deviation(const QuantumState& state) {
    return std::abs(norm(state) - 1.0);
}

StateSummary summarize(const QuantumState& state, const std::vector<Measurement>& measurements) {
    StateSummary summary;
    summary.entanglement = entanglement(state);
    summary.coherence = coherence(state);
    summary.norm_deviation = norm_deviation(state);
    summary.measurement_probabilities.reserve(measurements.size());
    for (const auto& m : measurements) {
        summary.measurement_probabilities.push_back(outcome_probabilities(state, m));
    }
    return summary;
}

} // namespace quantum
} // namespace qcsim
