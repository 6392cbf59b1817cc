/*
 * Unit tests for state statistics (entanglement, coherence, expectations)
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>

#include <qcsim/quantum/cpu_simulator.hpp>
#include <qcsim/quantum/statistics.hpp>

using namespace qcsim::quantum;

static QuantumState run(const Circuit& c) {
    CPUSimulator sim(10, 1);
    return sim.simulate(c);
}

// Direct O(N^2) pair sum, for comparison with the closed form
static double coherence_by_pairs(const QuantumState& state) {
    const auto& a = state.amplitudes;
    double total = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        for (std::size_t j = i + 1; j < a.size(); ++j) {
            total += std::abs(a[i] * std::conj(a[j]));
        }
    }
    double n = static_cast<double>(a.size());
    return total / (n * (n - 1.0) / 2.0);
}

TEST_SUITE("Entanglement") {
    TEST_CASE("Bell state carries one bit") {
        Circuit c(2);
        c.h(0).cnot(0, 1);
        CHECK(entanglement(run(c)) == doctest::Approx(1.0).epsilon(1e-9));
    }

    TEST_CASE("H on qubit 0 alone is a product state") {
        Circuit c(2);
        c.h(0);
        CHECK(entanglement(run(c)) == doctest::Approx(0.0).epsilon(1e-9));
    }

    TEST_CASE("basis states and single-qubit registers have none") {
        CHECK(entanglement(run(Circuit(3))) == doctest::Approx(0.0));
        Circuit one(1);
        one.h(0);
        CHECK(entanglement(run(one)) == doctest::Approx(0.0));
    }

    TEST_CASE("partial entanglement lies strictly between 0 and 1") {
        Circuit c(2);
        c.ry(0, M_PI / 3.0).cnot(0, 1);
        double e = entanglement(run(c));
        // Schmidt weights cos^2(pi/6) = 3/4, sin^2(pi/6) = 1/4
        double expected = -(0.75 * std::log2(0.75) + 0.25 * std::log2(0.25));
        CHECK(e == doctest::Approx(expected).epsilon(1e-9));
    }

    TEST_CASE("entanglement between other qubits does not show on qubit 0") {
        Circuit c(3);
        c.h(1).cnot(1, 2);
        CHECK(entanglement(run(c)) == doctest::Approx(0.0).epsilon(1e-9));
    }

    TEST_CASE("marginal entropy is the diagonal-only measure") {
        Circuit product(2);
        product.h(0);
        auto state = run(product);
        CHECK(marginal_entropy(state, 0) == doctest::Approx(1.0));
        CHECK(marginal_entropy(state, 1) == doctest::Approx(0.0));
        CHECK_THROWS_AS(marginal_entropy(state, 2), SimulationError);
    }
}

TEST_SUITE("Coherence") {
    TEST_CASE("basis state has no off-diagonal weight") {
        CHECK(coherence(run(Circuit(2))) == doctest::Approx(0.0));
    }

    TEST_CASE("never negative for basis and near-basis states") {
        QuantumState s;
        s.num_qubits = 3;
        s.amplitudes.assign(8, Complex(0.0, 0.0));
        s.amplitudes[5] = std::polar(0.9999999999999998, 0.7);
        CHECK(coherence(s) == 0.0);

        const double tiny[] = {1e-300, 1e-170, 3e-17, 1e-9};
        for (double t : tiny) {
            CAPTURE(t);
            for (std::size_t k = 0; k < s.amplitudes.size(); ++k) {
                if (k != 5) s.amplitudes[k] = Complex(t * (k + 1), -t);
            }
            double c = coherence(s);
            CHECK(c >= 0.0);
            CHECK(c == doctest::Approx(coherence_by_pairs(s)).epsilon(1e-9));
        }
    }

    TEST_CASE("Bell state") {
        Circuit c(2);
        c.h(0).cnot(0, 1);
        // one non-zero pair (0, 3) of magnitude 1/2, over 6 pairs
        CHECK(coherence(run(c)) == doctest::Approx(1.0 / 12.0));
    }

    TEST_CASE("uniform superposition reaches 1/N") {
        Circuit c(3);
        c.h(0).h(1).h(2);
        CHECK(coherence(run(c)) == doctest::Approx(1.0 / 8.0));
    }

    TEST_CASE("closed form matches the pairwise sum") {
        Circuit c(4);
        c.h(0).rx(1, 0.4).ry(2, 1.3).cnot(0, 3).rz(3, 0.9).y(1).cnot(2, 1);
        auto state = run(c);
        CHECK(coherence(state) == doctest::Approx(coherence_by_pairs(state)).epsilon(1e-12));
    }
}

TEST_SUITE("Expectations and measurement") {
    TEST_CASE("Z and X expectations") {
        Circuit zero(1);
        auto s0 = run(zero);
        CHECK(expectation_z(s0, 0) == doctest::Approx(1.0));
        CHECK(expectation_x(s0, 0) == doctest::Approx(0.0));

        Circuit plus(1);
        plus.h(0);
        auto sp = run(plus);
        CHECK(expectation_z(sp, 0) == doctest::Approx(0.0));
        CHECK(expectation_x(sp, 0) == doctest::Approx(1.0));

        Circuit one(2);
        one.x(1);
        CHECK(expectation_z(run(one), 1) == doctest::Approx(-1.0));
    }

    TEST_CASE("outcome probabilities per basis") {
        Circuit c(1);
        c.h(0);
        auto state = run(c);

        auto comp = outcome_probabilities(state, {0, MeasurementBasis::Computational, std::nullopt});
        CHECK(comp[0] == doctest::Approx(0.5));
        CHECK(comp[1] == doctest::Approx(0.5));

        auto had = outcome_probabilities(state, {0, MeasurementBasis::Hadamard, std::nullopt});
        CHECK(had[0] == doctest::Approx(1.0));
        CHECK(had[1] == doctest::Approx(0.0).epsilon(1e-12));

        auto custom_z = outcome_probabilities(state, {0, MeasurementBasis::Custom, 0.0});
        CHECK(custom_z[0] == doctest::Approx(0.5));

        auto custom_minus_x = outcome_probabilities(state, {0, MeasurementBasis::Custom, -M_PI / 2.0});
        CHECK(custom_minus_x[0] == doctest::Approx(0.0).epsilon(1e-12));
        CHECK(custom_minus_x[1] == doctest::Approx(1.0));
    }

    TEST_CASE("norm diagnostics") {
        Circuit c(3);
        c.h(0).rx(1, 0.3).cnot(0, 2);
        auto state = run(c);
        CHECK(norm(state) == doctest::Approx(1.0));
        CHECK(norm_deviation(state) < 1e-12);

        state.amplitudes[0] *= 1.01;
        CHECK(norm_deviation(state) > 1e-3);
    }

    TEST_CASE("summarize bundles every statistic") {
        Circuit c(2, {{0, MeasurementBasis::Computational, std::nullopt},
                      {1, MeasurementBasis::Hadamard, std::nullopt}});
        c.h(0).cnot(0, 1);
        auto state = run(c);
        auto summary = summarize(state, c.measurements());
        CHECK(summary.entanglement == doctest::Approx(1.0));
        CHECK(summary.coherence == doctest::Approx(1.0 / 12.0));
        CHECK(summary.norm_deviation < 1e-12);
        REQUIRE(summary.measurement_probabilities.size() == 2);
        CHECK(summary.measurement_probabilities[0][0] == doctest::Approx(0.5));
        CHECK(summary.measurement_probabilities[1][0] == doctest::Approx(0.5));
    }
}
