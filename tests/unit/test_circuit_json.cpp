/*
 * Unit tests for the circuit JSON codec
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>

#include <qcsim/quantum/circuit_json.hpp>
#include <qcsim/quantum/cpu_simulator.hpp>
#include <nlohmann/json.hpp>

using namespace qcsim::quantum;
using json = nlohmann::json;

TEST_SUITE("Circuit JSON") {
    TEST_CASE("circuit_from_string - bell circuit with measurements") {
        auto c = circuit_from_string(R"({
            "qubits": 2,
            "gates": [
                {"type": "H", "qubits": [0]},
                {"type": "CNOT", "qubits": [0, 1]},
                {"type": "RZ", "qubits": [1], "parameters": [0.5]}
            ],
            "measurements": [
                {"qubit": 0},
                {"qubit": 1, "basis": "custom", "angle": 1.25}
            ]
        })");

        CHECK(c.num_qubits() == 2);
        REQUIRE(c.gates().size() == 3);
        CHECK(c.gates()[1].type == GateType::CNOT);
        CHECK(c.gates()[2].parameters == std::vector<double>{0.5});
        REQUIRE(c.measurements().size() == 2);
        CHECK(c.measurements()[0].basis == MeasurementBasis::Computational);
        CHECK(c.measurements()[1].basis == MeasurementBasis::Custom);
        CHECK(*c.measurements()[1].angle == doctest::Approx(1.25));
    }

    TEST_CASE("gates and measurements are optional") {
        auto c = circuit_from_string(R"({"qubits": 3})");
        CHECK(c.num_qubits() == 3);
        CHECK(c.gates().empty());
        CHECK(c.measurements().empty());
    }

    TEST_CASE("malformed documents raise CircuitFormatError") {
        CHECK_THROWS_AS(circuit_from_string("not json"), CircuitFormatError);
        CHECK_THROWS_AS(circuit_from_string("[]"), CircuitFormatError);
        CHECK_THROWS_AS(circuit_from_string(R"({"gates": []})"), CircuitFormatError);
        CHECK_THROWS_AS(circuit_from_string(R"({"qubits": "2"})"), CircuitFormatError);
        CHECK_THROWS_AS(circuit_from_string(R"({"qubits": 1, "gates": [{"type": "U3", "qubits": [0]}]})"),
                        CircuitFormatError);
        CHECK_THROWS_AS(circuit_from_string(R"({"qubits": 1, "gates": [{"type": "H"}]})"),
                        CircuitFormatError);
        CHECK_THROWS_AS(circuit_from_string(R"({"qubits": 1, "gates": [{"type": "RX", "qubits": [0], "parameters": ["x"]}]})"),
                        CircuitFormatError);
        CHECK_THROWS_AS(circuit_from_string(R"({"qubits": 1, "measurements": [{"qubit": 0, "basis": "bell"}]})"),
                        CircuitFormatError);
    }

    TEST_CASE("builder validation surfaces as SimulationError") {
        try {
            (void)circuit_from_string(R"({"qubits": 2, "gates": [{"type": "X", "qubits": [2]}]})");
            FAIL("expected SimulationError");
        } catch (const SimulationError& e) {
            CHECK(e.code() == ErrorCode::InvalidQubitIndex);
        }
        try {
            (void)circuit_from_string(R"({"qubits": 1, "gates": [{"type": "RY", "qubits": [0]}]})");
            FAIL("expected SimulationError");
        } catch (const SimulationError& e) {
            CHECK(e.code() == ErrorCode::InvalidParameterCount);
        }
    }

    TEST_CASE("integers beyond int range are rejected, not wrapped") {
        auto code_of = [](const std::string& text) {
            try {
                (void)circuit_from_string(text);
            } catch (const SimulationError& e) {
                return e.code();
            }
            FAIL("expected SimulationError");
            return ErrorCode::UnsupportedGate;
        };
        CHECK(code_of(R"({"qubits": 2, "gates": [{"type": "X", "qubits": [4294967296]}]})") ==
              ErrorCode::InvalidQubitIndex);
        CHECK(code_of(R"({"qubits": 2, "gates": [{"type": "CNOT", "qubits": [0, -4294967295]}]})") ==
              ErrorCode::InvalidQubitIndex);
        CHECK(code_of(R"({"qubits": 2, "measurements": [{"qubit": 18446744073709551615}]})") ==
              ErrorCode::InvalidQubitIndex);
        CHECK(code_of(R"({"qubits": 4294967297})") == ErrorCode::InvalidQubitCount);
        CHECK(code_of(R"({"qubits": 2, "gates": [{"type": "X", "qubits": [2147483647]}]})") ==
              ErrorCode::InvalidQubitIndex);
    }

    TEST_CASE("missing file") {
        CHECK_THROWS_AS(circuit_from_file("/nonexistent/qcsim/circuit.json"), CircuitFormatError);
    }

    TEST_CASE("circuit_to_json is accepted by circuit_from_json") {
        Circuit c(3, {{2, MeasurementBasis::Hadamard, std::nullopt}});
        c.h(0).cnot(0, 1).rx(2, 0.125).swap(1, 2);
        json j = circuit_to_json(c);
        CHECK(j.at("qubits") == 3);
        CHECK(j.at("gates").size() == 4);
        CHECK(j.at("gates")[2].at("type") == "RX");
        CHECK_FALSE(j.at("gates")[0].contains("parameters"));
        CHECK(circuit_from_json(j) == c);
    }

    TEST_CASE("summary_to_json") {
        Circuit c(2, {{0, MeasurementBasis::Computational, std::nullopt}});
        c.h(0).cnot(0, 1);
        CPUSimulator sim(4, 1);
        auto state = sim.simulate(c);
        auto summary = summarize(state, c.measurements());

        json brief = summary_to_json(state, c, summary, false);
        CHECK(brief.at("qubits") == 2);
        CHECK(brief.at("depth") == 2);
        CHECK(brief.at("probabilities").size() == 4);
        CHECK(brief.at("entanglement").get<double>() == doctest::Approx(1.0));
        CHECK_FALSE(brief.contains("amplitudes"));
        REQUIRE(brief.at("measurements").size() == 1);
        CHECK(brief.at("measurements")[0].at("p0").get<double>() == doctest::Approx(0.5));

        json full = summary_to_json(state, c, summary, true);
        REQUIRE(full.at("amplitudes").size() == 4);
        CHECK(full.at("amplitudes")[3][0].get<double>() == doctest::Approx(1.0 / std::sqrt(2.0)));
        CHECK(full.at("amplitudes")[3][1].get<double>() == doctest::Approx(0.0));
    }
}
