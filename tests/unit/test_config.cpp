/*
 * Unit tests for config loading and validation
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>

#include <qcsim/config/loader.hpp>
#include <qcsim/config/validator.hpp>

using namespace qcsim::config;

static std::string write_file(const std::string& name, const std::string& text) {
    std::ofstream out(name);
    out << text;
    return name;
}

TEST_SUITE("Config Validator") {
    TEST_CASE("validate_max_qubits") {
        std::string err;
        CHECK(validate_max_qubits(1, err));
        CHECK(validate_max_qubits(20, err));
        CHECK(validate_max_qubits(30, err));
        CHECK_FALSE(validate_max_qubits(0, err));
        CHECK(err.find("max_qubits") != std::string::npos);
        CHECK_FALSE(validate_max_qubits(31, err));
    }

    TEST_CASE("validate_workers") {
        std::string err;
        CHECK(validate_workers(0, err));
        CHECK(validate_workers(256, err));
        CHECK_FALSE(validate_workers(-1, err));
        CHECK_FALSE(validate_workers(257, err));
    }

    TEST_CASE("validate_norm_tolerance") {
        std::string err;
        CHECK(validate_norm_tolerance(1e-9, err));
        CHECK_FALSE(validate_norm_tolerance(0.0, err));
        CHECK_FALSE(validate_norm_tolerance(-1.0, err));
    }

    TEST_CASE("validate_output") {
        std::string err;
        CHECK(validate_output("text", err));
        CHECK(validate_output("json", err));
        CHECK_FALSE(validate_output("xml", err));
        CHECK(err.find("xml") != std::string::npos);
    }

    TEST_CASE("validate_final - defaults are valid") {
        CHECK(validate_final(SimConfig{}).empty());
        SimConfig bad;
        bad.max_qubits = 64;
        bad.output = "yaml";
        CHECK(validate_final(bad).size() == 2);
    }
}

TEST_SUITE("Config Loader") {
    TEST_CASE("missing file is not an error") {
        SimConfig cfg;
        CHECK(load_from_file(cfg, "qcsim_test_missing.conf").empty());
        CHECK(cfg.max_qubits == 20);
    }

    TEST_CASE("key=value file") {
        auto path = write_file("qcsim_test_kv.conf",
                               "# comment\n"
                               "max_qubits = 12\n"
                               "workers=3\n"
                               "norm_tolerance=1e-6\n"
                               "output=json\n"
                               "unknown=ignored\n");
        SimConfig cfg;
        CHECK(load_from_file(cfg, path).empty());
        CHECK(cfg.max_qubits == 12);
        CHECK(cfg.workers == 3);
        CHECK(cfg.norm_tolerance == doctest::Approx(1e-6));
        CHECK(cfg.output == "json");
        std::remove(path.c_str());
    }

    TEST_CASE("key=value file with a bad number") {
        auto path = write_file("qcsim_test_kv_bad.conf", "max_qubits=lots\n");
        SimConfig cfg;
        auto errs = load_from_file(cfg, path);
        REQUIRE(errs.size() == 1);
        CHECK(errs[0].find("max_qubits") != std::string::npos);
        CHECK(cfg.max_qubits == 20);
        std::remove(path.c_str());
    }

    TEST_CASE("JSON file") {
        auto path = write_file("qcsim_test.json.conf",
                               R"({"max_qubits": 8, "workers": 2, "norm_tolerance": 1e-7, "output": "text"})");
        SimConfig cfg;
        CHECK(load_from_file(cfg, path).empty());
        CHECK(cfg.max_qubits == 8);
        CHECK(cfg.workers == 2);
        CHECK(cfg.norm_tolerance == doctest::Approx(1e-7));
        std::remove(path.c_str());
    }

    TEST_CASE("JSON file with errors is not applied") {
        auto path = write_file("qcsim_test_bad.json.conf", R"({"max_qubits": 99, "workers": 2})");
        SimConfig cfg;
        auto errs = load_from_file(cfg, path);
        CHECK(errs.size() == 1);
        CHECK(cfg.max_qubits == 20);
        CHECK(cfg.workers == 0);
        std::remove(path.c_str());

        path = write_file("qcsim_test_type.json.conf", R"({"max_qubits": "8"})");
        CHECK(load_from_file(cfg, path).size() == 1);
        std::remove(path.c_str());

        path = write_file("qcsim_test_syntax.json.conf", R"({"max_qubits": )");
        CHECK(load_from_file(cfg, path).size() == 1);
        std::remove(path.c_str());
    }

    TEST_CASE("environment overrides") {
        setenv("QCSIM_MAX_QUBITS", "6", 1);
        setenv("QCSIM_OUTPUT", "json", 1);
        SimConfig cfg;
        CHECK(apply_env_overrides(cfg).empty());
        CHECK(cfg.max_qubits == 6);
        CHECK(cfg.output == "json");

        setenv("QCSIM_WORKERS", "many", 1);
        CHECK(apply_env_overrides(cfg).size() == 1);

        unsetenv("QCSIM_MAX_QUBITS");
        unsetenv("QCSIM_OUTPUT");
        unsetenv("QCSIM_WORKERS");
    }
}
