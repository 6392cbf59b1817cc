/*
 * qcsim command-line driver
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <cstdio>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <qcsim/cli/args.hpp>
#include <qcsim/cli/report.hpp>
#include <qcsim/config/loader.hpp>
#include <qcsim/logging/fmt_logger.hpp>
#include <qcsim/quantum/circuit_json.hpp>
#include <qcsim/quantum/simulator.hpp>
#include <qcsim/store/circuit_repository.hpp>

using namespace qcsim;

int main(int argc, char** argv) {
    logging::FmtLogger log;

    auto pr = cli::parse(argc, argv, log);
    if (pr.show_only) return 0;
    if (!pr.cfg) return 1;
    log.set_debug(pr.debug);

    config::SimConfig cfg;
    std::vector<std::string> errs = config::load_from_file(cfg, pr.config_path);
    auto env_errs = config::apply_env_overrides(cfg);
    errs.insert(errs.end(), env_errs.begin(), env_errs.end());
    cli::apply_cli_overrides(cfg, pr);
    if (errs.empty()) errs = config::validate_final(cfg);
    if (!errs.empty()) {
        for (const auto& e : errs) log.error(fmt::format("Config: {}", e));
        return 1;
    }
    // stdout carries only the JSON document
    if (cfg.output == "json") log.set_stream(stderr);
    log.debug(fmt::format("config: max_qubits={} workers={} norm_tolerance={} output={}",
                          cfg.max_qubits, cfg.workers, cfg.norm_tolerance, cfg.output));

    if (pr.circuits.empty()) {
        log.error("No circuit files given (use --circuit <file.json>)");
        return 1;
    }

    store::InMemoryCircuitRepository repository;
    std::vector<quantum::Circuit> circuits;
    std::vector<std::string> ids;
    for (const auto& path : pr.circuits) {
        try {
            circuits.push_back(quantum::circuit_from_file(path));
            ids.push_back(repository.put(circuits.back()));
            log.debug(fmt::format("loaded {} as {}", path, ids.back()));
        } catch (const quantum::SimulationError& e) {
            log.error(fmt::format("{}: {} ({})", path, e.what(), quantum::error_code_name(e.code())));
            return 1;
        } catch (const std::exception& e) {
            log.error(fmt::format("{}: {}", path, e.what()));
            return 1;
        }
    }

    std::vector<quantum::QuantumState> states;
    try {
        auto simulator = quantum::create_cpu_simulator(cfg.max_qubits, static_cast<unsigned>(cfg.workers));
        log.debug(fmt::format("simulating {} circuit(s) on {}", circuits.size(), simulator->backend_name()));
        states = simulator->simulate_batch(circuits);
    } catch (const quantum::SimulationError& e) {
        log.error(fmt::format("Simulation failed: {} ({})", e.what(), quantum::error_code_name(e.code())));
        return 1;
    } catch (const std::exception& e) {
        log.error(fmt::format("Simulation failed: {}", e.what()));
        return 1;
    }

    std::vector<cli::RunResult> runs;
    runs.reserve(circuits.size());
    for (std::size_t i = 0; i < circuits.size(); ++i) {
        runs.push_back({pr.circuits[i], ids[i], std::move(circuits[i]), std::move(states[i])});
    }
    cli::write_report(stdout, log, cfg, runs, pr.amplitudes);
    return 0;
}
