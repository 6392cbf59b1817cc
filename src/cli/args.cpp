#include <qcsim/cli/args.hpp>

#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <fmt/core.h>

#ifndef QCSIM_VERSION
#define QCSIM_VERSION "0.0.0"
#endif

namespace qcsim::cli {

qcsim::config::ParseResult parse(int argc, char** argv, qcsim::logging::Logger& log) {
    qcsim::config::ParseResult pr;
    cxxopts::Options options("qcsim", "Quantum circuit state-vector simulator");
    options.add_options()
        ("c,circuit",    "Circuit JSON file (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("config",       "Path to config file (qcsim.conf)", cxxopts::value<std::string>()->default_value("qcsim.conf"))
        ("max-qubits",   "Refuse circuits with more qubits than this", cxxopts::value<int>())
        ("workers",      "Threads for batch simulation (0 = auto)", cxxopts::value<int>())
        ("json",         "Print results as one JSON document")
        ("amplitudes",   "Include complex amplitudes in the report")
        ("d,debug",      "Enable debug logging")
        ("v,version",    "Show version and exit")
        ("h,help",       "Show help and exit");
    options.parse_positional({"circuit"});
    options.positional_help("[circuit.json...]");
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("qcsim v{}", QCSIM_VERSION));
            pr.show_only = true;
            return pr;
        }
        qcsim::config::SimConfig cfg;
        if (result.count("max-qubits")) {
            cfg.max_qubits = result["max-qubits"].as<int>();
            pr.max_qubits_set = true;
        }
        if (result.count("workers")) {
            cfg.workers = result["workers"].as<int>();
            pr.workers_set = true;
        }
        if (result.count("json")) {
            cfg.output = "json";
            pr.output_set = true;
        }
        if (result.count("circuit")) {
            pr.circuits = result["circuit"].as<std::vector<std::string>>();
        }
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.amplitudes = result.count("amplitudes") > 0;
        pr.cfg = cfg;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

void apply_cli_overrides(qcsim::config::SimConfig& cfg, const qcsim::config::ParseResult& pr) {
    if (!pr.cfg) return;
    if (pr.max_qubits_set) cfg.max_qubits = pr.cfg->max_qubits;
    if (pr.workers_set) cfg.workers = pr.cfg->workers;
    if (pr.output_set) cfg.output = pr.cfg->output;
}

} // namespace qcsim::cli
