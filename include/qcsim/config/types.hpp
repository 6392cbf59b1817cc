#pragma once

#include <optional>
#include <string>
#include <vector>

namespace qcsim::config {

struct SimConfig {
    int max_qubits{20};            // ceiling checked before allocating 2^n amplitudes
    int workers{0};                // batch threads, 0 = hardware concurrency
    double norm_tolerance{1e-9};   // warn when |norm - 1| exceeds this
    std::string output{"text"};    // "text" or "json"
};

struct ParseResult {
    std::optional<SimConfig> cfg;       // present when arguments parsed
    std::string config_path{"qcsim.conf"};
    std::vector<std::string> circuits;  // circuit JSON files, in order
    bool show_only{false};              // true if --help/--version was printed
    bool debug{false};                  // true if --debug was passed on CLI
    bool amplitudes{false};             // include amplitudes in the report
    bool max_qubits_set{false};         // CLI flags override file/env values
    bool workers_set{false};
    bool output_set{false};
};

} // namespace qcsim::config
