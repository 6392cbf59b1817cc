#pragma once

#include <cstdio>
#include <string>
#include <vector>

#include <qcsim/config/types.hpp>
#include <qcsim/logging/logger.hpp>
#include <qcsim/quantum/circuit.hpp>
#include <qcsim/quantum/simulator.hpp>

namespace qcsim::cli {

struct RunResult {
    std::string path;
    std::string id;  // repository fingerprint
    quantum::Circuit circuit;
    quantum::QuantumState state;
};

// Summarize every run and report it. With output=json the only thing written
// to `out` is a single JSON array; warnings (norm drift) still go to `log`.
// With output=text the report itself is written through `log`.
void write_report(std::FILE* out, logging::Logger& log, const config::SimConfig& cfg,
                  const std::vector<RunResult>& runs, bool amplitudes);

} // namespace qcsim::cli
