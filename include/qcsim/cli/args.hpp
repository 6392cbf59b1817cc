#pragma once

#include <qcsim/config/types.hpp>
#include <qcsim/logging/logger.hpp>

namespace qcsim::cli {

// Parse CLI using cxxopts. Writes help/version through provided logger when requested.
qcsim::config::ParseResult parse(int argc, char** argv, qcsim::logging::Logger& log);

// Apply the flags the user actually passed on top of file/env configuration.
void apply_cli_overrides(qcsim::config::SimConfig& cfg, const qcsim::config::ParseResult& pr);

} // namespace qcsim::cli
