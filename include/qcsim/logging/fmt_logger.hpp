#pragma once

#include <qcsim/logging/logger.hpp>

#include <atomic>
#include <cstdio>
#include <string>

namespace qcsim::logging {

// "[HH:MM:SS] [LEVEL] msg" lines; errors go to stderr, the rest to stdout
// unless redirected with set_stream (stdout may be reserved for a report)
class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false) : enable_debug_(enable_debug) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    void set_debug(bool v) { enable_debug_.store(v); }
    void set_stream(std::FILE* out) { out_.store(out); }

private:
    std::atomic<bool> enable_debug_{false};
    std::atomic<std::FILE*> out_{stdout};
};

std::string now_hms();

} // namespace qcsim::logging
