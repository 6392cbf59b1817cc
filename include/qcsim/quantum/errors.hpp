/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace qcsim {
namespace quantum {

/**
 * Failure conditions raised by the circuit builder and the simulators
 */
enum class ErrorCode {
    InvalidQubitCount,      // n < 1
    InvalidQubitIndex,      // index outside [0, n) or repeated in one gate
    InvalidGateArity,       // wrong number of qubit indices for the gate kind
    InvalidParameterCount,  // rotation without exactly one angle, etc.
    UnsupportedGate,        // declared gate kind with no simulator kernel
    QubitCountExceeded      // circuit larger than the configured ceiling
};

const char* error_code_name(ErrorCode code);

class SimulationError : public std::runtime_error {
public:
    SimulationError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace quantum
} // namespace qcsim
