/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qcsim/quantum/errors.hpp"

namespace qcsim {
namespace quantum {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidQubitCount: return "InvalidQubitCount";
        case ErrorCode::InvalidQubitIndex: return "InvalidQubitIndex";
        case ErrorCode::InvalidGateArity: return "InvalidGateArity";
        case ErrorCode::InvalidParameterCount: return "InvalidParameterCount";
        case ErrorCode::UnsupportedGate: return "UnsupportedGate";
        case ErrorCode::QubitCountExceeded: return "QubitCountExceeded";
    }
    return "UNKNOWN";
}

} // namespace quantum
} // namespace qcsim
