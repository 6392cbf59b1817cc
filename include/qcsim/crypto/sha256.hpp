/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <vector>
#include <cstdint>
#include <string>

namespace qcsim {
namespace crypto {

/**
 * Compute SHA256 hash
 * @param data Input data to hash
 * @return 32-byte hash output
 */
std::vector<uint8_t> sha256(const std::string& data);

/**
 * Lowercase hex encoding of a byte buffer
 */
std::string to_hex(const std::vector<uint8_t>& bytes);

} // namespace crypto
} // namespace qcsim
