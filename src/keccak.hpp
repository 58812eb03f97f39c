#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// Keccak-256 as used by Ethereum (original padding, not NIST SHA3-256).
using Hash256 = std::array<uint8_t, 32>;

Hash256 keccak256(const uint8_t* data, size_t len);
Hash256 keccak256(const std::string& data);

std::string to_hex(const Hash256& hash);
