#pragma once

#include <intx/intx.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace util {

// Time
uint64_t current_timestamp_s();
int64_t current_timestamp_ms();
std::string current_iso8601();

// Strings
std::string to_lower(const std::string& s);
bool equals_ignore_case(const std::string& a, const std::string& b);
std::string short_hex(const std::string& s);

// Validation
bool is_hex_string(const std::string& s);    // 0x-prefixed, any number of hex digits
bool is_hex_data(const std::string& s);      // 0x-prefixed, even number of hex digits
bool is_valid_address(const std::string& s);
bool is_valid_tx_hash(const std::string& s);
bool is_decimal(const std::string& s);
void require_address(const std::string& s, const char* what = "address");
void require_tx_hash(const std::string& s);

// Quantities. Wei amounts exceed 64 bits and are held as uint256.
uint64_t hex_to_u64(const std::string& hex);
std::optional<uint64_t> parse_u64(const std::string& decimal);
std::string u64_to_hex(uint64_t value);
intx::uint256 hex_to_u256(const std::string& hex);
intx::uint256 decimal_to_u256(const std::string& decimal);
std::string u256_to_hex(const intx::uint256& value);

// Display only: "1500000000000000000" at 18 decimals is "1.5".
std::string format_units(const intx::uint256& amount, unsigned decimals);

} // namespace util
