#include "util.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace util {

namespace {

const char* kHexDigits = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool has_hex_prefix(const std::string& s) {
    return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

std::string strip_hex_prefix(const std::string& hex) {
    if (!has_hex_prefix(hex)) {
        throw ParseError("expected 0x-prefixed quantity, got '" + hex + "'");
    }
    std::string digits = hex.substr(2);
    for (char c : digits) {
        if (hex_value(c) < 0) {
            throw ParseError("invalid hex quantity '" + hex + "'");
        }
    }
    return digits;
}

bool is_fixed_hex(const std::string& s, size_t digits) {
    return s.size() == digits + 2 && is_hex_string(s);
}

} // namespace

uint64_t current_timestamp_s() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool equals_ignore_case(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string short_hex(const std::string& s) {
    if (s.size() <= 14) return s;
    return s.substr(0, 8) + "..." + s.substr(s.size() - 4);
}

bool is_hex_string(const std::string& s) {
    if (!has_hex_prefix(s)) return false;
    return std::all_of(s.begin() + 2, s.end(), [](char c) { return hex_value(c) >= 0; });
}

bool is_hex_data(const std::string& s) {
    return is_hex_string(s) && (s.size() % 2 == 0);
}

bool is_valid_address(const std::string& s) {
    return is_fixed_hex(s, 40);
}

bool is_valid_tx_hash(const std::string& s) {
    return is_fixed_hex(s, 64);
}

bool is_decimal(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

void require_address(const std::string& s, const char* what) {
    if (!is_valid_address(s)) {
        throw ValidationError(std::string("invalid ") + what + " '" + s + "'");
    }
}

void require_tx_hash(const std::string& s) {
    if (!is_valid_tx_hash(s)) {
        throw ValidationError("invalid transaction hash '" + s + "'");
    }
}

uint64_t hex_to_u64(const std::string& hex) {
    std::string digits = strip_hex_prefix(hex);
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) return 0;
    if (digits.size() - first > 16) {
        throw ParseError("quantity '" + hex + "' does not fit in 64 bits");
    }
    uint64_t value = 0;
    for (size_t i = first; i < digits.size(); ++i) {
        value = (value << 4) | static_cast<uint64_t>(hex_value(digits[i]));
    }
    return value;
}

std::optional<uint64_t> parse_u64(const std::string& decimal) {
    if (!is_decimal(decimal)) return std::nullopt;
    uint64_t value = 0;
    for (char c : decimal) {
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

std::string u64_to_hex(uint64_t value) {
    if (value == 0) return "0x0";
    std::string out;
    while (value > 0) {
        out.push_back(kHexDigits[value & 0xf]);
        value >>= 4;
    }
    std::reverse(out.begin(), out.end());
    return "0x" + out;
}

intx::uint256 hex_to_u256(const std::string& hex) {
    std::string digits = strip_hex_prefix(hex);
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) return 0;
    if (digits.size() - first > 64) {
        throw ParseError("quantity '" + hex + "' does not fit in 256 bits");
    }
    return intx::from_string<intx::uint256>(("0x" + digits.substr(first)).c_str());
}

intx::uint256 decimal_to_u256(const std::string& decimal) {
    if (!is_decimal(decimal)) {
        throw ParseError("invalid decimal amount '" + decimal + "'");
    }
    size_t first = decimal.find_first_not_of('0');
    if (first == std::string::npos) return 0;
    try {
        return intx::from_string<intx::uint256>(decimal.substr(first).c_str());
    } catch (const std::out_of_range&) {
        throw ParseError("amount '" + decimal + "' does not fit in 256 bits");
    }
}

std::string u256_to_hex(const intx::uint256& value) {
    return "0x" + intx::hex(value);
}

std::string format_units(const intx::uint256& amount, unsigned decimals) {
    std::string digits = intx::to_string(amount);
    if (decimals == 0) return digits;

    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }
    std::string whole = digits.substr(0, digits.size() - decimals);
    std::string frac = digits.substr(digits.size() - decimals);
    frac.erase(frac.find_last_not_of('0') + 1);

    return frac.empty() ? whole : whole + "." + frac;
}

} // namespace util
