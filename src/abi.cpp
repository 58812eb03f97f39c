#include "abi.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace {

constexpr size_t kWordDigits = 64;

std::string payload_of(const std::string& data) {
    if (!util::is_hex_data(data)) {
        throw ParseError("call result is not hex data: '" + util::short_hex(data) + "'");
    }
    return util::to_lower(data.substr(2));
}

std::string word_at(const std::string& payload, size_t index) {
    size_t start = index * kWordDigits;
    if (payload.size() < start + kWordDigits) {
        throw ParseError("call result too short for word " + std::to_string(index));
    }
    return payload.substr(start, kWordDigits);
}

size_t word_as_size(const std::string& word) {
    uint64_t v = util::hex_to_u64("0x" + word);
    if (v > (1ULL << 32)) {
        throw ParseError("implausible ABI offset or length");
    }
    return static_cast<size_t>(v);
}

std::string bytes_from_hex(const std::string& hex) {
    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

} // namespace

std::string Abi::encode_call(const std::string& selector, const std::vector<std::string>& words) {
    if (!util::is_hex_data(selector) || selector.size() != 10) {
        throw ValidationError("invalid function selector '" + selector + "'");
    }
    std::string out = util::to_lower(selector);
    for (const auto& word : words) {
        if (!util::is_hex_string(word) || word.size() - 2 > kWordDigits) {
            throw ValidationError("invalid ABI word '" + word + "'");
        }
        std::string digits = util::to_lower(word.substr(2));
        out += std::string(kWordDigits - digits.size(), '0') + digits;
    }
    return out;
}

std::string Abi::decode_address(const std::string& data) {
    std::string word = word_at(payload_of(data), 0);
    return "0x" + word.substr(kWordDigits - 40);
}

intx::uint256 Abi::decode_uint(const std::string& data) {
    return util::hex_to_u256("0x" + word_at(payload_of(data), 0));
}

std::string Abi::decode_string(const std::string& data) {
    std::string payload = payload_of(data);
    if (payload.empty()) return "";

    // Some older tokens return bytes32 instead of a dynamic string
    if (payload.size() == kWordDigits) {
        std::string raw = bytes_from_hex(payload);
        raw.erase(raw.find_last_not_of('\0') + 1);
        return raw;
    }

    size_t offset = word_as_size(word_at(payload, 0));
    if (offset % 32 != 0) {
        throw ParseError("misaligned ABI string offset");
    }
    size_t length = word_as_size(word_at(payload, offset / 32));
    size_t start = offset * 2 + kWordDigits;
    if (payload.size() < start + length * 2) {
        throw ParseError("ABI string length exceeds call result");
    }
    return bytes_from_hex(payload.substr(start, length * 2));
}

bool Abi::is_zero_address(const std::string& address) {
    return util::is_valid_address(address) &&
           address.find_first_not_of('0', 2) == std::string::npos;
}
