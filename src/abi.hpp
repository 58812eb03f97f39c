#pragma once

#include <intx/intx.hpp>
#include <string>
#include <vector>

// Minimal ABI word codec for the fixed set of read-only calls the explorer
// issues (ENS registry/resolver and ERC-20 metadata).
class Abi {
public:
    static constexpr const char* kSelectorResolver = "0x0178b8bf";    // resolver(bytes32)
    static constexpr const char* kSelectorName = "0x691f3431";        // name(bytes32)
    static constexpr const char* kSelectorAddr = "0x3b3b57de";        // addr(bytes32)
    static constexpr const char* kSelectorTokenName = "0x06fdde03";   // name()
    static constexpr const char* kSelectorSymbol = "0x95d89b41";      // symbol()
    static constexpr const char* kSelectorDecimals = "0x313ce567";    // decimals()
    static constexpr const char* kSelectorTotalSupply = "0x18160ddd"; // totalSupply()

    // selector + 32-byte words, each given as 0x-prefixed hex of up to 64 digits
    static std::string encode_call(const std::string& selector,
                                   const std::vector<std::string>& words = {});

    static std::string decode_address(const std::string& data);
    static intx::uint256 decode_uint(const std::string& data);
    static std::string decode_string(const std::string& data);

    static bool is_zero_address(const std::string& address);
};
