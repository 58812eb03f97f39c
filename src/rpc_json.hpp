#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Decoding of standard Ethereum JSON-RPC objects. Both the node adapter and
// the explorer's proxy module return these shapes.
class RpcJson {
public:
    static Block parse_block(const nlohmann::json& obj);
    static Transaction parse_transaction(const nlohmann::json& obj);
    static Receipt parse_receipt(const nlohmann::json& obj);

    static uint64_t quantity(const nlohmann::json& value, const char* what);
    static std::string require_string(const nlohmann::json& obj, const char* key);
    static std::optional<std::string> optional_string(const nlohmann::json& obj, const char* key);
    static std::optional<uint64_t> optional_quantity(const nlohmann::json& obj, const char* key);

    static nlohmann::json call_object(const CallRequest& request);
};
