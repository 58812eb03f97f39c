#include "ens_resolver.hpp"
#include "abi.hpp"
#include "keccak.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <vector>

EnsResolver::EnsResolver(std::shared_ptr<RpcBackend> rpc)
    : rpc_(std::move(rpc))
{}

std::string EnsResolver::namehash(const std::string& name) {
    Hash256 node{};
    if (name.empty()) {
        return to_hex(node);
    }

    std::vector<std::string> labels;
    size_t start = 0;
    while (true) {
        size_t dot = name.find('.', start);
        labels.push_back(name.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }

    // Labels are hashed right to left
    for (auto it = labels.rbegin(); it != labels.rend(); ++it) {
        Hash256 label = keccak256(*it);

        uint8_t buf[64];
        std::memcpy(buf, node.data(), 32);
        std::memcpy(buf + 32, label.data(), 32);
        node = keccak256(buf, sizeof(buf));
    }
    return to_hex(node);
}

std::optional<std::string> EnsResolver::resolver_for(const std::string& node) {
    CallRequest request;
    request.to = kRegistryAddress;
    request.data = Abi::encode_call(Abi::kSelectorResolver, {node});

    std::string resolver = Abi::decode_address(rpc_->call(request));
    if (Abi::is_zero_address(resolver)) return std::nullopt;
    return resolver;
}

std::optional<std::string> EnsResolver::lookup_address(const std::string& address) {
    std::string reverse_name = util::to_lower(address.substr(2)) + ".addr.reverse";
    std::string reverse_node = namehash(reverse_name);

    auto resolver = resolver_for(reverse_node);
    if (!resolver) {
        spdlog::debug("No reverse resolver for {}", util::short_hex(address));
        return std::nullopt;
    }

    CallRequest name_call;
    name_call.to = *resolver;
    name_call.data = Abi::encode_call(Abi::kSelectorName, {reverse_node});
    std::string name = Abi::decode_string(rpc_->call(name_call));
    if (name.empty()) return std::nullopt;

    // A reverse record is only trusted when the name resolves back to the address
    std::string forward_node = namehash(name);
    auto forward_resolver = resolver_for(forward_node);
    if (!forward_resolver) return std::nullopt;

    CallRequest addr_call;
    addr_call.to = *forward_resolver;
    addr_call.data = Abi::encode_call(Abi::kSelectorAddr, {forward_node});
    std::string resolved = Abi::decode_address(rpc_->call(addr_call));

    if (!util::equals_ignore_case(resolved, address)) {
        spdlog::warn("ENS name {} does not resolve back to {}", name, util::short_hex(address));
        return std::nullopt;
    }
    return name;
}
