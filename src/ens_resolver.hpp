#pragma once

#include "chain_reader.hpp"
#include <memory>
#include <optional>
#include <string>

// Reverse ENS resolution on Ethereum mainnet over eth_call.
class EnsResolver {
public:
    static constexpr const char* kRegistryAddress = "0x00000000000c2e074ec69a0dfb2997ba6c7d2e1e";

    explicit EnsResolver(std::shared_ptr<RpcBackend> rpc);

    // Primary name of an address, verified by forward resolution.
    // nullopt when no name is bound or the forward record disagrees.
    std::optional<std::string> lookup_address(const std::string& address);

    static std::string namehash(const std::string& name);

private:
    std::optional<std::string> resolver_for(const std::string& node);

    std::shared_ptr<RpcBackend> rpc_;
};
