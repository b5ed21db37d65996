#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace cosign {

enum class Network {
    Mainnet,
    Testnet,
    Signet,
    Regtest
};

// Address encoding parameters of a Bitcoin network
struct NetworkParams {
    Network network;
    std::string name;
    std::string bech32_hrp;
    uint8_t p2pkh_version;
    uint8_t p2sh_version;
};

const NetworkParams& network_params(Network network);

// Parses "mainnet", "testnet", "signet" or "regtest"; throws ValidationError otherwise
Network parse_network(std::string_view name);

} // namespace cosign
