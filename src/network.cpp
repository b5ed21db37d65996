#include "network.hpp"
#include "error.hpp"

namespace cosign {

const NetworkParams& network_params(Network network) {
    static const NetworkParams MAINNET{Network::Mainnet, "mainnet", "bc", 0x00, 0x05};
    static const NetworkParams TESTNET{Network::Testnet, "testnet", "tb", 0x6f, 0xc4};
    static const NetworkParams SIGNET{Network::Signet, "signet", "tb", 0x6f, 0xc4};
    static const NetworkParams REGTEST{Network::Regtest, "regtest", "bcrt", 0x6f, 0xc4};

    switch (network) {
        case Network::Mainnet: return MAINNET;
        case Network::Testnet: return TESTNET;
        case Network::Signet:  return SIGNET;
        case Network::Regtest: return REGTEST;
    }
    return REGTEST;
}

Network parse_network(std::string_view name) {
    if (name == "mainnet" || name == "main") return Network::Mainnet;
    if (name == "testnet" || name == "test") return Network::Testnet;
    if (name == "signet") return Network::Signet;
    if (name == "regtest") return Network::Regtest;
    throw CosignError(CosignError::ErrorType::Validation,
        "Unknown network: " + std::string(name));
}

} // namespace cosign
