#pragma once

#include <string>
#include <vector>
#include "chain_backend.hpp"
#include "network.hpp"

namespace cosign {

struct BitcoinCliOptions {
    std::string binary = "bitcoin-cli";
    std::vector<std::string> extra_args;   // e.g. -rpcwallet=x, -rpcport=18443
    unsigned timeout_seconds = 30;
    Network network = Network::Regtest;
};

// ChainBackend driving a Bitcoin Core node through bitcoin-cli
class BitcoinCliBackend : public ChainBackend {
public:
    explicit BitcoinCliBackend(BitcoinCliOptions options);

    std::vector<Utxo> list_spendable_outputs(const std::string& address) override;
    FeeRates estimate_fee_rates() override;
    std::string broadcast(const std::string& raw_tx_hex) override;
    uint64_t get_confirmations(const std::string& txid) override;

    // Run bitcoin-cli with the given RPC arguments and return its trimmed output
    std::string execute(const std::vector<std::string>& args) const;

    // Converts a BTC amount as reported by RPC into satoshis
    static uint64_t btc_to_satoshis(double btc);

    // Converts estimatesmartfee's BTC/kvB into sat/vB tiers
    static FeeRates fee_tiers(double btc_per_kvb);

private:
    BitcoinCliOptions options_;
};

} // namespace cosign
