#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "utxo.hpp"

namespace cosign {

// Fee rate tiers in sat/vB
struct FeeRates {
    uint64_t fastest;
    uint64_t normal;
    uint64_t economical;
};

// Access to the Bitcoin network. Every failure, including timeouts, is
// reported as ExternalServiceError.
class ChainBackend {
public:
    virtual ~ChainBackend() = default;

    virtual std::vector<Utxo> list_spendable_outputs(const std::string& address) = 0;
    virtual FeeRates estimate_fee_rates() = 0;

    // Submits a raw transaction (hex) and returns its txid
    virtual std::string broadcast(const std::string& raw_tx_hex) = 0;

    // 0 while unconfirmed
    virtual uint64_t get_confirmations(const std::string& txid) = 0;
};

} // namespace cosign
