#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "hex_utils.hpp"

namespace cosign {

struct Outpoint {
    std::vector<uint8_t> txid_vec;  // Transaction ID as bytes in little-endian
    uint32_t index;                 // Output index in transaction

    // Builds an outpoint from the big-endian txid hex a node displays
    static Outpoint from_display_txid(std::string_view txid_hex, uint32_t index) {
        auto bytes = HexUtils::decode(txid_hex);
        if (bytes.size() != 32) {
            throw CosignError(CosignError::ErrorType::Encoding, "txid must be 32 bytes");
        }
        std::reverse(bytes.begin(), bytes.end());
        return Outpoint{std::move(bytes), index};
    }

    std::string display_txid() const {
        std::vector<uint8_t> be(txid_vec.rbegin(), txid_vec.rend());
        return HexUtils::encode(be);
    }
};

// A spendable output of the wallet address as reported by the network
struct Utxo {
    Outpoint outpoint;
    uint64_t amount;                    // Amount in satoshis
    std::vector<uint8_t> script_pubkey; // Locking script, empty when the node omits it
};

inline void to_json(nlohmann::json& j, const Utxo& utxo) {
    j = nlohmann::json{
        {"txid", utxo.outpoint.display_txid()},
        {"vout", utxo.outpoint.index},
        {"amount", utxo.amount}
    };
}

} // namespace cosign
