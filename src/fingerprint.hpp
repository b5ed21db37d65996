#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cosign {

// Deterministic identifiers for wallets and transactions.
//
// custom_hash(bytes) = Base58(SHA256(lowercase hex of bytes, as ASCII))
//
// Note that the hex text is hashed, not the raw bytes. Changing that changes
// every existing wallet and transaction id.
class Fingerprint {
public:
    static std::string custom_hash(std::span<const uint8_t> data);

    // Hash of the participant public keys joined with '-' in the order supplied
    static std::string key_fingerprint(const std::vector<std::string>& public_keys_hex);

    // Wallet id: custom_hash(key fingerprint + domain suffix)
    static std::string wallet_id(const std::vector<std::string>& public_keys_hex,
                                 std::string_view domain_suffix);

    // Transaction id: custom_hash of the serialized unsigned template
    static std::string transaction_id(std::span<const uint8_t> serialized_template);

private:
    Fingerprint() = delete;
};

} // namespace cosign
