#include "hash_utils.hpp"

namespace cosign {

// Single SHA256. Used directly for P2WSH witness programs (BIP141 commits to
// SHA256 of the witness script, not HASH160) and for wallet fingerprints.
Hash256 HashUtils::sha256(std::span<const uint8_t> data) {
    Hash256 hash;
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, data.data(), data.size());
    SHA256_Final(hash.data(), &ctx);
    return hash;
}

Hash256 HashUtils::sha256(std::string_view text) {
    return sha256(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

// SHA256(SHA256(data)). Bitcoin uses it for txids, BIP143 intermediate
// hashes (hashPrevouts, hashSequence, hashOutputs), the final sighash and the
// Base58Check checksum.
Hash256 HashUtils::double_sha256(std::span<const uint8_t> data) {
    auto first = sha256(data);
    return sha256(std::span<const uint8_t>(first.data(), first.size()));
}

Hash160 HashUtils::ripemd160(std::span<const uint8_t> data) {
    Hash160 hash;
    RIPEMD160_CTX ctx;
    RIPEMD160_Init(&ctx);
    RIPEMD160_Update(&ctx, data.data(), data.size());
    RIPEMD160_Final(hash.data(), &ctx);
    return hash;
}

// RIPEMD160(SHA256(data)), the 20-byte hash inside P2PKH, P2SH and P2WPKH
// scripts.
Hash160 HashUtils::hash160(std::span<const uint8_t> data) {
    auto inner = sha256(data);
    return ripemd160(std::span<const uint8_t>(inner.data(), inner.size()));
}

} // namespace cosign
