#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "secure_memory.hpp"
#include "signer.hpp"

namespace cosign {

// Development signer holding secp256k1 private keys in locked memory.
// The credential is the hex public key of the key to sign with.
class LocalKeySigner : public Signer {
public:
    // Registers a 32-byte private key and returns its credential (hex public key)
    std::string add_key(std::span<const uint8_t> private_key);

    // Convenience for keys given as hex on the command line
    std::string add_key_hex(const std::string& private_key_hex);

    std::vector<uint8_t> sign(std::span<const uint8_t> digest, const std::string& credential) override;

    bool has_credential(const std::string& credential) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, SecureMemory> keys_;
};

} // namespace cosign
