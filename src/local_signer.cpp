#include "local_signer.hpp"
#include "ecdsa.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "log.hpp"
#include <algorithm>

namespace cosign {

std::string LocalKeySigner::add_key(std::span<const uint8_t> private_key) {
    auto credential = HexUtils::encode(Ecdsa::derive_public_key(private_key));
    SecureMemory secret(private_key);
    if (!secret.locked()) {
        LOG_WARN("Could not lock memory for key " << credential << ", it may be swapped to disk");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    keys_.insert_or_assign(credential, std::move(secret));
    return credential;
}

std::string LocalKeySigner::add_key_hex(const std::string& private_key_hex) {
    auto bytes = HexUtils::decode(private_key_hex);
    SecureMemory secret(bytes);
    std::fill(bytes.begin(), bytes.end(), 0);
    return add_key(secret.bytes());
}

std::vector<uint8_t> LocalKeySigner::sign(std::span<const uint8_t> digest, const std::string& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(credential);
    if (it == keys_.end()) {
        throw CosignError(CosignError::ErrorType::ExternalService, "No signing key for credential " + credential);
    }
    try {
        return Ecdsa::sign(it->second.bytes(), digest);
    } catch (const CosignError& e) {
        throw CosignError(CosignError::ErrorType::ExternalService, std::string("Signing failed: ") + e.what());
    }
}

bool LocalKeySigner::has_credential(const std::string& credential) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.count(credential) != 0;
}

} // namespace cosign
