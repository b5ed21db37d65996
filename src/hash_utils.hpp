#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <openssl/ripemd.h>
#include <openssl/sha.h>

namespace cosign {

using Hash256 = std::array<uint8_t, SHA256_DIGEST_LENGTH>;
using Hash160 = std::array<uint8_t, RIPEMD160_DIGEST_LENGTH>;

// OpenSSL-backed digests for scripts, sighashes and record identifiers
class HashUtils {
public:
    static Hash256 sha256(std::span<const uint8_t> data);

    // SHA256 over the bytes of a text string
    static Hash256 sha256(std::string_view text);

    static Hash256 double_sha256(std::span<const uint8_t> data);
    static Hash160 ripemd160(std::span<const uint8_t> data);

    // RIPEMD160(SHA256(data))
    static Hash160 hash160(std::span<const uint8_t> data);

private:
    HashUtils() = delete;
};

} // namespace cosign
