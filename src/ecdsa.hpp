#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace cosign {

// secp256k1 ECDSA operations on top of OpenSSL
class Ecdsa {
public:
    // Derives the 33-byte compressed public key of a 32-byte private key
    static std::vector<uint8_t> derive_public_key(std::span<const uint8_t> privkey);

    // True if the bytes are a compressed encoding of a point on secp256k1
    static bool is_valid_public_key(std::span<const uint8_t> pubkey);

    // Signs a 32-byte digest. Returns a low-S DER signature with SIGHASH_ALL appended.
    static std::vector<uint8_t> sign(std::span<const uint8_t> privkey, std::span<const uint8_t> digest);

    // Verifies a DER signature (no sighash byte) over a 32-byte digest
    static bool verify(std::span<const uint8_t> pubkey, std::span<const uint8_t> digest,
                       std::span<const uint8_t> der_signature);

    // Accepts either a 64-byte compact r||s signature (the format signing
    // devices return) or DER with a trailing SIGHASH_ALL byte, and returns the
    // canonical low-S DER + SIGHASH_ALL form. Throws InvalidSignature.
    static std::vector<uint8_t> normalize_signature(std::span<const uint8_t> signature);

private:
    Ecdsa() = delete;
};

} // namespace cosign
