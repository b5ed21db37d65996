#include "ecdsa.hpp"
#include "consts.hpp"
#include "error.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <memory>

namespace cosign {

namespace {

using EcKeyPtr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
using EcPointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

EcKeyPtr new_secp256k1_key() {
    EcKeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free);
    if (!key) {
        throw CosignError(CosignError::ErrorType::InvalidSignature, "Failed to create secp256k1 context");
    }
    return key;
}

// Load a compressed public key into an EC_KEY; null if it is not on the curve
EcKeyPtr load_public_key(std::span<const uint8_t> pubkey) {
    auto key = new_secp256k1_key();
    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    EcPointPtr point(EC_POINT_new(group), EC_POINT_free);
    if (!point ||
        EC_POINT_oct2point(group, point.get(), pubkey.data(), pubkey.size(), nullptr) != 1 ||
        EC_KEY_set_public_key(key.get(), point.get()) != 1) {
        return EcKeyPtr(nullptr, EC_KEY_free);
    }
    return key;
}

// If S > n/2, replace S with n - S.
//
// For any valid signature (r, s) the pair (r, n - s) verifies as well. Bitcoin
// relay policy only accepts the lower of the two (BIP62/BIP146) so the
// witness cannot be malleated by third parties.
void enforce_low_s(ECDSA_SIG* sig) {
    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig, &r, &s);

    std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)> group(
        EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free);
    BignumPtr order(BN_new(), BN_free);
    BignumPtr half_order(BN_new(), BN_free);
    if (!group || !order || !half_order ||
        !EC_GROUP_get_order(group.get(), order.get(), nullptr) ||
        !BN_rshift1(half_order.get(), order.get())) {
        throw CosignError(CosignError::ErrorType::InvalidSignature, "Failed to load curve order");
    }

    if (BN_cmp(s, half_order.get()) <= 0) {
        return;
    }

    BignumPtr new_s(BN_new(), BN_free);
    BignumPtr new_r(BN_dup(r), BN_free);
    if (!new_s || !new_r || !BN_sub(new_s.get(), order.get(), s)) {
        throw CosignError(CosignError::ErrorType::InvalidSignature, "Failed to normalize S value");
    }
    // ECDSA_SIG_set0 takes ownership of both numbers on success
    if (ECDSA_SIG_set0(sig, new_r.get(), new_s.get()) != 1) {
        throw CosignError(CosignError::ErrorType::InvalidSignature, "Failed to normalize S value");
    }
    new_r.release();
    new_s.release();
}

std::vector<uint8_t> to_der(const ECDSA_SIG* sig) {
    unsigned char* der = nullptr;
    int der_len = i2d_ECDSA_SIG(sig, &der);
    if (der_len <= 0) {
        throw CosignError(CosignError::ErrorType::InvalidSignature, "Failed to DER-encode signature");
    }
    std::vector<uint8_t> out(der, der + der_len);
    OPENSSL_free(der);
    return out;
}

// Strict DER parse: the encoding must be consumed completely and re-encode
// to the same bytes
EcdsaSigPtr parse_der(std::span<const uint8_t> der) {
    const unsigned char* p = der.data();
    EcdsaSigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())), ECDSA_SIG_free);
    if (!sig || p != der.data() + der.size()) {
        return EcdsaSigPtr(nullptr, ECDSA_SIG_free);
    }
    if (to_der(sig.get()) != std::vector<uint8_t>(der.begin(), der.end())) {
        return EcdsaSigPtr(nullptr, ECDSA_SIG_free);
    }
    return sig;
}

} // namespace

// Derives a public key from a private key using elliptic curve multiplication
// public_key = private_key * G, serialized in compressed form:
// - First byte: 0x02 if y-coordinate is even, 0x03 if y-coordinate is odd
// - Remaining 32 bytes: x-coordinate
std::vector<uint8_t> Ecdsa::derive_public_key(std::span<const uint8_t> privkey) {
    if (privkey.size() != 32) {
        throw CosignError(CosignError::ErrorType::Validation, "Private key must be 32 bytes");
    }
    auto ec_key = new_secp256k1_key();
    const EC_GROUP* group = EC_KEY_get0_group(ec_key.get());

    BignumPtr priv(BN_bin2bn(privkey.data(), static_cast<int>(privkey.size()), nullptr), BN_free);
    EcPointPtr pub(EC_POINT_new(group), EC_POINT_free);
    if (!priv || !pub || BN_is_zero(priv.get()) ||
        !EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, nullptr)) {
        throw CosignError(CosignError::ErrorType::Validation, "Invalid private key");
    }

    std::vector<uint8_t> result(COMPRESSED_PUBKEY_SIZE);
    size_t size = EC_POINT_point2oct(group, pub.get(), POINT_CONVERSION_COMPRESSED,
                                     result.data(), result.size(), nullptr);
    if (size != COMPRESSED_PUBKEY_SIZE) {
        throw CosignError(CosignError::ErrorType::Validation, "Failed to serialize public key");
    }
    return result;
}

bool Ecdsa::is_valid_public_key(std::span<const uint8_t> pubkey) {
    if (pubkey.size() != COMPRESSED_PUBKEY_SIZE || (pubkey[0] != 0x02 && pubkey[0] != 0x03)) {
        return false;
    }
    return static_cast<bool>(load_public_key(pubkey));
}

// Sign a message digest with a private key using ECDSA on the secp256k1 curve
//
// The signature process:
// 1. Initialize the secp256k1 curve and key
// 2. Sign the message digest with ECDSA
// 3. Normalize the S value to be in the lower half of the curve order
// 4. Convert to DER format and append the sighash type
std::vector<uint8_t> Ecdsa::sign(std::span<const uint8_t> privkey, std::span<const uint8_t> digest) {
    if (privkey.size() != 32 || digest.size() != 32) {
        throw CosignError(CosignError::ErrorType::Validation, "Signing needs a 32-byte key and digest");
    }

    auto eckey = new_secp256k1_key();
    BignumPtr bn_priv(BN_bin2bn(privkey.data(), static_cast<int>(privkey.size()), nullptr), BN_free);
    if (!bn_priv || !EC_KEY_set_private_key(eckey.get(), bn_priv.get())) {
        throw CosignError(CosignError::ErrorType::Validation, "Invalid private key");
    }

    EcdsaSigPtr sig(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), eckey.get()),
                    ECDSA_SIG_free);
    if (!sig) {
        throw CosignError(CosignError::ErrorType::ExternalService, "ECDSA signing failed");
    }

    enforce_low_s(sig.get());

    auto signature = to_der(sig.get());
    signature.push_back(static_cast<uint8_t>(SIGHASH_ALL));
    return signature;
}

bool Ecdsa::verify(std::span<const uint8_t> pubkey, std::span<const uint8_t> digest,
                   std::span<const uint8_t> der_signature) {
    if (digest.size() != 32) {
        return false;
    }
    auto key = load_public_key(pubkey);
    if (!key) {
        return false;
    }
    auto sig = parse_der(der_signature);
    if (!sig) {
        return false;
    }
    return ECDSA_do_verify(digest.data(), static_cast<int>(digest.size()), sig.get(), key.get()) == 1;
}

std::vector<uint8_t> Ecdsa::normalize_signature(std::span<const uint8_t> signature) {
    EcdsaSigPtr sig(nullptr, ECDSA_SIG_free);

    if (signature.size() == 64) {
        // Compact form: 32-byte big-endian r followed by 32-byte big-endian s
        sig.reset(ECDSA_SIG_new());
        BignumPtr r(BN_bin2bn(signature.data(), 32, nullptr), BN_free);
        BignumPtr s(BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free);
        if (!sig || !r || !s || BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
            ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
            throw CosignError(CosignError::ErrorType::InvalidSignature, "Malformed compact signature");
        }
        r.release();
        s.release();
    } else {
        if (signature.size() < 9 || signature.back() != SIGHASH_ALL) {
            throw CosignError(CosignError::ErrorType::InvalidSignature,
                "Signature must be 64-byte compact or DER with SIGHASH_ALL");
        }
        sig = parse_der(signature.first(signature.size() - 1));
        if (!sig) {
            throw CosignError(CosignError::ErrorType::InvalidSignature, "Malformed DER signature");
        }
    }

    enforce_low_s(sig.get());
    auto normalized = to_der(sig.get());
    normalized.push_back(static_cast<uint8_t>(SIGHASH_ALL));
    return normalized;
}

} // namespace cosign
