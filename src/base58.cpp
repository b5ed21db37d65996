#include "base58.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <algorithm>
#include <array>

namespace cosign {

namespace {

constexpr std::string_view BASE58_CHARS =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

} // namespace

// Encodes bytes as Base58.
//
// The encoding treats the input as one big-endian number and repeatedly
// divides it by 58; each remainder selects one output character. Leading zero
// bytes carry no numeric weight, so each one is written as a literal '1'.
std::string Base58::encode(std::span<const uint8_t> data) {
    size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // Base58 digits, most significant first
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);
    for (size_t i = leading_zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            carry += static_cast<uint32_t>(*it) << 8;
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.insert(digits.begin(), static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(leading_zeros, '1');
    result.reserve(leading_zeros + digits.size());
    for (uint8_t digit : digits) {
        result.push_back(BASE58_CHARS[digit]);
    }
    return result;
}

// Decodes a Base58-encoded string into bytes.
//
// The decoding process:
// 1. Converts each Base58 character to its corresponding value
// 2. Builds the result by multiplying existing value by 58 and adding new digits
// 3. Restores leading '1' characters as leading zero bytes
std::vector<uint8_t> Base58::decode(std::string_view base58_string) {
    std::vector<uint8_t> result;
    for (char c : base58_string) {
        auto digit = BASE58_CHARS.find(c);
        if (digit == std::string_view::npos) {
            throw CosignError(CosignError::ErrorType::Encoding,
                std::string("Invalid Base58 character '") + c + "'");
        }

        size_t carry = digit;
        for (auto it = result.rbegin(); it != result.rend(); ++it) {
            carry += static_cast<size_t>(*it) * 58;
            *it = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        while (carry > 0) {
            result.insert(result.begin(), static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    for (char c : base58_string) {
        if (c != '1') break;
        result.insert(result.begin(), 0);
    }
    return result;
}

std::string Base58::encode_check(std::span<const uint8_t> payload) {
    std::vector<uint8_t> data(payload.begin(), payload.end());
    auto checksum = HashUtils::double_sha256(payload);
    data.insert(data.end(), checksum.begin(), checksum.begin() + 4);
    return encode(data);
}

// Base58Check: the last four bytes must equal the first four bytes of
// SHA256(SHA256(payload)).
std::vector<uint8_t> Base58::decode_check(std::string_view encoded) {
    auto data = decode(encoded);
    if (data.size() < 4) {
        throw CosignError(CosignError::ErrorType::Encoding, "Base58Check data too short");
    }

    std::vector<uint8_t> payload(data.begin(), data.end() - 4);
    auto checksum = HashUtils::double_sha256(payload);
    if (!std::equal(checksum.begin(), checksum.begin() + 4, data.end() - 4)) {
        throw CosignError(CosignError::ErrorType::Encoding, "Base58Check checksum mismatch");
    }
    return payload;
}

} // namespace cosign
