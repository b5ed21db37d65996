#include "fingerprint.hpp"
#include "base58.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"

namespace cosign {

namespace {

std::span<const uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

} // namespace

std::string Fingerprint::custom_hash(std::span<const uint8_t> data) {
    const std::string hex = HexUtils::encode(data);
    auto digest = HashUtils::sha256(std::string_view(hex));
    return Base58::encode(digest);
}

std::string Fingerprint::key_fingerprint(const std::vector<std::string>& public_keys_hex) {
    std::string joined;
    for (size_t i = 0; i < public_keys_hex.size(); ++i) {
        if (i > 0) {
            joined.push_back('-');
        }
        joined += public_keys_hex[i];
    }
    return custom_hash(as_bytes(joined));
}

std::string Fingerprint::wallet_id(const std::vector<std::string>& public_keys_hex,
                                   std::string_view domain_suffix) {
    std::string prefix = key_fingerprint(public_keys_hex);
    prefix.append(domain_suffix);
    return custom_hash(as_bytes(prefix));
}

std::string Fingerprint::transaction_id(std::span<const uint8_t> serialized_template) {
    return custom_hash(serialized_template);
}

} // namespace cosign
