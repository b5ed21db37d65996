#include <gtest/gtest.h>

#include "base58.hpp"
#include "fingerprint.hpp"
#include "hash_utils.hpp"
#include "test_utils.hpp"

namespace cosign {
namespace {

std::span<const uint8_t> text_bytes(const std::string& text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

TEST(FingerprintTest, CustomHashHashesLowercaseHexText) {
    const std::vector<uint8_t> data{0xDE, 0xAD, 0xBE, 0xEF};
    const std::string hex = "deadbeef";

    EXPECT_EQ(Fingerprint::custom_hash(data), Base58::encode(HashUtils::sha256(text_bytes(hex))));
    EXPECT_NE(Fingerprint::custom_hash(data), Base58::encode(HashUtils::sha256(data)));
}

TEST(FingerprintTest, CustomHashIsDeterministic) {
    const std::vector<uint8_t> data{1, 2, 3};
    EXPECT_EQ(Fingerprint::custom_hash(data), Fingerprint::custom_hash(data));
    EXPECT_NE(Fingerprint::custom_hash(data), Fingerprint::custom_hash(std::vector<uint8_t>{1, 2, 4}));
}

TEST(FingerprintTest, KeyFingerprintJoinsKeysWithDash) {
    const std::vector<std::string> keys{test::PUBKEY_1, test::PUBKEY_2};
    const std::string joined = std::string(test::PUBKEY_1) + "-" + test::PUBKEY_2;
    EXPECT_EQ(Fingerprint::key_fingerprint(keys), Fingerprint::custom_hash(text_bytes(joined)));
}

TEST(FingerprintTest, WalletIdDependsOnKeyOrder) {
    const std::vector<std::string> forward{test::PUBKEY_1, test::PUBKEY_2, test::PUBKEY_3};
    const std::vector<std::string> reordered{test::PUBKEY_2, test::PUBKEY_1, test::PUBKEY_3};

    EXPECT_EQ(Fingerprint::wallet_id(forward, "#suffix"), Fingerprint::wallet_id(forward, "#suffix"));
    EXPECT_NE(Fingerprint::wallet_id(forward, "#suffix"), Fingerprint::wallet_id(reordered, "#suffix"));
}

TEST(FingerprintTest, WalletIdDependsOnDomainSuffix) {
    const std::vector<std::string> keys{test::PUBKEY_1, test::PUBKEY_2};
    const std::string fingerprint = Fingerprint::key_fingerprint(keys);

    EXPECT_EQ(Fingerprint::wallet_id(keys, "#cosign_btc_multisig"),
              Fingerprint::custom_hash(text_bytes(fingerprint + "#cosign_btc_multisig")));
    EXPECT_NE(Fingerprint::wallet_id(keys, "#a"), Fingerprint::wallet_id(keys, "#b"));
}

} // namespace
} // namespace cosign
