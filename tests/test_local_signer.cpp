#include <gtest/gtest.h>

#include "consts.hpp"
#include "error.hpp"
#include "local_signer.hpp"
#include "test_utils.hpp"

namespace cosign {
namespace {

TEST(LocalKeySignerTest, CredentialIsPublicKey) {
    LocalKeySigner signer;
    EXPECT_EQ(signer.add_key(test::private_key(1)), test::PUBKEY_1);
    EXPECT_EQ(signer.add_key_hex(HexUtils::encode(test::private_key(2))), test::PUBKEY_2);
    EXPECT_TRUE(signer.has_credential(test::PUBKEY_1));
    EXPECT_TRUE(signer.has_credential(test::PUBKEY_2));
    EXPECT_FALSE(signer.has_credential(test::PUBKEY_3));
}

TEST(LocalKeySignerTest, SignaturesVerifyUnderCredential) {
    LocalKeySigner signer;
    auto credential = signer.add_key(test::private_key(3));

    std::vector<uint8_t> digest(32, 0x5a);
    auto signature = signer.sign(digest, credential);
    ASSERT_GT(signature.size(), 1u);
    EXPECT_EQ(signature.back(), SIGHASH_ALL);

    std::span<const uint8_t> der(signature.data(), signature.size() - 1);
    EXPECT_TRUE(Ecdsa::verify(HexUtils::decode(credential), digest, der));
    EXPECT_FALSE(Ecdsa::verify(HexUtils::decode(test::PUBKEY_1), digest, der));
}

TEST(LocalKeySignerTest, UnknownCredentialIsExternalServiceError) {
    LocalKeySigner signer;
    signer.add_key(test::private_key(1));
    try {
        signer.sign(std::vector<uint8_t>(32, 1), test::PUBKEY_2);
        FAIL() << "expected ExternalServiceError";
    } catch (const CosignError& e) {
        EXPECT_EQ(e.type(), CosignError::ErrorType::ExternalService);
    }
}

TEST(LocalKeySignerTest, RejectsMalformedKeys) {
    LocalKeySigner signer;
    EXPECT_THROW(signer.add_key_hex("not hex"), CosignError);
    EXPECT_THROW(signer.add_key(std::vector<uint8_t>(32, 0)), CosignError);
}

TEST(SecureMemoryTest, MoveTransfersOwnership) {
    std::vector<uint8_t> secret = test::private_key(9);
    SecureMemory first(secret);
    ASSERT_EQ(first.size(), 32u);

    SecureMemory second(std::move(first));
    EXPECT_TRUE(first.empty());
    EXPECT_EQ(second.size(), 32u);
    EXPECT_EQ(second.bytes()[31], 9);
}

} // namespace
} // namespace cosign
