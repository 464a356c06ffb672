#include "Crypto.h"
#include <gtest/gtest.h>

using namespace qc;

TEST(Sha3Test, EmptyStringProducesKnownDigest) {
    EXPECT_EQ(utl::sha3_256(""),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(Sha3Test, AbcProducesKnownDigest) {
    EXPECT_EQ(utl::sha3_256("abc"),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(Sha3Test, OutputIsLowercaseHex64) {
    std::string digest = utl::sha3_256("qchain");
    EXPECT_EQ(digest.size(), 64u);
    EXPECT_TRUE(utl::isHexString(digest));
    EXPECT_NE(digest, utl::sha3_256("qchaiN"));
}

TEST(MldsaTest, SignAndVerify) {
    auto keys = utl::mldsaGenerate();
    ASSERT_TRUE(keys.isOk()) << keys.error().message;
    EXPECT_TRUE(utl::isValidMldsaPublicKey(keys.value().publicKey));

    auto signature = utl::mldsaSign(keys.value().secretKey, "message");
    ASSERT_TRUE(signature.isOk()) << signature.error().message;
    EXPECT_TRUE(utl::mldsaVerify(keys.value().publicKey, "message", signature.value()));
    EXPECT_FALSE(utl::mldsaVerify(keys.value().publicKey, "messagE", signature.value()));
}

TEST(MldsaTest, VerifyWithOtherKeyFails) {
    auto alice = utl::mldsaGenerate();
    auto bob = utl::mldsaGenerate();
    ASSERT_TRUE(alice.isOk());
    ASSERT_TRUE(bob.isOk());
    auto signature = utl::mldsaSign(alice.value().secretKey, "payload");
    ASSERT_TRUE(signature.isOk());
    EXPECT_FALSE(utl::mldsaVerify(bob.value().publicKey, "payload", signature.value()));
}

TEST(MldsaTest, VerifyRejectsMalformedInputWithoutThrowing) {
    auto keys = utl::mldsaGenerate();
    ASSERT_TRUE(keys.isOk());
    auto signature = utl::mldsaSign(keys.value().secretKey, "payload");
    ASSERT_TRUE(signature.isOk());

    EXPECT_FALSE(utl::mldsaVerify("short key", "payload", signature.value()));
    EXPECT_FALSE(utl::mldsaVerify(keys.value().publicKey, "payload", ""));
    EXPECT_FALSE(utl::mldsaVerify(keys.value().publicKey, "payload",
                                  signature.value() + "trailing"));
    std::string truncated = signature.value().substr(0, 10);
    EXPECT_FALSE(utl::mldsaVerify(keys.value().publicKey, "payload", truncated));
}

TEST(MldsaTest, SignRejectsWrongKeySize) {
    auto signature = utl::mldsaSign("not a key", "payload");
    EXPECT_TRUE(signature.isError());
}

TEST(PowHashTest, DeterministicForSameInput) {
    utl::PowParams params{1, 8192};
    std::string first = utl::powHash("header7", params);
    EXPECT_EQ(first, utl::powHash("header7", params));
    EXPECT_NE(first, utl::powHash("header8", params));
    // 32 bytes as unpadded base64
    EXPECT_EQ(first.size(), 43u);
}

TEST(PowHashTest, ParametersChangeTheDigest) {
    EXPECT_NE(utl::powHash("data", utl::PowParams{1, 8192}),
              utl::powHash("data", utl::PowParams{2, 8192}));
}
