#include <gtest/gtest.h>

#include "../crypto/encoding.hpp"
#include "../crypto/evp_digest.hpp"
#include "../crypto/factories.hpp"
#include "../crypto/privacy_amplification.hpp"
#include "test_support.hpp"

#include <stdexcept>
#include <string>

using namespace qkdsim;

namespace {
std::vector<std::uint8_t> bytes_of(const std::string &s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}
} // namespace

TEST(EvpDigestTest, Sha256KnownAnswer) {
    auto sha = make_sha256_digest_provider();
    EXPECT_EQ(sha->algorithm(), HashAlgorithm::SHA2_256);
    EXPECT_EQ(sha->digest_size(), 32u);
    Digest d = sha->digest(bytes_of("abc"));
    EXPECT_EQ(to_hex(d.bytes), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(EvpDigestTest, Sha3KnownAnswer) {
    auto sha3 = make_digest_provider(HashAlgorithm::SHA3_256);
    EXPECT_EQ(sha3->algorithm(), HashAlgorithm::SHA3_256);
    Digest d = sha3->digest(bytes_of("abc"));
    EXPECT_EQ(to_hex(d.bytes), "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(EncodingTest, BitsToHexPadsOnTheRight) {
    EXPECT_EQ(bits_to_hex(bits_from_ints({1, 1, 1, 1, 0, 0, 0, 1})), "f1");
    EXPECT_EQ(bits_to_hex(bits_from_ints({1, 0, 1})), "a");
    EXPECT_EQ(bits_to_hex(bits_from_ints({0, 0, 0, 0, 1})), "08");
    EXPECT_EQ(bits_to_hex({}), "");
}

TEST(EncodingTest, CanonicalBitString) {
    EXPECT_EQ(bits_to_string(bits_from_ints({0, 1, 1, 0, 1, 0, 0, 1})), "01101001");
}

TEST(PrivacyAmplificationTest, HashesCanonicalStringAndTruncates) {
    auto sha = make_sha256_digest_provider();
    const BitSequence key = bits_from_ints({0, 1, 1, 0, 1, 0, 0, 1});

    EXPECT_EQ(amplify_key(key, 128, *sha), "f615873a351b17717c649516e39a0b2e");
    EXPECT_EQ(amplify_key(key, 16, *sha), "f615");
    // 4 bits per hex digit, rounded up.
    EXPECT_EQ(amplify_key(key, 17, *sha), "f6158");
    EXPECT_EQ(amplify_key(key, 1, *sha), "f");
}

TEST(PrivacyAmplificationTest, LongRequestYieldsWholeDigest) {
    auto sha = make_sha256_digest_provider();
    const std::string key = amplify_key(bits_from_ints({1}), 1024, *sha);
    EXPECT_EQ(key, "6b86b273ff34fce19d6b804eff5a3f5747ada4eaa22f1d49c01e52ddb7875b4b");
    EXPECT_EQ(amplified_hex_length(1024), 256u);
}

TEST(PrivacyAmplificationTest, UsesConfiguredDigest) {
    auto sha3 = make_sha3_256_digest_provider();
    EXPECT_EQ(amplify_key(bits_from_ints({0, 1, 1, 0}), 32, *sha3), "fd9f0008");
}

TEST(PrivacyAmplificationTest, EmptyKeyIsRejected) {
    auto sha = make_sha256_digest_provider();
    EXPECT_THROW(amplify_key({}, 128, *sha), std::invalid_argument);
}

TEST(PrivacyAmplificationTest, DigestFailurePropagates) {
    testing_support::FailingDigestProvider broken;
    EXPECT_THROW(amplify_key(bits_from_ints({1, 0}), 128, broken), DigestError);
}

TEST(HashAlgorithmTest, NamesRoundTrip) {
    EXPECT_EQ(hash_algorithm_from_string("sha256"), HashAlgorithm::SHA2_256);
    EXPECT_EQ(hash_algorithm_from_string("sha3-256"), HashAlgorithm::SHA3_256);
    EXPECT_EQ(hash_algorithm_to_string(HashAlgorithm::SHA3_256), "sha3-256");
    EXPECT_THROW(hash_algorithm_from_string("md5"), std::invalid_argument);
}
