#include <gtest/gtest.h>
#include "common/crypto.hpp"
#include "common/crypto/x25519.hpp"
#include "common/crypto/ed25519.hpp"
#include "common/crypto/chacha20.hpp"
#include "common/crypto/hkdf.hpp"

#include <string>

using namespace agora;
using namespace agora::crypto;

class CryptoTest : public ::testing::Test {
protected:
    static std::vector<uint8_t> from_hex(std::string_view hex) {
        std::vector<uint8_t> out;
        for (size_t i = 0; i + 1 < hex.size(); i += 2) {
            out.push_back(static_cast<uint8_t>(std::stoul(std::string(hex.substr(i, 2)), nullptr, 16)));
        }
        return out;
    }
};

// X25519 Tests
TEST_F(CryptoTest, X25519KeyGeneration) {
    auto [pub1, priv1] = X25519::generate_keypair();
    auto [pub2, priv2] = X25519::generate_keypair();

    EXPECT_NE(pub1, pub2);
    EXPECT_NE(priv1, priv2);
    EXPECT_TRUE(X25519::validate_public_key(pub1));
}

TEST_F(CryptoTest, X25519SharedSecret) {
    auto [pub_a, priv_a] = X25519::generate_keypair();
    auto [pub_b, priv_b] = X25519::generate_keypair();

    auto secret_a = X25519::compute_shared_secret(priv_a, pub_b);
    auto secret_b = X25519::compute_shared_secret(priv_b, pub_a);

    ASSERT_TRUE(secret_a.has_value());
    ASSERT_TRUE(secret_b.has_value());
    EXPECT_EQ(*secret_a, *secret_b);
}

TEST_F(CryptoTest, X25519RejectsLowOrderPoints) {
    auto [pub, priv] = X25519::generate_keypair();

    X25519PublicKey zero{};
    EXPECT_FALSE(X25519::validate_public_key(zero));

    auto secret = X25519::compute_shared_secret(priv, zero);
    ASSERT_FALSE(secret.has_value());
    EXPECT_EQ(secret.error(), ErrorCode::INVALID_KEY);

    X25519PublicKey one{};
    one[0] = 1;
    EXPECT_FALSE(X25519::validate_public_key(one));
}

// Ed25519 Tests
TEST_F(CryptoTest, Ed25519SignVerify) {
    auto [pub, priv] = Ed25519::generate_keypair();

    std::vector<uint8_t> message = {0x01, 0x02, 0x03};
    auto signature = Ed25519::sign(priv, message);

    EXPECT_TRUE(Ed25519::verify(pub, message, signature));

    std::vector<uint8_t> modified = {0x01, 0x02, 0x04};
    EXPECT_FALSE(Ed25519::verify(pub, modified, signature));
}

TEST_F(CryptoTest, Ed25519SeedIsDeterministic) {
    Ed25519Seed seed{};
    for (size_t i = 0; i < seed.size(); ++i) seed[i] = static_cast<uint8_t>(i);

    auto [pub1, priv1] = Ed25519::keypair_from_seed(seed);
    auto [pub2, priv2] = Ed25519::keypair_from_seed(seed);

    EXPECT_EQ(pub1, pub2);
    EXPECT_EQ(priv1, priv2);
    EXPECT_EQ(Ed25519::seed_from_private(priv1), seed);
    EXPECT_EQ(Ed25519::public_key_from_private(priv1), pub1);
}

TEST_F(CryptoTest, Ed25519KeyFingerprint) {
    auto [pub, priv] = Ed25519::generate_keypair();

    auto fingerprint = Ed25519::key_fingerprint(pub);
    auto digest = sha256(pub);

    EXPECT_EQ(fingerprint.size(), 8u);
    EXPECT_TRUE(std::equal(fingerprint.begin(), fingerprint.end(), digest.begin()));
}

// Digests
TEST_F(CryptoTest, Sha256KnownAnswer) {
    std::string abc = "abc";
    auto digest = sha256(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(abc.data()), abc.size()));
    EXPECT_EQ(to_hex(digest), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    // Two-part form hashes the concatenation
    std::vector<uint8_t> a = {'a'};
    std::vector<uint8_t> bc = {'b', 'c'};
    EXPECT_EQ(sha256(a, bc), digest);
}

TEST_F(CryptoTest, HmacSha1KnownAnswer) {
    // RFC 2202 test case 1
    std::vector<uint8_t> key(20, 0x0b);
    std::string data = "Hi There";
    auto mac = hmac_sha1(key, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
    EXPECT_EQ(to_hex(mac), "b617318655057264e28bc0b6fb378c8ef146be00");
}

TEST_F(CryptoTest, Md5KnownAnswer) {
    EXPECT_EQ(to_hex(md5("")), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(to_hex(md5("abc")), "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(CryptoTest, SecureCompareAndWipe) {
    std::vector<uint8_t> a = {1, 2, 3, 4};
    std::vector<uint8_t> b = {1, 2, 3, 4};
    std::vector<uint8_t> c = {1, 2, 3, 5};

    EXPECT_TRUE(secure_compare(a, b));
    EXPECT_FALSE(secure_compare(a, c));
    EXPECT_FALSE(secure_compare(a, std::span<const uint8_t>(b.data(), 3)));

    secure_wipe(a);
    EXPECT_EQ(a, std::vector<uint8_t>(4, 0));
}

// ChaCha20-Poly1305 Tests
TEST_F(CryptoTest, ChaCha20EncryptDecrypt) {
    SessionKey key;
    for (size_t i = 0; i < key.size(); i++) key[i] = static_cast<uint8_t>(i);

    std::vector<uint8_t> message = {'H', 'e', 'l', 'l', 'o', ' ', 'W', 'o', 'r', 'l', 'd', '!'};
    std::vector<uint8_t> header = {0xD0, 0, 0, 0, 1};
    auto nonce = ChaCha20Poly1305::create_nonce(1, 7);

    auto encrypted = ChaCha20Poly1305::encrypt_with_nonce(key, nonce, message, header);
    ASSERT_TRUE(encrypted.has_value());
    EXPECT_EQ(encrypted->size(), message.size() + CryptoConstants::POLY1305_TAG_SIZE);

    auto decrypted = ChaCha20Poly1305::decrypt_with_nonce(key, nonce, *encrypted, header);
    ASSERT_TRUE(decrypted.has_value());
    EXPECT_EQ(*decrypted, message);
}

TEST_F(CryptoTest, ChaCha20RejectsTampering) {
    SessionKey key1{}, key2{};
    key2[0] = 1;
    std::vector<uint8_t> message = {'T', 'e', 's', 't'};
    std::vector<uint8_t> header = {0xD0};
    auto nonce = ChaCha20Poly1305::create_nonce(0, 1);

    auto encrypted = ChaCha20Poly1305::encrypt_with_nonce(key1, nonce, message, header);
    ASSERT_TRUE(encrypted.has_value());

    auto wrong_key = ChaCha20Poly1305::decrypt_with_nonce(key2, nonce, *encrypted, header);
    ASSERT_FALSE(wrong_key.has_value());
    EXPECT_EQ(wrong_key.error(), ErrorCode::DECRYPTION_FAILED);

    auto wrong_nonce = ChaCha20Poly1305::decrypt_with_nonce(
        key1, ChaCha20Poly1305::create_nonce(0, 2), *encrypted, header);
    EXPECT_FALSE(wrong_nonce.has_value());

    std::vector<uint8_t> other_header = {0xD1};
    EXPECT_FALSE(ChaCha20Poly1305::decrypt_with_nonce(key1, nonce, *encrypted, other_header).has_value());

    auto flipped = *encrypted;
    flipped[0] ^= 0x01;
    EXPECT_FALSE(ChaCha20Poly1305::decrypt_with_nonce(key1, nonce, flipped, header).has_value());

    std::vector<uint8_t> truncated(encrypted->begin(), encrypted->begin() + 8);
    EXPECT_FALSE(ChaCha20Poly1305::decrypt_with_nonce(key1, nonce, truncated, header).has_value());
}

TEST_F(CryptoTest, NonceLayout) {
    auto nonce = ChaCha20Poly1305::create_nonce(0x01020304, 0x0A0B0C0D0E0F1011ULL);
    Nonce expected = {0x01, 0x02, 0x03, 0x04, 0x0A, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F, 0x10, 0x11};
    EXPECT_EQ(nonce, expected);
}

// HKDF Tests
TEST_F(CryptoTest, HKDFKnownAnswer) {
    // RFC 5869 test case 1
    std::vector<uint8_t> ikm(22, 0x0b);
    auto salt = from_hex("000102030405060708090a0b0c");
    auto info = from_hex("f0f1f2f3f4f5f6f7f8f9");

    auto okm = HKDF::derive(ikm, salt, info, 42);
    EXPECT_EQ(to_hex(okm),
              "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
}

TEST_F(CryptoTest, HKDFDeriveKeySeparatesLabelsAndIndices) {
    std::vector<uint8_t> ikm(32, 0x42);
    std::vector<uint8_t> salt(32, 0x17);

    auto a = HKDF::derive_key(ikm, salt, "agora-i2r", 1);
    auto b = HKDF::derive_key(ikm, salt, "agora-i2r", 1);
    auto c = HKDF::derive_key(ikm, salt, "agora-r2i", 1);
    auto d = HKDF::derive_key(ikm, salt, "agora-i2r", 2);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
}

TEST_F(CryptoTest, RandomValuesDiffer) {
    std::array<uint8_t, 16> a{}, b{};
    random_bytes(a);
    random_bytes(b);
    EXPECT_NE(a, b);
    EXPECT_NE(random_u64(), random_u64());
}
