#include <cstdint>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

#include "crypto/attachment_cipher.hpp"
#include "crypto/digest.hpp"

using namespace aead;

static std::vector<std::uint8_t> gen_bytes(std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
    return v;
}

static EncryptionParams fixed_params()
{
    EncryptionParams p;
    p.key   = std::string(64, '1');  // 0x11 * 32
    p.nonce = std::string(32, 'a');  // 0xaa * 16
    return p;
}

TEST(Cipher, GenerateParamsShapeAndFreshness)
{
    std::set<std::string> keys, nonces;
    for (int i = 0; i < 16; ++i)
    {
        EncryptionParams p;
        CryptoError      err;
        ASSERT_TRUE(generate_params(p, err));
        EXPECT_EQ(p.key.size(), KEY_SIZE * 2);
        EXPECT_EQ(p.nonce.size(), NONCE_SIZE * 2);
        EXPECT_EQ(p.key.find_first_not_of("0123456789abcdef"), std::string::npos);
        keys.insert(p.key);
        nonces.insert(p.nonce);
    }
    EXPECT_EQ(keys.size(), 16u);
    EXPECT_EQ(nonces.size(), 16u);
}

TEST(Cipher, SealOpenRoundtrip)
{
    AesGcmCipher      c;
    EncryptionParams  p;
    CryptoError       err;
    ASSERT_TRUE(generate_params(p, err));

    const auto        msg = gen_bytes(70000);
    AttachmentPayload payload;
    ASSERT_TRUE(c.seal(msg, p, "image/png", payload, err));
    EXPECT_EQ(payload.ciphertext.size(), msg.size() + TAG_SIZE);
    EXPECT_EQ(payload.mime_type, "image/png");
    EXPECT_EQ(payload.digest, calculate_digest(msg));
    EXPECT_EQ(payload.blob_digest, calculate_digest(payload.ciphertext));
    EXPECT_NE(payload.digest, payload.blob_digest);

    std::vector<std::uint8_t> back;
    ASSERT_TRUE(c.open(payload.ciphertext, p, back, err));
    EXPECT_EQ(back, msg);
}

TEST(Cipher, DeterministicForSameParams)
{
    AesGcmCipher      c;
    CryptoError       err;
    AttachmentPayload a, b;
    const auto        msg = gen_bytes(100);
    ASSERT_TRUE(c.seal(msg, fixed_params(), "", a, err));
    ASSERT_TRUE(c.seal(msg, fixed_params(), "", b, err));
    EXPECT_EQ(a.ciphertext, b.ciphertext);
    EXPECT_EQ(a.mime_type, "application/octet-stream");
}

TEST(Cipher, EmptyPlaintextRejected)
{
    AesGcmCipher      c;
    CryptoError       err;
    AttachmentPayload out;
    EXPECT_FALSE(c.seal({}, fixed_params(), "text/plain", out, err));
    EXPECT_EQ(err.code, CryptoErrc::EmptyPlaintext);
    EXPECT_TRUE(out.ciphertext.empty());
}

TEST(Cipher, MalformedParamsRejected)
{
    AesGcmCipher      c;
    CryptoError       err;
    AttachmentPayload out;
    const auto        msg = gen_bytes(10);

    EncryptionParams short_key = fixed_params();
    short_key.key.pop_back();
    EXPECT_FALSE(c.seal(msg, short_key, "", out, err));
    EXPECT_EQ(err.code, CryptoErrc::InvalidParams);

    EncryptionParams bad_nonce = fixed_params();
    bad_nonce.nonce[0]         = 'z';
    EXPECT_FALSE(c.seal(msg, bad_nonce, "", out, err));
    EXPECT_EQ(err.code, CryptoErrc::InvalidParams);

    // a 12-byte nonce is not accepted either
    EncryptionParams twelve = fixed_params();
    twelve.nonce            = std::string(24, 'a');
    EXPECT_FALSE(c.seal(msg, twelve, "", out, err));
    EXPECT_EQ(err.code, CryptoErrc::InvalidParams);

    std::vector<std::uint8_t> plain;
    EXPECT_FALSE(c.open(std::vector<std::uint8_t>(32, 0), short_key, plain, err));
    EXPECT_EQ(err.code, CryptoErrc::InvalidParams);
}

TEST(Cipher, TamperDetected)
{
    AesGcmCipher      c;
    CryptoError       err;
    AttachmentPayload payload;
    const auto        msg = gen_bytes(256);
    ASSERT_TRUE(c.seal(msg, fixed_params(), "", payload, err));

    std::vector<std::uint8_t> plain;

    auto flipped_body = payload.ciphertext;
    flipped_body[10] ^= 0x01;
    EXPECT_FALSE(c.open(flipped_body, fixed_params(), plain, err));
    EXPECT_EQ(err.code, CryptoErrc::AuthenticationFailed);

    auto flipped_tag = payload.ciphertext;
    flipped_tag.back() ^= 0x80;
    EXPECT_FALSE(c.open(flipped_tag, fixed_params(), plain, err));
    EXPECT_EQ(err.code, CryptoErrc::AuthenticationFailed);

    auto truncated = payload.ciphertext;
    truncated.pop_back();
    EXPECT_FALSE(c.open(truncated, fixed_params(), plain, err));
    EXPECT_EQ(err.code, CryptoErrc::AuthenticationFailed);
    EXPECT_TRUE(plain.empty());
}

TEST(Cipher, WrongKeyOrNonceFails)
{
    AesGcmCipher      c;
    CryptoError       err;
    AttachmentPayload payload;
    ASSERT_TRUE(c.seal(gen_bytes(64), fixed_params(), "", payload, err));

    std::vector<std::uint8_t> plain;
    EncryptionParams          other_key = fixed_params();
    other_key.key                       = std::string(64, '2');
    EXPECT_FALSE(c.open(payload.ciphertext, other_key, plain, err));
    EXPECT_EQ(err.code, CryptoErrc::AuthenticationFailed);

    EncryptionParams other_nonce = fixed_params();
    other_nonce.nonce            = std::string(32, 'b');
    EXPECT_FALSE(c.open(payload.ciphertext, other_nonce, plain, err));
    EXPECT_EQ(err.code, CryptoErrc::AuthenticationFailed);
}

TEST(Cipher, ShorterThanTag)
{
    AesGcmCipher              c;
    CryptoError               err;
    std::vector<std::uint8_t> plain;
    EXPECT_FALSE(c.open(std::vector<std::uint8_t>(TAG_SIZE - 1, 0), fixed_params(), plain, err));
    EXPECT_EQ(err.code, CryptoErrc::AuthenticationFailed);
}
