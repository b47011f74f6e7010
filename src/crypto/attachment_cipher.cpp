#include <algorithm>
#include <array>
#include <climits>
#include <openssl/evp.h>
#include <sodium.h>
#include <utility>

#include "crypto/attachment_cipher.hpp"
#include "crypto/digest.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace aead
{

namespace
{

// Wipes decoded key material when the call returns.
struct KeyMaterial
{
    std::array<std::uint8_t, KEY_SIZE>   key{};
    std::array<std::uint8_t, NONCE_SIZE> nonce{};

    ~KeyMaterial()
    {
        sodium_memzero(key.data(), key.size());
        sodium_memzero(nonce.data(), nonce.size());
    }
};

bool decode_exact(const std::string &hex, std::uint8_t *out, std::size_t n)
{
    if (hex.size() != n * 2)
        return false;
    std::size_t got = 0;
    return sodium_hex2bin(out, n, hex.data(), hex.size(), nullptr, &got, nullptr) == 0 &&
           got == n;
}

bool decode_params(const EncryptionParams &p, KeyMaterial &km, CryptoError &err)
{
    if (!decode_exact(p.key, km.key.data(), km.key.size()))
    {
        err = {CryptoErrc::InvalidParams, "key must be 64 hex chars"};
        return false;
    }
    if (!decode_exact(p.nonce, km.nonce.data(), km.nonce.size()))
    {
        err = {CryptoErrc::InvalidParams, "nonce must be 32 hex chars"};
        return false;
    }
    return true;
}

std::string to_hex(const std::uint8_t *p, std::size_t n)
{
    std::string out(n * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), p, n);
    out.resize(n * 2);
    return out;
}

}  // namespace

const char *to_string(CryptoErrc c)
{
    switch (c)
    {
        case CryptoErrc::RandomUnavailable:
            return "random source unavailable";
        case CryptoErrc::InvalidParams:
            return "invalid encryption params";
        case CryptoErrc::EmptyPlaintext:
            return "empty plaintext";
        case CryptoErrc::CipherFault:
            return "cipher fault";
        case CryptoErrc::AuthenticationFailed:
            return "authentication failed";
    }
    return "?";
}

bool generate_params(EncryptionParams &out, CryptoError &err)
{
    if (!sodium_ready())
    {
        err = {CryptoErrc::RandomUnavailable, "sodium_init failed"};
        LOG_ERROR("generate_params: %s", err.detail.c_str());
        return false;
    }
    KeyMaterial km;
    randombytes_buf(km.key.data(), km.key.size());
    randombytes_buf(km.nonce.data(), km.nonce.size());
    out.key   = to_hex(km.key.data(), km.key.size());
    out.nonce = to_hex(km.nonce.data(), km.nonce.size());
    return true;
}

bool AesGcmCipher::seal(const std::vector<std::uint8_t> &plaintext,
                        const EncryptionParams          &params,
                        std::string_view                 mime_type,
                        AttachmentPayload               &out,
                        CryptoError                     &err)
{
    // zero-length attachments are rejected before anything else happens
    if (plaintext.empty())
    {
        err = {CryptoErrc::EmptyPlaintext, "refusing to seal a zero-length attachment"};
        return false;
    }
    if (plaintext.size() > static_cast<std::size_t>(INT_MAX))
    {
        err = {CryptoErrc::CipherFault, "plaintext too large for a single GCM call"};
        return false;
    }

    KeyMaterial km;
    if (!decode_params(params, km, err))
        return false;

    AttachmentPayload p;
    p.digest    = calculate_digest(plaintext);
    p.mime_type = mime_type.empty() ? std::string(constants::DEFAULT_MIME) : std::string(mime_type);
    p.ciphertext.resize(plaintext.size() + TAG_SIZE);

    int              ok = 0, outl = 0, tmplen = 0;
    EVP_CIPHER_CTX *c  = EVP_CIPHER_CTX_new();
    if (!c)
    {
        err = {CryptoErrc::CipherFault, "EVP_CIPHER_CTX_new failed"};
        return false;
    }
    do
    {
        if (EVP_EncryptInit_ex(c, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
            break;
        if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1)
            break;
        if (EVP_EncryptInit_ex(c, nullptr, nullptr, km.key.data(), km.nonce.data()) != 1)
            break;
        if (EVP_EncryptUpdate(c, p.ciphertext.data(), &outl, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1)
            break;
        if (EVP_EncryptFinal_ex(c, p.ciphertext.data() + outl, &tmplen) != 1)
            break;
        // tag goes right after the ciphertext
        if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_GET_TAG, TAG_SIZE,
                                p.ciphertext.data() + plaintext.size()) != 1)
            break;
        ok = outl + tmplen;
    } while (0);
    EVP_CIPHER_CTX_free(c);

    if (ok != static_cast<int>(plaintext.size()))
    {
        err = {CryptoErrc::CipherFault, "AES-256-GCM encryption failed"};
        LOG_ERROR("seal: %s", err.detail.c_str());
        return false;
    }

    p.blob_digest = calculate_digest(p.ciphertext);
    out           = std::move(p);
    LOG_DEBUG("seal: %zu bytes -> %zu bytes (%s)", plaintext.size(), out.ciphertext.size(),
              out.mime_type.c_str());
    return true;
}

bool AesGcmCipher::open(const std::vector<std::uint8_t> &ciphertext,
                        const EncryptionParams          &params,
                        std::vector<std::uint8_t>       &out,
                        CryptoError                     &err)
{
    KeyMaterial km;
    if (!decode_params(params, km, err))
        return false;

    // [ciphertext][TAG]
    if (ciphertext.size() < TAG_SIZE)
    {
        err = {CryptoErrc::AuthenticationFailed, "input shorter than the tag"};
        return false;
    }
    const std::size_t clen = ciphertext.size() - TAG_SIZE;
    if (clen > static_cast<std::size_t>(INT_MAX))
    {
        err = {CryptoErrc::CipherFault, "ciphertext too large for a single GCM call"};
        return false;
    }

    std::vector<std::uint8_t> plain(clen);
    std::array<std::uint8_t, TAG_SIZE> tag{};
    std::copy(ciphertext.end() - TAG_SIZE, ciphertext.end(), tag.begin());

    int              outl = 0, tmplen = 0;
    bool             setup_ok = false, auth_ok = false;
    EVP_CIPHER_CTX *c = EVP_CIPHER_CTX_new();
    if (!c)
    {
        err = {CryptoErrc::CipherFault, "EVP_CIPHER_CTX_new failed"};
        return false;
    }
    do
    {
        if (EVP_DecryptInit_ex(c, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
            break;
        if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1)
            break;
        if (EVP_DecryptInit_ex(c, nullptr, nullptr, km.key.data(), km.nonce.data()) != 1)
            break;
        if (EVP_DecryptUpdate(c, plain.data(), &outl, ciphertext.data(),
                              static_cast<int>(clen)) != 1)
            break;
        if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_SET_TAG, TAG_SIZE, tag.data()) != 1)
            break;
        setup_ok = true;
        // only the final call verifies the tag
        auth_ok = EVP_DecryptFinal_ex(c, plain.data() + outl, &tmplen) == 1;
    } while (0);
    EVP_CIPHER_CTX_free(c);

    if (!setup_ok)
    {
        err = {CryptoErrc::CipherFault, "AES-256-GCM setup failed"};
        return false;
    }
    if (!auth_ok)
    {
        sodium_memzero(plain.data(), plain.size());
        err = {CryptoErrc::AuthenticationFailed, "tag mismatch (tampered or wrong key/nonce)"};
        LOG_WARN("open: %s", err.detail.c_str());
        return false;
    }
    plain.resize(static_cast<std::size_t>(outl + tmplen));
    out = std::move(plain);
    return true;
}

}  // namespace aead
