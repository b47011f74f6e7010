#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace aead
{

constexpr std::size_t KEY_SIZE   = 32;  // AES-256
constexpr std::size_t NONCE_SIZE = 16;  // GCM with a 16-byte IV (0xChat compatible)
constexpr std::size_t TAG_SIZE   = 16;

enum class CryptoErrc
{
    RandomUnavailable,
    InvalidParams,
    EmptyPlaintext,
    CipherFault,
    AuthenticationFailed
};

const char *to_string(CryptoErrc c);

struct CryptoError
{
    CryptoErrc  code{CryptoErrc::CipherFault};
    std::string detail;
};

// Single-use key material, hex encoded for out-of-band delivery.
struct EncryptionParams
{
    std::string key;    // 64 hex chars
    std::string nonce;  // 32 hex chars
};

// What goes over the wire. `digest` covers the plaintext and is only ever
// delivered to the recipient; `blob_digest` covers the ciphertext and may be
// used to scope a host authorization.
struct AttachmentPayload
{
    std::vector<std::uint8_t> ciphertext;  // [ciphertext][TAG]
    std::string               mime_type;
    std::string               digest;
    std::string               blob_digest;
};

bool generate_params(EncryptionParams &out, CryptoError &err);

class Cipher
{
  public:
    virtual ~Cipher() = default;

    virtual bool seal(const std::vector<std::uint8_t> &plaintext,
                      const EncryptionParams          &params,
                      std::string_view                 mime_type,
                      AttachmentPayload               &out,
                      CryptoError                     &err) = 0;

    virtual bool open(const std::vector<std::uint8_t> &ciphertext,
                      const EncryptionParams          &params,
                      std::vector<std::uint8_t>       &out,
                      CryptoError                     &err) = 0;
};

// AES-256-GCM via OpenSSL EVP, no associated data, tag appended.
class AesGcmCipher final : public Cipher
{
  public:
    bool seal(const std::vector<std::uint8_t> &plaintext,
              const EncryptionParams          &params,
              std::string_view                 mime_type,
              AttachmentPayload               &out,
              CryptoError                     &err) override;

    bool open(const std::vector<std::uint8_t> &ciphertext,
              const EncryptionParams          &params,
              std::vector<std::uint8_t>       &out,
              CryptoError                     &err) override;
};

}  // namespace aead
