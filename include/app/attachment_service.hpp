#pragma once
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/attachment_cipher.hpp"
#include "transport/itransport.hpp"
#include "upload/failover.hpp"

namespace app
{

struct AttachmentFile
{
    std::vector<std::uint8_t> bytes;
    std::string               extension;  // lowercase, no dot

    // false (and logs) when the file cannot be read
    static bool           from_path(const std::string &path, AttachmentFile &out);
    static AttachmentFile from_bytes(std::vector<std::uint8_t> bytes);
};

// Case-insensitive; unknown -> application/octet-stream.
std::string mime_for_extension(std::string_view ext);

// Everything a recipient needs to fetch, decrypt and check the file.
struct AttachmentRecord
{
    std::string   url;
    std::string   key;
    std::string   nonce;
    std::string   digest;  // plaintext SHA-256
    std::uint64_t size{0};  // ciphertext bytes
    std::string   mime_type;
    std::string   algorithm;

    std::string to_json(const std::string &recipient = {}) const;
};

bool record_from_json(const std::string &text, AttachmentRecord &out, std::string &why);

// "deliver message M to recipient R"; the transport for that is not ours.
struct IMessageSink
{
    virtual bool deliver(const std::string &recipient, const AttachmentRecord &rec,
                         std::string &why) = 0;
    virtual ~IMessageSink() = default;
};

// One JSON object per line.
class JsonLineSink final : public IMessageSink
{
  public:
    explicit JsonLineSink(std::FILE *out) : out_(out) {}

    bool deliver(const std::string &recipient, const AttachmentRecord &rec,
                 std::string &why) override;

  private:
    std::FILE *out_;
    std::mutex mu_;
};

enum class SendErrc
{
    Crypto,
    Upload,
    DeliveryFailed,
    DigestMismatch
};

const char *to_string(SendErrc c);

struct SendError
{
    SendErrc            code{SendErrc::Crypto};
    aead::CryptoError   crypto;
    upload::UploadError upload;
    std::string         detail;

    std::string describe() const;
};

class AttachmentService
{
  public:
    AttachmentService(transport::IUploadTransport &tx,
                      transport::IAuthorizer      &auth,
                      aead::Cipher                &cipher,
                      IMessageSink                *sink = nullptr);

    // digest -> fresh params -> seal -> failover upload -> record -> sink.
    // On DeliveryFailed the record is still filled in.
    bool send_file(const std::string                         &recipient,
                   const AttachmentFile                      &file,
                   const std::vector<transport::Destination> &destinations,
                   const upload::UploadOptions               &options,
                   AttachmentRecord                          &record,
                   SendError                                 &err);

    bool open_attachment(const std::vector<std::uint8_t> &ciphertext,
                         const AttachmentRecord          &record,
                         std::vector<std::uint8_t>       &plaintext,
                         SendError                       &err);

  private:
    transport::IUploadTransport &tx_;
    transport::IAuthorizer      &auth_;
    aead::Cipher                &cipher_;
    IMessageSink                *sink_;
};

}  // namespace app
