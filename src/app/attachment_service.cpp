#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <utility>

#include "app/attachment_service.hpp"
#include "crypto/digest.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

using json = nlohmann::json;

namespace
{

std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

}  // namespace

bool AttachmentFile::from_path(const std::string &path, AttachmentFile &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        LOG_ERROR("cannot open %s", path.c_str());
        return false;
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (in.bad())
    {
        LOG_ERROR("read error on %s", path.c_str());
        return false;
    }

    const auto slash = path.find_last_of('/');
    const auto name  = slash == std::string::npos ? path : path.substr(slash + 1);
    const auto dot   = name.find_last_of('.');
    std::string ext;
    if (dot != std::string::npos && dot != 0 && dot + 1 < name.size())
        ext = to_lower(name.substr(dot + 1));

    out.bytes     = std::move(bytes);
    out.extension = ext.empty() ? std::string(constants::DEFAULT_EXTENSION) : ext;
    return true;
}

AttachmentFile AttachmentFile::from_bytes(std::vector<std::uint8_t> bytes)
{
    AttachmentFile f;
    f.bytes     = std::move(bytes);
    f.extension = std::string(constants::DEFAULT_EXTENSION);
    return f;
}

std::string mime_for_extension(std::string_view ext)
{
    static const std::unordered_map<std::string, const char *> table = {
        // images
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        // audio
        {"wav", "audio/wav"},
        {"mp3", "audio/mp3"},
        {"flac", "audio/flac"},
        {"ogg", "audio/ogg"},
        {"m4a", "audio/mp4"},
        {"aac", "audio/aac"},
        // video
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
        {"mov", "video/quicktime"},
        {"avi", "video/x-msvideo"},
        {"mkv", "video/x-matroska"},
    };
    auto it = table.find(to_lower(std::string(ext)));
    return it == table.end() ? std::string(constants::DEFAULT_MIME) : std::string(it->second);
}

std::string AttachmentRecord::to_json(const std::string &recipient) const
{
    json j;
    if (!recipient.empty())
        j["recipient"] = recipient;
    j["url"]                  = url;
    j["file-type"]            = mime_type;
    j["size"]                 = size;
    j["encryption-algorithm"] = algorithm;
    j["decryption-key"]       = key;
    j["decryption-nonce"]     = nonce;
    j["ox"]                   = digest;
    return j.dump();
}

bool record_from_json(const std::string &text, AttachmentRecord &out, std::string &why)
{
    const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
    {
        why = "not a JSON object";
        return false;
    }
    auto str = [&j](const char *k) -> const json * {
        auto it = j.find(k);
        return (it != j.end() && it->is_string()) ? &*it : nullptr;
    };

    AttachmentRecord r;
    const json *url = str("url"), *key = str("decryption-key"), *nonce = str("decryption-nonce");
    if (!url || !key || !nonce)
    {
        why = "missing url, decryption-key or decryption-nonce";
        return false;
    }
    r.url   = url->get<std::string>();
    r.key   = key->get<std::string>();
    r.nonce = nonce->get<std::string>();
    if (const json *d = str("ox"))
        r.digest = d->get<std::string>();
    if (const json *m = str("file-type"))
        r.mime_type = m->get<std::string>();
    r.algorithm = std::string(constants::ALGORITHM_NAME);
    if (const json *a = str("encryption-algorithm"))
        r.algorithm = a->get<std::string>();
    auto sz = j.find("size");
    if (sz != j.end() && sz->is_number_unsigned())
        r.size = sz->get<std::uint64_t>();

    if (r.algorithm != constants::ALGORITHM_NAME)
    {
        why = "unsupported encryption-algorithm '" + r.algorithm + "'";
        return false;
    }
    out = std::move(r);
    return true;
}

bool JsonLineSink::deliver(const std::string &recipient, const AttachmentRecord &rec,
                           std::string &why)
{
    const std::string line = rec.to_json(recipient) + "\n";
    std::lock_guard<std::mutex> lk(mu_);
    if (std::fwrite(line.data(), 1, line.size(), out_) != line.size() || std::fflush(out_) != 0)
    {
        why = "write failed";
        return false;
    }
    return true;
}

const char *to_string(SendErrc c)
{
    switch (c)
    {
        case SendErrc::Crypto:
            return "crypto";
        case SendErrc::Upload:
            return "upload";
        case SendErrc::DeliveryFailed:
            return "delivery failed";
        case SendErrc::DigestMismatch:
            return "digest mismatch";
    }
    return "?";
}

std::string SendError::describe() const
{
    switch (code)
    {
        case SendErrc::Crypto:
            return std::string("crypto: ") + aead::to_string(crypto.code) +
                   (crypto.detail.empty() ? "" : " (" + crypto.detail + ")");
        case SendErrc::Upload:
            return "upload: " + upload.summary();
        default:
            return std::string(to_string(code)) + (detail.empty() ? "" : ": " + detail);
    }
}

AttachmentService::AttachmentService(transport::IUploadTransport &tx,
                                     transport::IAuthorizer      &auth,
                                     aead::Cipher                &cipher,
                                     IMessageSink                *sink)
    : tx_(tx), auth_(auth), cipher_(cipher), sink_(sink)
{
}

bool AttachmentService::send_file(const std::string                         &recipient,
                                  const AttachmentFile                      &file,
                                  const std::vector<transport::Destination> &destinations,
                                  const upload::UploadOptions               &options,
                                  AttachmentRecord                          &record,
                                  SendError                                 &err)
{
    err = {};
    const std::string mime =
        options.mime_type.empty() ? mime_for_extension(file.extension) : options.mime_type;

    aead::EncryptionParams params;
    if (!aead::generate_params(params, err.crypto))
    {
        err.code = SendErrc::Crypto;
        LOG_ERROR("generate_params: %s", aead::to_string(err.crypto.code));
        return false;
    }

    aead::AttachmentPayload payload;
    if (!cipher_.seal(file.bytes, params, mime, payload, err.crypto))
    {
        err.code = SendErrc::Crypto;
        LOG_ERROR("seal: %s %s", aead::to_string(err.crypto.code), err.crypto.detail.c_str());
        return false;
    }
    LOG_INFO("sealed %zu bytes (%s) -> %zu bytes", file.bytes.size(), mime.c_str(),
             payload.ciphertext.size());

    std::string location;
    if (!upload::upload_with_failover(auth_, destinations, payload, tx_, options, location,
                                      err.upload))
    {
        err.code = SendErrc::Upload;
        return false;
    }

    AttachmentRecord r;
    r.url       = location;
    r.key       = params.key;
    r.nonce     = params.nonce;
    r.digest    = payload.digest;
    r.size      = payload.ciphertext.size();
    r.mime_type = payload.mime_type;
    r.algorithm = std::string(constants::ALGORITHM_NAME);
    record      = std::move(r);

    if (sink_)
    {
        std::string why;
        if (!sink_->deliver(recipient, record, why))
        {
            err.code   = SendErrc::DeliveryFailed;
            err.detail = why;
            LOG_ERROR("uploaded to %s but delivery to '%s' failed: %s", record.url.c_str(),
                      recipient.c_str(), why.c_str());
            return false;
        }
    }
    return true;
}

bool AttachmentService::open_attachment(const std::vector<std::uint8_t> &ciphertext,
                                        const AttachmentRecord          &record,
                                        std::vector<std::uint8_t>       &plaintext,
                                        SendError                       &err)
{
    err = {};
    aead::EncryptionParams params{record.key, record.nonce};
    std::vector<std::uint8_t> out;
    if (!cipher_.open(ciphertext, params, out, err.crypto))
    {
        err.code = SendErrc::Crypto;
        return false;
    }
    if (!record.digest.empty() && !aead::verify_digest(out, record.digest))
    {
        err.code   = SendErrc::DigestMismatch;
        err.detail = "decrypted content does not match " + record.digest;
        return false;
    }
    plaintext = std::move(out);
    return true;
}

}  // namespace app
