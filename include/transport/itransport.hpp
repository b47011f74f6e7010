#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "crypto/attachment_cipher.hpp"
#include "util/constants.hpp"

namespace transport
{

enum class Protocol
{
    Blossom,  // PUT <base>/upload, raw body, blob descriptor response
    Nip96     // POST <api_url>, multipart form, NIP-94 event response
};

const char *to_string(Protocol p);

// One candidate host. Opaque to everything above the transport.
struct Destination
{
    std::string url;
    Protocol    protocol{Protocol::Blossom};
};

enum class TransportErrc
{
    Connect,          // could not reach the host, or the connection dropped
    Timeout,          // connect phase timed out
    RemoteRejected,   // host answered with a failure status
    BadResponse,      // host answered 2xx but without a usable location
    Stalled,          // no byte progress within the stall window
    Cancelled,        // caller cancellation, or the attempt was aborted from outside
    CallbackAborted,  // progress callback asked to stop
    Unauthorized,     // the auth context could not sign for this request
    Internal
};

const char *to_string(TransportErrc c);

struct TransportError
{
    TransportErrc code{TransportErrc::Internal};
    long          status{0};  // HTTP status for RemoteRejected
    std::string   body;       // response body for RemoteRejected (truncated)
    std::string   detail;

    std::string describe() const;
};

// Connection-level parameters; passed through to the transport verbatim.
struct TransportConfig
{
    std::chrono::milliseconds connect_timeout{constants::DEFAULT_CONNECT_TIMEOUT};
    std::chrono::seconds      pool_idle_timeout{constants::DEFAULT_POOL_IDLE_TIMEOUT};
    std::size_t               pool_max_idle_per_host{constants::DEFAULT_POOL_MAX_IDLE};
    std::uint32_t             stall_threshold_ticks{constants::DEFAULT_STALL_TICKS};
    std::chrono::milliseconds tick_interval{constants::DEFAULT_TICK_INTERVAL};
    std::chrono::milliseconds response_timeout{constants::DEFAULT_RESPONSE_TIMEOUT};
    std::optional<std::string> proxy;  // host:port, SOCKS5
};

using OnBytesSent = std::function<void(std::uint64_t cumulative)>;

struct UploadRequest
{
    const Destination             *destination = nullptr;
    const aead::AttachmentPayload *payload     = nullptr;
    std::size_t                    chunk_size  = constants::DEFAULT_CHUNK_SIZE;
    std::string                    authorization;  // header value, may be empty
    std::string                    mime_type;      // overrides payload->mime_type when set
    OnBytesSent                    on_bytes_sent;
    const std::atomic_bool        *abort = nullptr;  // polled; set => give up promptly

    bool aborted() const { return abort && abort->load(std::memory_order_relaxed); }
};

struct IUploadTransport
{
    // Streams payload->ciphertext to one destination. On success `location` holds
    // the URL the host returned.
    virtual bool stream_upload(const UploadRequest &req,
                               std::string         &location,
                               TransportError      &err) = 0;
    virtual std::string name() const { return ""; }
    virtual ~IUploadTransport() = default;
};

// Opaque signing hook: turns the caller's credentials into an Authorization
// header for one request. The pipeline never looks inside.
struct IAuthorizer
{
    virtual bool authorize(const Destination &dest,
                           const std::string &upload_url,
                           const std::string &blob_digest,
                           std::string       &header_out,
                           std::string       &why) = 0;
    virtual ~IAuthorizer() = default;
};

class StaticAuthorizer final : public IAuthorizer
{
  public:
    explicit StaticAuthorizer(std::string header = {}) : header_(std::move(header)) {}

    bool authorize(const Destination &,
                   const std::string &,
                   const std::string &,
                   std::string &header_out,
                   std::string &) override
    {
        header_out = header_;
        return true;
    }

  private:
    std::string header_;
};

// Where a destination actually receives the body.
std::string upload_url_for(const Destination &dest);

}  // namespace transport
