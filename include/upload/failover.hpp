#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "crypto/attachment_cipher.hpp"
#include "transport/itransport.hpp"
#include "upload/progress_monitor.hpp"
#include "upload/retry_controller.hpp"
#include "util/cancel.hpp"

namespace upload
{

struct UploadOptions
{
    RetryConfig                retry;
    transport::TransportConfig transport;
    ProgressCallback           on_progress;          // may be empty
    sealdrop::CancelToken     *cancel = nullptr;     // may be null
    std::string                mime_type;            // overrides the payload's type when set
};

// chunk size, tick and stall threshold must be non-zero
bool validate(const UploadOptions &opts, std::string &why);

enum class UploadErrc
{
    NoDestinations,
    InvalidConfig,
    AllDestinationsFailed,
    SessionAborted,
    Cancelled
};

const char *to_string(UploadErrc c);

struct UploadError
{
    UploadErrc                     code{UploadErrc::AllDestinationsFailed};
    transport::TransportError      cause;  // the error that ended the session
    std::string                    detail;
    std::vector<DestinationReport> destinations;

    // "<code>" followed by one line per destination
    std::string summary() const;
};

struct UploadSession
{
    std::vector<transport::Destination>   destinations;
    std::size_t                           current{0};
    std::chrono::steady_clock::time_point started;
    std::chrono::milliseconds             elapsed{0};
    std::chrono::steady_clock::time_point last_progress;
    std::vector<DestinationReport>        reports;
    bool                                  succeeded{false};
};

// Tries destinations strictly in order until one accepts the payload. On
// success `location` is the URL the accepting host returned. `session_out`, if
// given, receives the full per-destination record either way.
bool upload_with_failover(transport::IAuthorizer              &authorizer,
                          const std::vector<transport::Destination> &destinations,
                          const aead::AttachmentPayload       &payload,
                          transport::IUploadTransport         &transport,
                          const UploadOptions                 &options,
                          std::string                         &location,
                          UploadError                         &err,
                          UploadSession                       *session_out = nullptr);

}  // namespace upload
