#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "crypto/attachment_cipher.hpp"
#include "transport/itransport.hpp"
#include "upload/progress_monitor.hpp"
#include "util/cancel.hpp"
#include "util/constants.hpp"

namespace upload
{

struct RetryConfig
{
    std::uint32_t             retry_count{constants::DEFAULT_RETRY_COUNT};
    std::chrono::milliseconds retry_spacing{constants::DEFAULT_RETRY_SPACING};
    std::chrono::milliseconds max_retry_spacing{constants::MAX_RETRY_SPACING};
    std::size_t               chunk_size{constants::DEFAULT_CHUNK_SIZE};
};

enum class AttemptOutcome
{
    Succeeded,
    Retryable,
    DestinationFatal,  // move on to the next destination
    SessionFatal       // stop the whole session
};

const char *to_string(AttemptOutcome o);

AttemptOutcome classify(const transport::TransportError &e);

// Wait before the try that follows a failure with `e`. A 429 doubles the
// spacing (up to `cap`) and the doubled value sticks for later tries.
std::chrono::milliseconds next_spacing(const transport::TransportError &e,
                                       std::chrono::milliseconds        current,
                                       std::chrono::milliseconds        cap);

struct UploadAttempt
{
    std::string                           destination;
    std::uint32_t                         index{0};
    std::uint64_t                         bytes_sent{0};
    std::chrono::steady_clock::time_point started;
    std::chrono::milliseconds             elapsed{0};
    std::chrono::milliseconds             waited_before{0};
    AttemptOutcome                        outcome{AttemptOutcome::Retryable};
    transport::TransportError             error;  // meaningful unless Succeeded
};

enum class DestinationVerdict
{
    Succeeded,
    Exhausted,
    SessionAborted
};

const char *to_string(DestinationVerdict v);

struct DestinationReport
{
    transport::Destination     destination;
    DestinationVerdict         verdict{DestinationVerdict::Exhausted};
    std::vector<UploadAttempt> attempts;
    transport::TransportError  last_error;
    std::string                location;  // set when Succeeded
};

// Drives one destination: up to retry_count + 1 tries, each one watched by a
// ProgressMonitor on the calling thread while the transport runs on a worker.
class RetryController
{
  public:
    RetryController(transport::IUploadTransport     &tx,
                    transport::IAuthorizer          &auth,
                    const RetryConfig               &retry,
                    const transport::TransportConfig &tcfg,
                    ProgressCallback                 on_progress,
                    sealdrop::CancelToken           *cancel = nullptr,
                    std::string                      mime_override = {});

    DestinationReport attempt_with_retries(const transport::Destination  &dest,
                                           const aead::AttachmentPayload &payload);

  private:
    UploadAttempt run_attempt(const transport::Destination  &dest,
                              const aead::AttachmentPayload &payload,
                              std::uint32_t                  index,
                              std::string                   &location);

    transport::IUploadTransport     &tx_;
    transport::IAuthorizer          &auth_;
    RetryConfig                      retry_;
    transport::TransportConfig       tcfg_;
    ProgressCallback                 on_progress_;
    sealdrop::CancelToken           *cancel_;
    std::string                      mime_override_;
};

}  // namespace upload
