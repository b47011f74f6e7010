#include <algorithm>
#include <thread>
#include <utility>

#include "upload/retry_controller.hpp"
#include "util/log.hpp"

namespace upload
{

using transport::TransportErrc;
using transport::TransportError;

const char *to_string(AttemptOutcome o)
{
    switch (o)
    {
        case AttemptOutcome::Succeeded:
            return "succeeded";
        case AttemptOutcome::Retryable:
            return "retryable";
        case AttemptOutcome::DestinationFatal:
            return "destination-fatal";
        case AttemptOutcome::SessionFatal:
            return "session-fatal";
    }
    return "?";
}

const char *to_string(DestinationVerdict v)
{
    switch (v)
    {
        case DestinationVerdict::Succeeded:
            return "succeeded";
        case DestinationVerdict::Exhausted:
            return "exhausted";
        case DestinationVerdict::SessionAborted:
            return "session aborted";
    }
    return "?";
}

AttemptOutcome classify(const TransportError &e)
{
    switch (e.code)
    {
        case TransportErrc::Connect:
        case TransportErrc::Timeout:
        case TransportErrc::Stalled:
            return AttemptOutcome::Retryable;
        case TransportErrc::RemoteRejected:
            if (e.status == 429 || (e.status >= 500 && e.status <= 599))
                return AttemptOutcome::Retryable;
            return AttemptOutcome::DestinationFatal;
        case TransportErrc::BadResponse:
        case TransportErrc::Internal:
            return AttemptOutcome::DestinationFatal;
        case TransportErrc::Unauthorized:
        case TransportErrc::CallbackAborted:
        case TransportErrc::Cancelled:
            return AttemptOutcome::SessionFatal;
    }
    return AttemptOutcome::DestinationFatal;
}

std::chrono::milliseconds next_spacing(const TransportError     &e,
                                       std::chrono::milliseconds current,
                                       std::chrono::milliseconds cap)
{
    if (e.code != TransportErrc::RemoteRejected || e.status != 429)
        return current;
    // never shrink a base spacing that is already above the cap
    return std::max(current, std::min(current * 2, cap));
}

RetryController::RetryController(transport::IUploadTransport      &tx,
                                 transport::IAuthorizer           &auth,
                                 const RetryConfig                &retry,
                                 const transport::TransportConfig &tcfg,
                                 ProgressCallback                  on_progress,
                                 sealdrop::CancelToken            *cancel,
                                 std::string                       mime_override)
    : tx_(tx),
      auth_(auth),
      retry_(retry),
      tcfg_(tcfg),
      on_progress_(std::move(on_progress)),
      cancel_(cancel),
      mime_override_(std::move(mime_override))
{
}

UploadAttempt RetryController::run_attempt(const transport::Destination  &dest,
                                           const aead::AttachmentPayload &payload,
                                           std::uint32_t                  index,
                                           std::string                   &location)
{
    UploadAttempt a;
    a.destination = dest.url;
    a.index       = index;
    a.started     = std::chrono::steady_clock::now();

    auto finish = [&a](AttemptOutcome outcome) {
        a.outcome = outcome;
        a.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - a.started);
        return a;
    };

    if (cancel_ && cancel_->cancelled())
    {
        a.error.code   = TransportErrc::Cancelled;
        a.error.detail = "cancelled before the attempt started";
        return finish(AttemptOutcome::SessionFatal);
    }

    const std::string upload_url = transport::upload_url_for(dest);
    std::string       header, why;
    if (!auth_.authorize(dest, upload_url, payload.blob_digest, header, why))
    {
        a.error.code   = TransportErrc::Unauthorized;
        a.error.detail = why.empty() ? "authorizer refused to sign" : why;
        return finish(AttemptOutcome::SessionFatal);
    }

    std::atomic<std::uint64_t> bytes{0};
    std::atomic_bool           abort{false};
    sealdrop::Event            done;

    transport::UploadRequest req;
    req.destination   = &dest;
    req.payload       = &payload;
    req.chunk_size    = retry_.chunk_size;
    req.authorization = std::move(header);
    req.mime_type     = mime_override_;
    req.abort         = &abort;
    req.on_bytes_sent = [&bytes](std::uint64_t n) {
        std::uint64_t cur = bytes.load(std::memory_order_relaxed);
        while (n > cur && !bytes.compare_exchange_weak(cur, n, std::memory_order_relaxed))
        {
        }
    };

    ProgressMonitor monitor(static_cast<std::uint64_t>(payload.ciphertext.size()),
                            tcfg_.tick_interval, tcfg_.stall_threshold_ticks, on_progress_,
                            cancel_, tcfg_.response_timeout);
    if (!monitor.begin())
    {
        a.error.code   = TransportErrc::CallbackAborted;
        a.error.detail = "progress callback asked to stop";
        return finish(AttemptOutcome::SessionFatal);
    }

    bool           ok = false;
    std::string    loc;
    TransportError terr;
    std::thread    worker([&] {
        ok = tx_.stream_upload(req, loc, terr);
        done.set();
    });

    const MonitorSignal sig = monitor.watch(bytes, done);
    if (sig != MonitorSignal::Completed)
        abort.store(true, std::memory_order_relaxed);
    worker.join();
    a.bytes_sent = bytes.load(std::memory_order_relaxed);

    switch (sig)
    {
        case MonitorSignal::Completed:
            break;
        case MonitorSignal::Stalled:
            if (ok)
                break;  // finished between the last tick and the abort
            terr        = {};
            terr.code   = TransportErrc::Stalled;
            terr.detail = "no progress for " + std::to_string(tcfg_.stall_threshold_ticks) +
                          " ticks of " + std::to_string(tcfg_.tick_interval.count()) + " ms";
            break;
        case MonitorSignal::ResponseTimeout:
            if (ok)
                break;
            terr        = {};
            terr.code   = TransportErrc::Timeout;
            terr.detail = "no response " + std::to_string(tcfg_.response_timeout.count()) +
                          " ms after the body was sent";
            break;
        case MonitorSignal::Cancelled:
            ok          = false;
            terr        = {};
            terr.code   = TransportErrc::Cancelled;
            terr.detail = "cancelled by caller";
            break;
        case MonitorSignal::CallbackAborted:
            ok          = false;
            terr        = {};
            terr.code   = TransportErrc::CallbackAborted;
            terr.detail = "progress callback asked to stop";
            break;
    }

    if (ok)
    {
        monitor.finish(payload.ciphertext.size());
        a.bytes_sent = payload.ciphertext.size();
        location     = std::move(loc);
        return finish(AttemptOutcome::Succeeded);
    }

    a.error = std::move(terr);
    return finish(classify(a.error));
}

DestinationReport RetryController::attempt_with_retries(const transport::Destination  &dest,
                                                        const aead::AttachmentPayload &payload)
{
    DestinationReport rep;
    rep.destination = dest;

    std::chrono::milliseconds spacing = retry_.retry_spacing;
    std::chrono::milliseconds wait{0};

    for (std::uint32_t i = 0; i <= retry_.retry_count; ++i)
    {
        if (i > 0)
        {
            LOG_INFO("retry %u/%u in %lld ms", i, retry_.retry_count,
                     static_cast<long long>(wait.count()));
            bool cancelled = false;
            if (cancel_)
                cancelled = cancel_->sleep_for(wait);
            else
                std::this_thread::sleep_for(wait);
            if (cancelled)
            {
                rep.verdict           = DestinationVerdict::SessionAborted;
                rep.last_error        = {};
                rep.last_error.code   = TransportErrc::Cancelled;
                rep.last_error.detail = "cancelled while waiting to retry";
                return rep;
            }
        }

        std::string   loc;
        UploadAttempt a   = run_attempt(dest, payload, i, loc);
        a.waited_before   = wait;
        const auto outcome = a.outcome;
        rep.attempts.push_back(a);

        switch (outcome)
        {
            case AttemptOutcome::Succeeded:
                LOG_INFO("uploaded %zu bytes in %lld ms -> %s", payload.ciphertext.size(),
                         static_cast<long long>(a.elapsed.count()), loc.c_str());
                rep.verdict  = DestinationVerdict::Succeeded;
                rep.location = std::move(loc);
                return rep;
            case AttemptOutcome::SessionFatal:
                LOG_ERROR("attempt %u: %s", i, a.error.describe().c_str());
                rep.verdict    = DestinationVerdict::SessionAborted;
                rep.last_error = a.error;
                return rep;
            case AttemptOutcome::DestinationFatal:
                LOG_ERROR("attempt %u: %s; giving up on this destination", i,
                          a.error.describe().c_str());
                rep.verdict    = DestinationVerdict::Exhausted;
                rep.last_error = a.error;
                return rep;
            case AttemptOutcome::Retryable:
                LOG_WARN("attempt %u: %s", i, a.error.describe().c_str());
                rep.last_error = a.error;
                spacing        = next_spacing(a.error, spacing, retry_.max_retry_spacing);
                wait           = spacing;
                break;
        }
    }

    rep.verdict = DestinationVerdict::Exhausted;
    return rep;
}

}  // namespace upload
