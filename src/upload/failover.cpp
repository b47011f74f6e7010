#include <utility>

#include "upload/failover.hpp"
#include "util/log.hpp"

namespace upload
{

const char *to_string(UploadErrc c)
{
    switch (c)
    {
        case UploadErrc::NoDestinations:
            return "no destinations";
        case UploadErrc::InvalidConfig:
            return "invalid configuration";
        case UploadErrc::AllDestinationsFailed:
            return "all destinations failed";
        case UploadErrc::SessionAborted:
            return "session aborted";
        case UploadErrc::Cancelled:
            return "cancelled";
    }
    return "?";
}

std::string UploadError::summary() const
{
    std::string s = to_string(code);
    if (!detail.empty())
        s += ": " + detail;
    for (const auto &r : destinations)
    {
        s += "\n  " + r.destination.url + " [" + transport::to_string(r.destination.protocol) +
             "] " + to_string(r.verdict) + " after " + std::to_string(r.attempts.size()) +
             (r.attempts.size() == 1 ? " attempt" : " attempts");
        if (r.verdict != DestinationVerdict::Succeeded)
            s += ": " + r.last_error.describe();
    }
    return s;
}

bool validate(const UploadOptions &opts, std::string &why)
{
    if (opts.retry.chunk_size == 0)
        why = "chunk size must be non-zero";
    else if (opts.transport.tick_interval.count() <= 0)
        why = "progress tick must be positive";
    else if (opts.transport.stall_threshold_ticks == 0)
        why = "stall threshold must be non-zero";
    else if (opts.transport.response_timeout.count() <= 0)
        why = "response timeout must be positive";
    else if (opts.retry.retry_spacing.count() < 0)
        why = "retry spacing must not be negative";
    else
        return true;
    return false;
}

bool upload_with_failover(transport::IAuthorizer                    &authorizer,
                          const std::vector<transport::Destination> &destinations,
                          const aead::AttachmentPayload             &payload,
                          transport::IUploadTransport               &transport,
                          const UploadOptions                       &options,
                          std::string                               &location,
                          UploadError                               &err,
                          UploadSession                             *session_out)
{
    err = {};
    UploadSession session;
    session.destinations  = destinations;
    session.started       = std::chrono::steady_clock::now();
    session.last_progress = session.started;

    auto done = [&](bool ok) {
        session.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - session.started);
        session.succeeded = ok;
        if (!ok)
            err.destinations = session.reports;
        if (session_out)
            *session_out = std::move(session);
        return ok;
    };

    if (destinations.empty())
    {
        err.code   = UploadErrc::NoDestinations;
        err.detail = "no upload destinations configured";
        return done(false);
    }
    std::string why;
    if (!validate(options, why))
    {
        err.code   = UploadErrc::InvalidConfig;
        err.detail = why;
        return done(false);
    }

    ProgressCallback on_progress = [&session, &options](const ProgressEvent &ev) {
        session.last_progress = std::chrono::steady_clock::now();
        return options.on_progress ? options.on_progress(ev) : ProgressAction::Continue;
    };
    RetryController rc(transport, authorizer, options.retry, options.transport, on_progress,
                       options.cancel, options.mime_type);

    for (session.current = 0; session.current < destinations.size(); ++session.current)
    {
        const transport::Destination &dest = destinations[session.current];
        sealdrop::LogScope scope("dest " + std::to_string(session.current + 1) + "/" +
                                 std::to_string(destinations.size()) + " " + dest.url);
        LOG_INFO("uploading %zu bytes via %s (%s)", payload.ciphertext.size(),
                 transport.name().c_str(), transport::to_string(dest.protocol));

        DestinationReport rep = rc.attempt_with_retries(dest, payload);
        session.reports.push_back(rep);

        if (rep.verdict == DestinationVerdict::Succeeded)
        {
            location = rep.location;
            return done(true);
        }
        if (rep.verdict == DestinationVerdict::SessionAborted)
        {
            const bool cancelled = rep.last_error.code == transport::TransportErrc::Cancelled ||
                                   (options.cancel && options.cancel->cancelled());
            err.code   = cancelled ? UploadErrc::Cancelled : UploadErrc::SessionAborted;
            err.cause  = rep.last_error;
            err.detail = rep.last_error.describe();
            LOG_ERROR("session stopped: %s", err.detail.c_str());
            return done(false);
        }
        LOG_WARN("destination exhausted: %s", rep.last_error.describe().c_str());
        // progress restarts from zero on the next destination (begin() emits 0%)
    }

    err.code   = UploadErrc::AllDestinationsFailed;
    err.cause  = session.reports.back().last_error;
    err.detail = std::to_string(destinations.size()) + " destination(s) tried";
    return done(false);
}

}  // namespace upload
