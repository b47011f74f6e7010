#include <algorithm>
#include <exception>
#include <utility>

#include "upload/progress_monitor.hpp"
#include "util/log.hpp"

namespace upload
{

const char *to_string(MonitorSignal s)
{
    switch (s)
    {
        case MonitorSignal::Completed:
            return "completed";
        case MonitorSignal::Stalled:
            return "stalled";
        case MonitorSignal::ResponseTimeout:
            return "response timeout";
        case MonitorSignal::Cancelled:
            return "cancelled";
        case MonitorSignal::CallbackAborted:
            return "callback aborted";
    }
    return "?";
}

ProgressMonitor::ProgressMonitor(std::optional<std::uint64_t> total,
                                 std::chrono::milliseconds    tick,
                                 std::uint32_t                stall_threshold_ticks,
                                 ProgressCallback             callback,
                                 sealdrop::CancelToken       *cancel,
                                 std::chrono::milliseconds    response_timeout)
    : total_(total),
      tick_(tick),
      stall_threshold_(stall_threshold_ticks),
      cb_(std::move(callback)),
      cancel_(cancel),
      response_timeout_(response_timeout),
      last_progress_at_(std::chrono::steady_clock::now())
{
}

ProgressAction ProgressMonitor::emit(std::uint64_t bytes)
{
    if (!cb_)
        return ProgressAction::Continue;

    ProgressEvent ev;
    ev.bytes = bytes;
    if (total_ && *total_ > 0)
    {
        // 100 is reserved for finish(): the host has not answered yet
        const std::uint64_t pct = bytes >= *total_ ? 99 : (bytes * 100) / *total_;
        ev.percentage           = static_cast<std::uint8_t>(std::min<std::uint64_t>(pct, 99));
    }
    return deliver(ev);
}

ProgressAction ProgressMonitor::deliver(const ProgressEvent &ev)
{
    try
    {
        return cb_(ev);
    }
    catch (const std::exception &e)
    {
        LOG_WARN("progress callback threw: %s", e.what());
    }
    catch (...)
    {
        LOG_WARN("progress callback threw a non-standard exception");
    }
    return ProgressAction::Abort;
}

bool ProgressMonitor::begin()
{
    last_bytes_       = 0;
    ticks_            = 0;
    idle_ticks_       = 0;
    last_progress_at_ = std::chrono::steady_clock::now();
    return emit(0) == ProgressAction::Continue;
}

MonitorSignal ProgressMonitor::watch(const std::atomic<std::uint64_t> &bytes_sent,
                                     sealdrop::Event                  &done)
{
    for (;;)
    {
        if (done.wait_for(tick_))
            return MonitorSignal::Completed;
        if (cancel_ && cancel_->cancelled())
            return MonitorSignal::Cancelled;

        ++ticks_;
        const std::uint64_t now = bytes_sent.load(std::memory_order_relaxed);
        if (now > last_bytes_)
        {
            last_bytes_       = now;
            idle_ticks_       = 0;
            last_progress_at_ = std::chrono::steady_clock::now();
            if (emit(now) == ProgressAction::Abort)
                return MonitorSignal::CallbackAborted;
            continue;
        }

        // whole body handed over: waiting on the response is not a stall,
        // but it is bounded
        if (total_ && now >= *total_)
        {
            if (std::chrono::steady_clock::now() - last_progress_at_ >= response_timeout_)
            {
                LOG_DEBUG("no response %lld ms after the body was sent",
                          static_cast<long long>(response_timeout_.count()));
                return MonitorSignal::ResponseTimeout;
            }
            continue;
        }

        if (++idle_ticks_ >= stall_threshold_)
        {
            LOG_DEBUG("no progress for %u ticks at %llu bytes", idle_ticks_,
                      static_cast<unsigned long long>(now));
            return MonitorSignal::Stalled;
        }
    }
}

void ProgressMonitor::finish(std::uint64_t final_bytes)
{
    if (final_bytes > last_bytes_)
        last_bytes_ = final_bytes;
    if (!cb_)
        return;

    ProgressEvent ev;
    ev.bytes = last_bytes_;
    if (total_)
        ev.percentage = 100;
    if (deliver(ev) == ProgressAction::Abort)
        LOG_DEBUG("progress callback asked to stop after the upload completed");
}

}  // namespace upload
