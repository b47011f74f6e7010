#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

#include "util/cancel.hpp"
#include "util/constants.hpp"

namespace upload
{

struct ProgressEvent
{
    std::optional<std::uint8_t>  percentage;  // absent when the total is unknown
    std::optional<std::uint64_t> bytes;
};

enum class ProgressAction
{
    Continue,
    Abort
};

using ProgressCallback = std::function<ProgressAction(const ProgressEvent &)>;

enum class MonitorSignal
{
    Completed,       // the transport finished (either way)
    Stalled,
    ResponseTimeout,  // whole body sent, host silent for response_timeout
    Cancelled,
    CallbackAborted
};

const char *to_string(MonitorSignal s);

// Watches one attempt from the caller's thread. The transport worker bumps a
// cumulative byte counter and sets `done` when it returns; the monitor samples
// the counter once per tick, reports advances and counts idle ticks. Once the
// whole body is out, idle ticks stop counting and the wait for the host's
// answer is bounded by response_timeout instead. A callback that throws is
// treated as Abort.
class ProgressMonitor
{
  public:
    ProgressMonitor(std::optional<std::uint64_t> total,
                    std::chrono::milliseconds    tick,
                    std::uint32_t                stall_threshold_ticks,
                    ProgressCallback             callback,
                    sealdrop::CancelToken       *cancel           = nullptr,
                    std::chrono::milliseconds    response_timeout = constants::DEFAULT_RESPONSE_TIMEOUT);

    // 0% / 0 bytes. false if the callback asked to stop.
    bool begin();

    MonitorSignal watch(const std::atomic<std::uint64_t> &bytes_sent, sealdrop::Event &done);

    // 100% after a successful attempt. The attempt has already resolved, so an
    // Abort (or a throwing callback) here is only logged.
    void finish(std::uint64_t final_bytes);

    std::uint32_t ticks() const { return ticks_; }
    std::uint32_t idle_ticks() const { return idle_ticks_; }
    std::uint64_t last_reported() const { return last_bytes_; }
    std::chrono::steady_clock::time_point last_progress_at() const { return last_progress_at_; }

  private:
    ProgressAction emit(std::uint64_t bytes);
    ProgressAction deliver(const ProgressEvent &ev);

    std::optional<std::uint64_t>          total_;
    std::chrono::milliseconds             tick_;
    std::uint32_t                         stall_threshold_;
    ProgressCallback                      cb_;
    sealdrop::CancelToken                *cancel_;
    std::chrono::milliseconds             response_timeout_;
    std::uint64_t                         last_bytes_{0};
    std::uint32_t                         ticks_{0};
    std::uint32_t                         idle_ticks_{0};
    std::chrono::steady_clock::time_point last_progress_at_;
};

}  // namespace upload
