#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sealdrop
{

// One-shot flag that can be waited on. Used for caller cancellation and for
// "attempt finished" signalling between the transport worker and the monitor.
class Event
{
  public:
    void set()
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            set_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool is_set() const { return set_.load(std::memory_order_acquire); }

    // true if the event got set within d
    template <class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep, Period> d)
    {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_for(lk, d, [this] { return set_.load(std::memory_order_acquire); });
    }

  private:
    std::mutex              mu_;
    std::condition_variable cv_;
    std::atomic_bool        set_{false};
};

class CancelToken
{
  public:
    void cancel() { ev_.set(); }
    bool cancelled() const { return ev_.is_set(); }

    // Sleep for d; returns true if cancelled before or during the wait.
    template <class Rep, class Period>
    bool sleep_for(std::chrono::duration<Rep, Period> d)
    {
        return ev_.wait_for(d);
    }

  private:
    Event ev_;
};

}  // namespace sealdrop
