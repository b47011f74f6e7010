#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <strings.h>
#include <utility>

#include "util/log.hpp"

namespace sealdrop
{

namespace
{

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex       g_out_mu;
thread_local std::string t_scope;

void timestamp(char *buf, std::size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(ms.count()));
}

}  // namespace

Level log_level()
{
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

void set_log_level(Level lv)
{
    g_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

void set_log_level_by_name(const char *name)
{
    if (!name)
    {
        set_log_level(Level::Info);
        return;
    }
    if (strcasecmp(name, "debug") == 0)
        set_log_level(Level::Debug);
    else if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0)
        set_log_level(Level::Warning);
    else if (strcasecmp(name, "error") == 0 || strcasecmp(name, "err") == 0)
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);  // default
}

const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
    }
    return "?";
}

void logf(Level lv, const char *func, const char *fmt, ...)
{
    if (static_cast<int>(lv) < g_level.load(std::memory_order_relaxed))
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    // format the body first so the locked section is one write
    char    body[1024];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(body, sizeof(body), fmt, ap);
    va_end(ap);

    const std::size_t m       = std::strlen(body);
    const bool        need_nl = (m == 0 || body[m - 1] != '\n');

    std::lock_guard<std::mutex> lk(g_out_mu);
    if (t_scope.empty())
        std::fprintf(stderr, "%s %s %s: %s%s", ts, level_name(lv), func ? func : "?", body,
                     need_nl ? "\n" : "");
    else
        std::fprintf(stderr, "%s %s [%s] %s: %s%s", ts, level_name(lv), t_scope.c_str(),
                     func ? func : "?", body, need_nl ? "\n" : "");
}

LogScope::LogScope(std::string tag) : prev_(std::move(t_scope))
{
    t_scope = std::move(tag);
}

LogScope::~LogScope()
{
    t_scope = std::move(prev_);
}

}  // namespace sealdrop
