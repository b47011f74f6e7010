#pragma once
#include <cstdarg>
#include <string>

namespace sealdrop
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3
};

Level       log_level();
void        set_log_level(Level lv);
// Accepts debug|info|warn|warning|error|err in either case; anything else -> Info.
void        set_log_level_by_name(const char *name);
const char *level_name(Level lv);

void logf(Level lv, const char *func, const char *fmt, ...)
    __attribute__((format(printf, 3, 4)));

// Tags every line logged from the current thread while alive, e.g. "[dest 2/3]".
// Scopes nest; the innermost tag wins and the previous one is restored on exit.
class LogScope
{
  public:
    explicit LogScope(std::string tag);
    ~LogScope();

    LogScope(const LogScope &)            = delete;
    LogScope &operator=(const LogScope &) = delete;

  private:
    std::string prev_;
};

#define LOG_DEBUG(...) ::sealdrop::logf(::sealdrop::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::sealdrop::logf(::sealdrop::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::sealdrop::logf(::sealdrop::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::sealdrop::logf(::sealdrop::Level::Error, __func__, __VA_ARGS__)

}  // namespace sealdrop
