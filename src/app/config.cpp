#include <cstdlib>
#include <string>

#include "app/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

namespace
{

std::string trim(const std::string &s)
{
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos)
        return {};
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// Reads an unsigned env value in [lo, hi]; leaves `out` alone otherwise.
bool env_u64(const char *name, unsigned long long lo, unsigned long long hi,
             unsigned long long &out)
{
    const char *e = std::getenv(name);
    if (!e || !*e)
        return false;
    char              *p = nullptr;
    unsigned long long v = std::strtoull(e, &p, 10);
    if (p && *p == '\0' && *e != '-' && v >= lo && v <= hi)
    {
        out = v;
        LOG_DEBUG("Using %s=%llu", name, v);
        return true;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect %llu..%llu)", name, e, lo, hi);
    return false;
}

}  // namespace

std::vector<transport::Destination> parse_destination_list(const std::string &list,
                                                           transport::Protocol protocol)
{
    std::vector<transport::Destination> out;
    std::size_t                         start = 0;
    while (start <= list.size())
    {
        std::size_t end = list.find(',', start);
        if (end == std::string::npos)
            end = list.size();
        std::string url = trim(list.substr(start, end - start));
        if (!url.empty())
            out.push_back(transport::Destination{url, protocol});
        start = end + 1;
    }
    return out;
}

Config load_config_from_env()
{
    if (const char *lv = std::getenv(constants::ENV_LOG_LEVEL))
        sealdrop::set_log_level_by_name(lv);

    Config cfg;
    if (const char *e = std::getenv(constants::ENV_SERVERS))
        cfg.destinations = parse_destination_list(e, transport::Protocol::Blossom);
    if (const char *e = std::getenv(constants::ENV_NIP96_SERVERS))
    {
        auto nip96 = parse_destination_list(e, transport::Protocol::Nip96);
        cfg.destinations.insert(cfg.destinations.end(), nip96.begin(), nip96.end());
    }
    if (const char *e = std::getenv(constants::ENV_AUTH))
        cfg.auth = e;

    upload::RetryConfig        &rc = cfg.options.retry;
    transport::TransportConfig &tc = cfg.options.transport;
    unsigned long long          v  = 0;

    if (env_u64(constants::ENV_RETRY_COUNT, 0, constants::MAX_RETRY_COUNT, v))
        rc.retry_count = static_cast<std::uint32_t>(v);
    if (env_u64(constants::ENV_RETRY_SPACING_MS, 0,
                static_cast<unsigned long long>(constants::MAX_RETRY_SPACING.count()), v))
        rc.retry_spacing = std::chrono::milliseconds(v);
    if (env_u64(constants::ENV_CHUNK_SIZE, constants::MIN_CHUNK_SIZE, constants::MAX_CHUNK_SIZE, v))
        rc.chunk_size = static_cast<std::size_t>(v);
    if (env_u64(constants::ENV_CONNECT_TIMEOUT, 100, 600000, v))
        tc.connect_timeout = std::chrono::milliseconds(v);
    if (env_u64(constants::ENV_POOL_IDLE_TIMEOUT, 0, 3600, v))
        tc.pool_idle_timeout = std::chrono::seconds(v);
    if (env_u64(constants::ENV_POOL_MAX_IDLE, 0, 64, v))
        tc.pool_max_idle_per_host = static_cast<std::size_t>(v);
    if (env_u64(constants::ENV_STALL_TICKS, 1, 36000, v))
        tc.stall_threshold_ticks = static_cast<std::uint32_t>(v);
    if (env_u64(constants::ENV_RESPONSE_TIMEOUT, 100, 3600000, v))
        tc.response_timeout = std::chrono::milliseconds(v);
    if (const char *e = std::getenv(constants::ENV_PROXY))
    {
        if (*e)
            tc.proxy = std::string(e);
    }

    LOG_DEBUG("Config: %zu destination(s) retry_count=%u spacing=%lldms chunk=%zu proxy=%s",
              cfg.destinations.size(), rc.retry_count,
              static_cast<long long>(rc.retry_spacing.count()), rc.chunk_size,
              tc.proxy ? tc.proxy->c_str() : "(none)");
    return cfg;
}

}  // namespace app
