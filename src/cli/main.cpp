#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "app/attachment_service.hpp"
#include "app/config.hpp"
#include "crypto/attachment_cipher.hpp"
#include "crypto/digest.hpp"
#include "transport/curl_transport.hpp"
#include "transport/loopback_transport.hpp"
#include "upload/failover.hpp"
#include "util/cancel.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

using namespace std::chrono_literals;

volatile std::sig_atomic_t g_signal = 0;

extern "C" void on_signal(int sig)
{
    g_signal = sig;
}

// Host used by --dry-run when no destination is configured.
constexpr const char *DRY_RUN_HOST = "https://dry-run.invalid";

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  sealdrop <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  upload [--server URL]... [--nip96 URL]... [--auth VALUE] [--mime TYPE]\n"
                 "         [--recipient ID] [--dry-run] <file>\n"
                 "  open   (--key HEX --nonce HEX [--digest HEX] | --record FILE) <in> <out>\n"
                 "  digest <file>\n"
                 "  keygen\n"
                 "\n"
                 "Environment: SEALDROP_SERVERS, SEALDROP_NIP96_SERVERS, SEALDROP_AUTH,\n"
                 "  SEALDROP_RETRY_COUNT, SEALDROP_RETRY_SPACING_MS, SEALDROP_CHUNK_SIZE,\n"
                 "  SEALDROP_CONNECT_TIMEOUT_MS, SEALDROP_POOL_IDLE_TIMEOUT_S,\n"
                 "  SEALDROP_POOL_MAX_IDLE, SEALDROP_STALL_TICKS, SEALDROP_RESPONSE_TIMEOUT_MS,\n"
                 "  SEALDROP_PROXY, SEALDROP_LOG_LEVEL\n");
}

static bool read_file(const std::string &path, std::vector<std::uint8_t> &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

static bool write_file(const std::string &path, const std::vector<std::uint8_t> &data)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return false;
    out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

// Flags with a value ("--x v"), repeated flags accumulate. Positionals keep order.
struct Args
{
    std::unordered_map<std::string, std::vector<std::string>> opts;
    std::vector<std::string>                                  positional;
    bool                                                      dry_run = false;

    const std::string *last(const std::string &k) const
    {
        auto it = opts.find(k);
        return (it == opts.end() || it->second.empty()) ? nullptr : &it->second.back();
    }
};

static bool parse_args(const std::vector<std::string> &argv, Args &out)
{
    static const char *with_value[] = {"--server", "--nip96", "--auth",  "--mime",   "--recipient",
                                       "--key",    "--nonce", "--digest", "--record"};
    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string &a = argv[i];
        if (a == "--dry-run")
        {
            out.dry_run = true;
            continue;
        }
        bool known = false;
        for (const char *f : with_value)
        {
            if (a == f)
            {
                if (i + 1 >= argv.size())
                {
                    std::fprintf(stderr, "error: %s needs a value\n", f);
                    return false;
                }
                out.opts[a].push_back(argv[++i]);
                known = true;
                break;
            }
        }
        if (known)
            continue;
        if (a.size() > 1 && a[0] == '-')
        {
            std::fprintf(stderr, "error: unknown option %s\n", a.c_str());
            return false;
        }
        out.positional.push_back(a);
    }
    return true;
}

// Runs `fn` with SIGINT/SIGTERM wired to `token`.
static int with_cancellation(sealdrop::CancelToken &token, const std::function<int()> &fn)
{
    g_signal = 0;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    sealdrop::Event stop;
    std::thread     watcher([&] {
        while (!stop.wait_for(50ms))
        {
            if (g_signal != 0 && !token.cancelled())
            {
                LOG_WARN("signal %d: cancelling upload", static_cast<int>(g_signal));
                token.cancel();
            }
        }
    });

    const int rc = fn();
    stop.set();
    watcher.join();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    return rc;
}

static int cmd_upload(const Args &args)
{
    if (args.positional.size() != 1)
    {
        print_usage();
        return exitc::bad_args;
    }
    const std::string &path = args.positional[0];

    app::Config cfg = app::load_config_from_env();

    // command-line destinations replace the environment's
    auto servers = args.opts.find("--server");
    auto nip96   = args.opts.find("--nip96");
    if (servers != args.opts.end() || nip96 != args.opts.end())
    {
        cfg.destinations.clear();
        if (servers != args.opts.end())
            for (const auto &u : servers->second)
                cfg.destinations.push_back({u, transport::Protocol::Blossom});
        if (nip96 != args.opts.end())
            for (const auto &u : nip96->second)
                cfg.destinations.push_back({u, transport::Protocol::Nip96});
    }
    if (const std::string *a = args.last("--auth"))
        cfg.auth = *a;
    if (const std::string *m = args.last("--mime"))
        cfg.options.mime_type = *m;
    const std::string recipient = args.last("--recipient") ? *args.last("--recipient") : "";

    if (cfg.destinations.empty())
    {
        if (!args.dry_run)
        {
            std::fprintf(stderr, "error: no destinations (use --server/--nip96 or %s)\n",
                         constants::ENV_SERVERS);
            return exitc::bad_args;
        }
        cfg.destinations.push_back({DRY_RUN_HOST, transport::Protocol::Blossom});
    }

    app::AttachmentFile file;
    if (!app::AttachmentFile::from_path(path, file))
    {
        std::fprintf(stderr, "error: cannot read %s\n", path.c_str());
        return exitc::io_error;
    }

    std::unique_ptr<transport::IUploadTransport> tx;
    if (args.dry_run)
        tx = std::make_unique<transport::LoopbackTransport>();
    else
        tx = std::make_unique<transport::CurlTransport>(cfg.options.transport);

    transport::StaticAuthorizer auth(cfg.auth);
    aead::AesGcmCipher          cipher;
    app::JsonLineSink           sink(stdout);
    app::AttachmentService      service(*tx, auth, cipher, &sink);

    int last_pct = -1;
    cfg.options.on_progress = [&last_pct](const upload::ProgressEvent &ev) {
        if (ev.percentage && static_cast<int>(*ev.percentage) != last_pct)
        {
            last_pct = *ev.percentage;
            std::fprintf(stderr, "Upload progress: %d%%\n", last_pct);
        }
        else if (!ev.percentage && ev.bytes)
        {
            std::fprintf(stderr, "Upload progress: %llu bytes\n",
                         static_cast<unsigned long long>(*ev.bytes));
        }
        return upload::ProgressAction::Continue;
    };

    sealdrop::CancelToken token;
    cfg.options.cancel = &token;

    return with_cancellation(token, [&]() -> int {
        app::AttachmentRecord record;
        app::SendError        err;
        if (service.send_file(recipient, file, cfg.destinations, cfg.options, record, err))
            return exitc::ok;

        std::fprintf(stderr, "error: %s\n", err.describe().c_str());
        switch (err.code)
        {
            case app::SendErrc::Crypto:
            case app::SendErrc::DigestMismatch:
                return exitc::crypto_error;
            case app::SendErrc::DeliveryFailed:
                return exitc::delivery_failed;
            case app::SendErrc::Upload:
                if (err.upload.code == upload::UploadErrc::Cancelled)
                    return exitc::cancelled;
                if (err.upload.code == upload::UploadErrc::InvalidConfig ||
                    err.upload.code == upload::UploadErrc::NoDestinations)
                    return exitc::bad_args;
                return exitc::upload_failed;
        }
        return exitc::upload_failed;
    });
}

static int cmd_open(const Args &args)
{
    if (args.positional.size() != 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    app::AttachmentRecord record;
    if (const std::string *rec_path = args.last("--record"))
    {
        std::vector<std::uint8_t> raw;
        if (!read_file(*rec_path, raw))
        {
            std::fprintf(stderr, "error: cannot read %s\n", rec_path->c_str());
            return exitc::io_error;
        }
        std::string why;
        if (!app::record_from_json(std::string(raw.begin(), raw.end()), record, why))
        {
            std::fprintf(stderr, "error: %s: %s\n", rec_path->c_str(), why.c_str());
            return exitc::bad_args;
        }
    }
    else
    {
        const std::string *key = args.last("--key"), *nonce = args.last("--nonce");
        if (!key || !nonce)
        {
            print_usage();
            return exitc::bad_args;
        }
        record.key   = *key;
        record.nonce = *nonce;
        if (const std::string *d = args.last("--digest"))
            record.digest = *d;
    }

    std::vector<std::uint8_t> blob;
    if (!read_file(args.positional[0], blob))
    {
        std::fprintf(stderr, "error: cannot read %s\n", args.positional[0].c_str());
        return exitc::io_error;
    }

    aead::AesGcmCipher        cipher;
    aead::CryptoError         cerr;
    aead::EncryptionParams    params{record.key, record.nonce};
    std::vector<std::uint8_t> plain;
    if (!cipher.open(blob, params, plain, cerr))
    {
        std::fprintf(stderr, "error: %s\n", aead::to_string(cerr.code));
        return exitc::crypto_error;
    }
    if (!record.digest.empty() && !aead::verify_digest(plain, record.digest))
    {
        std::fprintf(stderr, "error: digest mismatch\n");
        return exitc::crypto_error;
    }
    if (!write_file(args.positional[1], plain))
    {
        std::fprintf(stderr, "error: cannot write %s\n", args.positional[1].c_str());
        return exitc::io_error;
    }
    return exitc::ok;
}

static int cmd_digest(const Args &args)
{
    if (args.positional.size() != 1)
    {
        print_usage();
        return exitc::bad_args;
    }
    std::vector<std::uint8_t> data;
    if (!read_file(args.positional[0], data))
    {
        std::fprintf(stderr, "error: cannot read %s\n", args.positional[0].c_str());
        return exitc::io_error;
    }
    std::printf("%s\n", aead::calculate_digest(data).c_str());
    return exitc::ok;
}

static int cmd_keygen(const Args &)
{
    aead::EncryptionParams p;
    aead::CryptoError      err;
    if (!aead::generate_params(p, err))
    {
        std::fprintf(stderr, "error: %s\n", aead::to_string(err.code));
        return exitc::crypto_error;
    }
    nlohmann::json j;
    j["key"]   = p.key;
    j["nonce"] = p.nonce;
    std::printf("%s\n", j.dump().c_str());
    return exitc::ok;
}

static int run_cmd(const std::string &cmd, const Args &args)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"upload", [&]() -> int { return cmd_upload(args); }},
        {"open", [&]() -> int { return cmd_open(args); }},
        {"digest", [&]() -> int { return cmd_digest(args); }},
        {"keygen", [&]() -> int { return cmd_keygen(args); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }
    if (const char *lv = std::getenv(constants::ENV_LOG_LEVEL))
        sealdrop::set_log_level_by_name(lv);

    std::vector<std::string> argv_s(argv + 1, argv + argc);
    for (const auto &a : argv_s)
    {
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
    }

    Args args;
    if (!parse_args(argv_s, args))
    {
        print_usage();
        return exitc::bad_args;
    }
    return run_cmd(argv_s[0], args);
}
