#include <thread>
#include <utility>

#include "proto/chunker.hpp"
#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{

namespace
{

// upper bound for a stalled host to wait on an abort that never comes
constexpr std::chrono::seconds STALL_GIVE_UP{60};

bool fail(TransportError &err, TransportErrc code, std::string detail)
{
    err        = {};
    err.code   = code;
    err.detail = std::move(detail);
    return false;
}

// Blocks like a host that stopped talking; only an abort (or the give-up bound)
// ends it.
bool hold_until_aborted(const UploadRequest &req, TransportError &err, const char *what)
{
    const auto give_up = std::chrono::steady_clock::now() + STALL_GIVE_UP;
    while (!req.aborted())
    {
        if (std::chrono::steady_clock::now() >= give_up)
            return fail(err, TransportErrc::Timeout, std::string(what) + ": host gave up");
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return fail(err, TransportErrc::Cancelled, std::string("aborted while ") + what);
}

}  // namespace

ScriptedReply ScriptedReply::accept(std::string location)
{
    ScriptedReply r;
    r.kind = Kind::Accept;
    r.body = std::move(location);
    return r;
}

ScriptedReply ScriptedReply::reject(long status, std::string body)
{
    ScriptedReply r;
    r.kind   = Kind::Reject;
    r.status = status;
    r.body   = std::move(body);
    return r;
}

ScriptedReply ScriptedReply::connect_failure()
{
    ScriptedReply r;
    r.kind = Kind::ConnectFail;
    return r;
}

ScriptedReply ScriptedReply::timeout()
{
    ScriptedReply r;
    r.kind = Kind::Timeout;
    return r;
}

ScriptedReply ScriptedReply::stall_after_bytes(std::size_t bytes)
{
    ScriptedReply r;
    r.kind        = Kind::StallAfter;
    r.stall_after = bytes;
    return r;
}

ScriptedReply ScriptedReply::bad_body()
{
    ScriptedReply r;
    r.kind = Kind::BadBody;
    return r;
}

ScriptedReply ScriptedReply::no_response()
{
    ScriptedReply r;
    r.kind = Kind::NoResponse;
    return r;
}

void LoopbackTransport::script(const std::string &url, std::vector<ScriptedReply> replies)
{
    std::lock_guard<std::mutex> lk(mu_);
    Host &h  = hosts_[url];
    h.script = std::move(replies);
    h.next   = 0;
}

void LoopbackTransport::set_chunk_delay(std::chrono::milliseconds d)
{
    std::lock_guard<std::mutex> lk(mu_);
    chunk_delay_ = d;
}

ScriptedReply LoopbackTransport::next_reply(Host &h) const
{
    if (h.script.empty())
        return ScriptedReply::accept();
    const std::size_t i = h.next < h.script.size() ? h.next : h.script.size() - 1;
    if (h.next < h.script.size())
        ++h.next;
    return h.script[i];
}

bool LoopbackTransport::stream_upload(const UploadRequest &req,
                                      std::string         &location,
                                      TransportError      &err)
{
    if (!req.destination || !req.payload)
        return fail(err, TransportErrc::Internal, "incomplete upload request");

    const std::string              url     = req.destination->url;
    const aead::AttachmentPayload &payload = *req.payload;

    ScriptedReply             reply;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lk(mu_);
        Host &h = hosts_[url];
        ++h.attempts;
        h.last_chunks.clear();
        h.last_bytes = 0;
        h.auth.push_back(req.authorization);
        h.mime = req.mime_type.empty() ? payload.mime_type : req.mime_type;
        contacts_.push_back(url);
        reply = next_reply(h);
        delay = chunk_delay_;
    }
    LOG_DEBUG("loopback %s: attempt against %s", to_string(req.destination->protocol),
              url.c_str());

    if (reply.kind == ScriptedReply::Kind::ConnectFail)
        return fail(err, TransportErrc::Connect, "connection refused (scripted)");
    if (reply.kind == ScriptedReply::Kind::Timeout)
        return fail(err, TransportErrc::Timeout, "connect timed out (scripted)");

    std::vector<std::size_t>  chunks;
    std::vector<std::uint8_t> received;
    received.reserve(payload.ciphertext.size());

    frag::ChunkCursor cursor(payload.ciphertext.data(), payload.ciphertext.size(),
                             req.chunk_size, [&req](std::uint64_t n) {
                                 if (req.on_bytes_sent)
                                     req.on_bytes_sent(n);
                             });
    std::vector<std::uint8_t> buf(req.chunk_size ? req.chunk_size : 1);

    auto publish = [&]() {
        std::lock_guard<std::mutex> lk(mu_);
        Host &h       = hosts_[url];
        h.last_chunks = chunks;
        h.last_bytes  = received.size();
    };

    while (!cursor.done())
    {
        if (req.aborted())
        {
            publish();
            return fail(err, TransportErrc::Cancelled, "aborted");
        }
        if (reply.kind == ScriptedReply::Kind::StallAfter && received.size() >= reply.stall_after)
        {
            publish();
            return hold_until_aborted(req, err, "stalled");
        }

        const std::size_t n = cursor.read(buf.data(), buf.size());
        if (n == 0)
            break;
        received.insert(received.end(), buf.begin(), buf.begin() + static_cast<long>(n));
        chunks.push_back(n);
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
    }
    publish();

    switch (reply.kind)
    {
        case ScriptedReply::Kind::Reject:
            err        = {};
            err.code   = TransportErrc::RemoteRejected;
            err.status = reply.status;
            err.body   = reply.body;
            return false;
        case ScriptedReply::Kind::BadBody:
            return fail(err, TransportErrc::BadResponse, "blob descriptor has no url");
        case ScriptedReply::Kind::NoResponse:
            return hold_until_aborted(req, err, "waiting for a response");
        default:
            break;
    }

    std::string loc = reply.body;
    if (loc.empty())
    {
        std::string base = url;
        while (!base.empty() && base.back() == '/')
            base.pop_back();
        loc = base + "/" + payload.blob_digest;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        hosts_[url].stored = std::move(received);
    }
    location = std::move(loc);
    return true;
}

std::size_t LoopbackTransport::attempts(const std::string &url) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = hosts_.find(url);
    return it == hosts_.end() ? 0 : it->second.attempts;
}

std::vector<std::string> LoopbackTransport::contact_log() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return contacts_;
}

std::vector<std::size_t> LoopbackTransport::last_chunks(const std::string &url) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = hosts_.find(url);
    return it == hosts_.end() ? std::vector<std::size_t>{} : it->second.last_chunks;
}

std::uint64_t LoopbackTransport::last_bytes_received(const std::string &url) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = hosts_.find(url);
    return it == hosts_.end() ? 0 : it->second.last_bytes;
}

std::vector<std::uint8_t> LoopbackTransport::stored_blob(const std::string &url) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = hosts_.find(url);
    return it == hosts_.end() ? std::vector<std::uint8_t>{} : it->second.stored;
}

std::vector<std::string> LoopbackTransport::authorizations(const std::string &url) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = hosts_.find(url);
    return it == hosts_.end() ? std::vector<std::string>{} : it->second.auth;
}

std::string LoopbackTransport::last_mime_type(const std::string &url) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = hosts_.find(url);
    return it == hosts_.end() ? std::string{} : it->second.mime;
}

}  // namespace transport
