#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "crypto/attachment_cipher.hpp"
#include "crypto/digest.hpp"
#include "transport/itransport.hpp"
#include "transport/loopback_transport.hpp"

using namespace transport;
using namespace std::chrono_literals;

namespace
{
aead::AttachmentPayload make_payload(std::size_t n)
{
    aead::AttachmentPayload p;
    p.ciphertext.resize(n);
    for (std::size_t i = 0; i < n; ++i)
        p.ciphertext[i] = static_cast<std::uint8_t>(i * 13);
    p.mime_type   = "application/octet-stream";
    p.blob_digest = aead::calculate_digest(p.ciphertext);
    return p;
}

UploadRequest make_request(const Destination &d, const aead::AttachmentPayload &p,
                           std::size_t chunk)
{
    UploadRequest r;
    r.destination = &d;
    r.payload     = &p;
    r.chunk_size  = chunk;
    return r;
}
}  // namespace

TEST(Loopback, UnscriptedHostAccepts)
{
    LoopbackTransport t;
    Destination       d{"https://a.example/", Protocol::Blossom};
    auto              p   = make_payload(2500);
    auto              req = make_request(d, p, 1000);

    std::vector<std::uint64_t> seen;
    req.on_bytes_sent = [&](std::uint64_t n) { seen.push_back(n); };
    req.authorization = "Nostr abc";

    std::string    loc;
    TransportError err;
    ASSERT_TRUE(t.stream_upload(req, loc, err));
    EXPECT_EQ(loc, "https://a.example/" + p.blob_digest);
    EXPECT_EQ(t.stored_blob(d.url), p.ciphertext);
    EXPECT_EQ(t.last_chunks(d.url), (std::vector<std::size_t>{1000, 1000, 500}));
    EXPECT_EQ(seen, (std::vector<std::uint64_t>{1000, 2000, 2500}));
    EXPECT_EQ(t.authorizations(d.url), (std::vector<std::string>{"Nostr abc"}));
    EXPECT_EQ(t.attempts(d.url), 1u);
}

TEST(Loopback, ScriptIsConsumedAndLastRepeats)
{
    LoopbackTransport t;
    Destination       d{"https://b.example", Protocol::Nip96};
    t.script(d.url, {ScriptedReply::connect_failure(), ScriptedReply::reject(503, "busy"),
                     ScriptedReply::accept("https://cdn.example/x")});
    auto p   = make_payload(100);
    auto req = make_request(d, p, 64);

    std::string    loc;
    TransportError err;
    EXPECT_FALSE(t.stream_upload(req, loc, err));
    EXPECT_EQ(err.code, TransportErrc::Connect);
    EXPECT_EQ(t.last_bytes_received(d.url), 0u);

    EXPECT_FALSE(t.stream_upload(req, loc, err));
    EXPECT_EQ(err.code, TransportErrc::RemoteRejected);
    EXPECT_EQ(err.status, 503);
    EXPECT_EQ(err.body, "busy");
    EXPECT_EQ(t.last_bytes_received(d.url), 100u);

    ASSERT_TRUE(t.stream_upload(req, loc, err));
    EXPECT_EQ(loc, "https://cdn.example/x");
    ASSERT_TRUE(t.stream_upload(req, loc, err));
    EXPECT_EQ(t.attempts(d.url), 4u);
    EXPECT_EQ(t.contact_log().size(), 4u);
}

TEST(Loopback, StalledHostWaitsForAbort)
{
    LoopbackTransport t;
    Destination       d{"https://c.example", Protocol::Blossom};
    t.script(d.url, {ScriptedReply::stall_after_bytes(1000)});
    auto p   = make_payload(5000);
    auto req = make_request(d, p, 1000);

    std::atomic_bool abort{false};
    req.abort = &abort;

    bool           ok = true;
    std::string    loc;
    TransportError err;
    std::thread    th([&] { ok = t.stream_upload(req, loc, err); });
    std::this_thread::sleep_for(50ms);
    abort.store(true);
    th.join();

    EXPECT_FALSE(ok);
    EXPECT_EQ(err.code, TransportErrc::Cancelled);
    EXPECT_EQ(t.last_bytes_received(d.url), 1000u);
}

TEST(Loopback, SilentHostTakesBodyThenWaits)
{
    LoopbackTransport t;
    Destination       d{"https://silent.example", Protocol::Blossom};
    t.script(d.url, {ScriptedReply::no_response()});
    auto p   = make_payload(5000);
    auto req = make_request(d, p, 1000);

    std::atomic_bool abort{false};
    req.abort = &abort;

    bool           ok = true;
    std::string    loc;
    TransportError err;
    std::thread    th([&] { ok = t.stream_upload(req, loc, err); });
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(t.last_bytes_received(d.url), 5000u);
    abort.store(true);
    th.join();

    EXPECT_FALSE(ok);
    EXPECT_EQ(err.code, TransportErrc::Cancelled);
    EXPECT_TRUE(t.stored_blob(d.url).empty());
}

TEST(Loopback, MimeOverrideIsRecorded)
{
    LoopbackTransport t;
    Destination       d{"https://d.example", Protocol::Blossom};
    auto              p   = make_payload(10);
    auto              req = make_request(d, p, 1024);
    req.mime_type         = "image/webp";

    std::string    loc;
    TransportError err;
    ASSERT_TRUE(t.stream_upload(req, loc, err));
    EXPECT_EQ(t.last_mime_type(d.url), "image/webp");
}
