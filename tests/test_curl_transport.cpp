#include <algorithm>
#include <arpa/inet.h>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <gtest/gtest.h>
#include <map>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "crypto/digest.hpp"
#include "transport/curl_transport.hpp"
#include "util/cancel.hpp"

using namespace transport;
using namespace std::chrono_literals;

namespace
{

// Single-threaded HTTP/1.1 responder on 127.0.0.1, one request per connection.
class MiniHttpServer
{
  public:
    struct Reply
    {
        int         status = 200;
        std::string body;
        bool        hang = false;  // read the request, never answer
    };
    struct Seen
    {
        std::string                        method, path, body;
        std::map<std::string, std::string> headers;  // lowercase keys
    };

    MiniHttpServer()
    {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family      = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port        = 0;
        ::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        ::listen(fd_, 8);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        th_   = std::thread([this] { loop(); });
    }

    ~MiniHttpServer()
    {
        stop_.store(true);
        release_.set();
        th_.join();
        ::close(fd_);
    }

    void push(Reply r)
    {
        std::lock_guard<std::mutex> lk(mu_);
        replies_.push_back(std::move(r));
    }

    std::string base() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::vector<Seen> seen()
    {
        std::lock_guard<std::mutex> lk(mu_);
        return seen_;
    }

  private:
    void loop()
    {
        while (!stop_.load())
        {
            pollfd p{fd_, POLLIN, 0};
            if (::poll(&p, 1, 20) <= 0)
                continue;
            int c = ::accept(fd_, nullptr, nullptr);
            if (c < 0)
                continue;
            serve(c);
            ::close(c);
        }
    }

    static std::string lower(std::string s)
    {
        for (auto &ch : s)
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        return s;
    }

    bool read_more(int c, std::string &buf)
    {
        pollfd p{c, POLLIN, 0};
        if (::poll(&p, 1, 5000) <= 0)
            return false;
        char    tmp[16384];
        ssize_t n = ::recv(c, tmp, sizeof(tmp), 0);
        if (n <= 0)
            return false;
        buf.append(tmp, static_cast<std::size_t>(n));
        return true;
    }

    void serve(int c)
    {
        std::string buf;
        std::size_t hdr_end;
        while ((hdr_end = buf.find("\r\n\r\n")) == std::string::npos)
            if (!read_more(c, buf))
                return;

        Seen        s;
        std::string head = buf.substr(0, hdr_end);
        std::string rest = buf.substr(hdr_end + 4);
        std::size_t eol  = head.find("\r\n");
        std::string line = head.substr(0, eol);
        s.method         = line.substr(0, line.find(' '));
        s.path = line.substr(line.find(' ') + 1, line.rfind(' ') - line.find(' ') - 1);
        std::size_t pos = eol == std::string::npos ? head.size() : eol + 2;
        while (pos < head.size())
        {
            std::size_t e = head.find("\r\n", pos);
            if (e == std::string::npos)
                e = head.size();
            std::string h     = head.substr(pos, e - pos);
            std::size_t colon = h.find(':');
            if (colon != std::string::npos)
            {
                std::string v = h.substr(colon + 1);
                while (!v.empty() && v.front() == ' ')
                    v.erase(v.begin());
                s.headers[lower(h.substr(0, colon))] = v;
            }
            pos = e + 2;
        }

        auto cl = s.headers.find("content-length");
        if (cl != s.headers.end())
        {
            const std::size_t want = std::stoul(cl->second);
            while (rest.size() < want)
                if (!read_more(c, rest))
                    return;
            s.body = rest.substr(0, want);
        }
        else if (lower(s.headers["transfer-encoding"]) == "chunked")
        {
            std::size_t at = 0;
            for (;;)
            {
                std::size_t crlf;
                while ((crlf = rest.find("\r\n", at)) == std::string::npos)
                    if (!read_more(c, rest))
                        return;
                const std::size_t n = std::stoul(rest.substr(at, crlf - at), nullptr, 16);
                while (rest.size() < crlf + 2 + n + 2)
                    if (!read_more(c, rest))
                        return;
                if (n == 0)
                    break;
                s.body += rest.substr(crlf + 2, n);
                at = crlf + 2 + n + 2;
            }
        }

        Reply r;
        {
            std::lock_guard<std::mutex> lk(mu_);
            seen_.push_back(s);
            if (!replies_.empty())
            {
                r = replies_.front();
                replies_.pop_front();
            }
        }
        if (r.hang)
        {
            release_.wait_for(10s);
            return;
        }
        std::string out = "HTTP/1.1 " + std::to_string(r.status) + " X\r\n"
                          "Content-Type: application/json\r\n"
                          "Content-Length: " + std::to_string(r.body.size()) + "\r\n"
                          "Connection: close\r\n\r\n" + r.body;
        std::size_t sent = 0;
        while (sent < out.size())
        {
            ssize_t n = ::send(c, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
                return;
            sent += static_cast<std::size_t>(n);
        }
    }

    int                 fd_   = -1;
    unsigned short      port_ = 0;
    std::atomic_bool    stop_{false};
    sealdrop::Event     release_;
    std::thread         th_;
    std::mutex          mu_;
    std::deque<Reply>   replies_;
    std::vector<Seen>   seen_;
};

aead::AttachmentPayload make_payload(std::size_t n, const std::string &mime)
{
    aead::AttachmentPayload p;
    p.ciphertext.resize(n);
    for (std::size_t i = 0; i < n; ++i)
        p.ciphertext[i] = static_cast<std::uint8_t>((i * 131) ^ (i >> 8));
    p.mime_type   = mime;
    p.blob_digest = aead::calculate_digest(p.ciphertext);
    return p;
}

class CurlTransportTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        for (const char *v : {"http_proxy", "HTTP_PROXY", "https_proxy", "HTTPS_PROXY",
                              "all_proxy", "ALL_PROXY"})
            ::unsetenv(v);
    }
};

}  // namespace

TEST_F(CurlTransportTest, BlossomPutStreamsBody)
{
    MiniHttpServer srv;
    srv.push({200, R"({"url":"https://cdn.example/abc","size":1})"});

    CurlTransport tx(TransportConfig{});
    Destination   d{srv.base() + "/", Protocol::Blossom};
    auto          p = make_payload(300 * 1024, "image/png");

    std::vector<std::uint64_t> sent;
    UploadRequest              req;
    req.destination   = &d;
    req.payload       = &p;
    req.chunk_size    = 64 * 1024;
    req.authorization = "Nostr abc";
    req.on_bytes_sent = [&](std::uint64_t n) { sent.push_back(n); };

    std::string    loc;
    TransportError err;
    ASSERT_TRUE(tx.stream_upload(req, loc, err)) << err.describe();
    EXPECT_EQ(loc, "https://cdn.example/abc");

    auto seen = srv.seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "PUT");
    EXPECT_EQ(seen[0].path, "/upload");
    EXPECT_EQ(seen[0].headers["content-type"], "image/png");
    EXPECT_EQ(seen[0].headers["authorization"], "Nostr abc");
    EXPECT_EQ(seen[0].headers.count("expect"), 0u);
    EXPECT_EQ(seen[0].body.size(), p.ciphertext.size());
    EXPECT_TRUE(std::equal(p.ciphertext.begin(), p.ciphertext.end(), seen[0].body.begin()));

    ASSERT_EQ(sent.size(), 5u);
    EXPECT_EQ(sent.front(), 64u * 1024u);
    EXPECT_EQ(sent.back(), p.ciphertext.size());
}

TEST_F(CurlTransportTest, Nip96MultipartPost)
{
    MiniHttpServer srv;
    srv.push({201, R"({"status":"success","message":"ok",
                      "nip94_event":{"tags":[["url","https://files.example/f"]]}})"});

    CurlTransport tx(TransportConfig{});
    Destination   d{srv.base() + "/api/v2/media", Protocol::Nip96};
    auto          p = make_payload(5000, "audio/ogg");

    UploadRequest req;
    req.destination = &d;
    req.payload     = &p;
    req.chunk_size  = 1024;

    std::string    loc;
    TransportError err;
    ASSERT_TRUE(tx.stream_upload(req, loc, err)) << err.describe();
    EXPECT_EQ(loc, "https://files.example/f");

    auto seen = srv.seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "POST");
    EXPECT_EQ(seen[0].path, "/api/v2/media");
    EXPECT_EQ(seen[0].headers["content-type"].rfind("multipart/form-data", 0), 0u);
    EXPECT_EQ(seen[0].headers.count("authorization"), 0u);
    const std::string &body = seen[0].body;
    EXPECT_NE(body.find("name=\"file\"; filename=\"filename\""), std::string::npos);
    EXPECT_NE(body.find("Content-Type: audio/ogg"), std::string::npos);
    const std::string raw(p.ciphertext.begin(), p.ciphertext.end());
    EXPECT_NE(body.find(raw), std::string::npos);
}

TEST_F(CurlTransportTest, FailureStatusesAndBodies)
{
    MiniHttpServer srv;
    srv.push({503, "try later"});
    srv.push({200, "<html>not json</html>"});
    srv.push({200, R"({"status":"error","message":"file type not allowed"})"});

    CurlTransport tx(TransportConfig{});
    auto          p = make_payload(100, "application/octet-stream");
    Destination   blossom{srv.base(), Protocol::Blossom};
    Destination   nip96{srv.base() + "/media", Protocol::Nip96};

    UploadRequest req;
    req.payload    = &p;
    req.chunk_size = 1024;

    std::string    loc;
    TransportError err;

    req.destination = &blossom;
    EXPECT_FALSE(tx.stream_upload(req, loc, err));
    EXPECT_EQ(err.code, TransportErrc::RemoteRejected);
    EXPECT_EQ(err.status, 503);
    EXPECT_EQ(err.body, "try later");

    EXPECT_FALSE(tx.stream_upload(req, loc, err));
    EXPECT_EQ(err.code, TransportErrc::BadResponse);

    req.destination = &nip96;
    EXPECT_FALSE(tx.stream_upload(req, loc, err));
    EXPECT_EQ(err.code, TransportErrc::RemoteRejected);
    EXPECT_EQ(err.status, 200);
    EXPECT_EQ(err.body, "file type not allowed");
    EXPECT_TRUE(loc.empty());
}

TEST_F(CurlTransportTest, ConnectionRefused)
{
    // grab a free port, then release it so nothing listens there
    int         s = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(s, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    ::getsockname(s, reinterpret_cast<sockaddr *>(&addr), &len);
    ::close(s);

    TransportConfig cfg;
    cfg.connect_timeout = 2000ms;
    CurlTransport tx(cfg);
    Destination   d{"http://127.0.0.1:" + std::to_string(ntohs(addr.sin_port)), Protocol::Blossom};
    auto          p = make_payload(100, "");

    UploadRequest req;
    req.destination = &d;
    req.payload     = &p;
    req.chunk_size  = 1024;

    std::string    loc;
    TransportError err;
    EXPECT_FALSE(tx.stream_upload(req, loc, err));
    EXPECT_EQ(err.code, TransportErrc::Connect);
}

TEST_F(CurlTransportTest, AbortFlagTearsDownPendingRequest)
{
    MiniHttpServer srv;
    MiniHttpServer::Reply hang;
    hang.hang = true;
    srv.push(hang);

    CurlTransport tx(TransportConfig{});
    Destination   d{srv.base(), Protocol::Blossom};
    auto          p = make_payload(1000, "");

    std::atomic_bool abort{false};
    UploadRequest    req;
    req.destination = &d;
    req.payload     = &p;
    req.chunk_size  = 1024;
    req.abort       = &abort;

    bool           ok = true;
    std::string    loc;
    TransportError err;
    const auto     t0 = std::chrono::steady_clock::now();
    std::thread    th([&] { ok = tx.stream_upload(req, loc, err); });
    std::this_thread::sleep_for(200ms);
    abort.store(true);
    th.join();
    const auto dt = std::chrono::steady_clock::now() - t0;

    EXPECT_FALSE(ok);
    EXPECT_EQ(err.code, TransportErrc::Cancelled);
    EXPECT_LT(dt, 5s);
}

TEST_F(CurlTransportTest, SilentHostTimesOut)
{
    MiniHttpServer srv;
    MiniHttpServer::Reply hang;
    hang.hang = true;
    srv.push(hang);

    TransportConfig cfg;
    cfg.response_timeout = 1000ms;
    CurlTransport tx(cfg);
    Destination   d{srv.base(), Protocol::Blossom};
    auto          p = make_payload(1000, "");

    UploadRequest req;
    req.destination = &d;
    req.payload     = &p;
    req.chunk_size  = 1024;

    std::string    loc;
    TransportError err;
    const auto     t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(tx.stream_upload(req, loc, err));
    const auto dt = std::chrono::steady_clock::now() - t0;

    EXPECT_EQ(err.code, TransportErrc::Timeout);
    EXPECT_GE(dt, 900ms);
    EXPECT_LT(dt, 9s);
}
