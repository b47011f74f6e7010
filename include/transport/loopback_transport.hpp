#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "transport/itransport.hpp"

namespace transport
{

// What a scripted host does with one attempt.
struct ScriptedReply
{
    enum class Kind
    {
        Accept,       // take the whole body, answer with a location
        Reject,       // take the whole body, answer with an HTTP failure status
        ConnectFail,  // refuse before any byte is read
        Timeout,      // connect phase times out
        StallAfter,   // read `stall_after` bytes, then stop reading until aborted
        BadBody,      // take the whole body, answer 2xx without a usable location
        NoResponse    // take the whole body, then never answer until aborted
    };

    Kind        kind{Kind::Accept};
    long        status{0};
    std::string body;  // Accept: location (empty => derived); Reject: response body
    std::size_t stall_after{0};

    static ScriptedReply accept(std::string location = {});
    static ScriptedReply reject(long status, std::string body = {});
    static ScriptedReply connect_failure();
    static ScriptedReply timeout();
    static ScriptedReply stall_after_bytes(std::size_t bytes);
    static ScriptedReply bad_body();
    static ScriptedReply no_response();
};

// In-memory host farm for tests and --dry-run: no sockets, every destination is
// a scripted host. Pulls the body through the same ChunkCursor the HTTP client
// uses, so progress and chunk boundaries behave identically.
class LoopbackTransport final : public IUploadTransport
{
  public:
    // Replies are consumed in order; the last one repeats. Unscripted
    // destinations accept with "<url>/<blob digest>".
    void script(const std::string &url, std::vector<ScriptedReply> replies);
    void set_chunk_delay(std::chrono::milliseconds d);

    bool        stream_upload(const UploadRequest &req,
                              std::string         &location,
                              TransportError      &err) override;
    std::string name() const override { return "loopback"; }

    std::size_t                attempts(const std::string &url) const;
    std::vector<std::string>   contact_log() const;
    std::vector<std::size_t>   last_chunks(const std::string &url) const;
    std::uint64_t              last_bytes_received(const std::string &url) const;
    std::vector<std::uint8_t>  stored_blob(const std::string &url) const;
    std::vector<std::string>   authorizations(const std::string &url) const;
    std::string                last_mime_type(const std::string &url) const;

  private:
    struct Host
    {
        std::vector<ScriptedReply> script;
        std::size_t                next{0};
        std::size_t                attempts{0};
        std::vector<std::size_t>   last_chunks;
        std::uint64_t              last_bytes{0};
        std::vector<std::uint8_t>  stored;
        std::vector<std::string>   auth;
        std::string                mime;
    };

    ScriptedReply next_reply(Host &h) const;

    mutable std::mutex          mu_;
    std::map<std::string, Host> hosts_;
    std::vector<std::string>    contacts_;
    std::chrono::milliseconds   chunk_delay_{0};
};

}  // namespace transport
