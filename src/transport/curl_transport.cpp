#include <algorithm>
#include <array>
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <string>

#include "proto/chunker.hpp"
#include "transport/curl_transport.hpp"
#include "transport/upload_response.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace transport
{

namespace
{

// libcurl's accepted CURLOPT_UPLOAD_BUFFERSIZE window
constexpr long MIN_UPLOAD_BUFFER = 16 * 1024;
constexpr long MAX_UPLOAD_BUFFER = 2 * 1024 * 1024;

bool ensure_curl_init()
{
    static const bool ok = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK);
    return ok;
}

// Per-request state shared with the libcurl callbacks.
struct Transfer
{
    const UploadRequest *req = nullptr;
    frag::ChunkCursor   *cursor = nullptr;
    std::string          response;
    bool                 truncated = false;
};

size_t read_cb(char *buffer, size_t size, size_t nitems, void *arg)
{
    auto *t = static_cast<Transfer *>(arg);
    if (t->req->aborted())
        return CURL_READFUNC_ABORT;
    return t->cursor->read(reinterpret_cast<std::uint8_t *>(buffer), size * nitems);
}

int seek_cb(void *arg, curl_off_t offset, int origin)
{
    auto *t = static_cast<Transfer *>(arg);
    // only full rewinds are supported (redirects, auth renegotiation)
    if (origin != SEEK_SET || offset != 0)
        return CURL_SEEKFUNC_CANTSEEK;
    t->cursor->rewind();
    return CURL_SEEKFUNC_OK;
}

size_t write_cb(char *ptr, size_t size, size_t nmemb, void *arg)
{
    auto        *t = static_cast<Transfer *>(arg);
    const size_t n = size * nmemb;
    if (t->response.size() < constants::MAX_RESPONSE_BODY)
    {
        const size_t room = constants::MAX_RESPONSE_BODY - t->response.size();
        t->response.append(ptr, std::min(n, room));
        if (n > room)
            t->truncated = true;
    }
    else
    {
        t->truncated = true;
    }
    return n;  // swallow the rest rather than failing the transfer
}

int xferinfo_cb(void *arg, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    auto *t = static_cast<Transfer *>(arg);
    return t->req->aborted() ? 1 : 0;
}

TransportErrc classify_curl(CURLcode rc)
{
    switch (rc)
    {
        case CURLE_OPERATION_TIMEDOUT:
            return TransportErrc::Timeout;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportErrc::Cancelled;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_BAD_FUNCTION_ARGUMENT:
        case CURLE_OUT_OF_MEMORY:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
            return TransportErrc::Internal;
        default:
            // resolve/connect/TLS handshake/send/recv/empty reply
            return TransportErrc::Connect;
    }
}

struct SlistDeleter
{
    void operator()(curl_slist *l) const { curl_slist_free_all(l); }
};
struct MimeDeleter
{
    void operator()(curl_mime *m) const { curl_mime_free(m); }
};
struct EasyDeleter
{
    void operator()(CURL *h) const { curl_easy_cleanup(h); }
};

}  // namespace

struct CurlTransport::Impl
{
    CURLSH *share = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    static void lock_cb(CURL *, curl_lock_data data, curl_lock_access, void *userptr)
    {
        static_cast<Impl *>(userptr)->locks[data].lock();
    }
    static void unlock_cb(CURL *, curl_lock_data data, void *userptr)
    {
        static_cast<Impl *>(userptr)->locks[data].unlock();
    }

    Impl()
    {
        share = curl_share_init();
        if (!share)
        {
            LOG_WARN("curl_share_init failed; connections will not be pooled across sessions");
            return;
        }
        curl_share_setopt(share, CURLSHOPT_LOCKFUNC, &Impl::lock_cb);
        curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, &Impl::unlock_cb);
        curl_share_setopt(share, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    }

    ~Impl()
    {
        if (share)
            curl_share_cleanup(share);
    }
};

CurlTransport::CurlTransport(TransportConfig cfg) : cfg_(std::move(cfg))
{
    if (!ensure_curl_init())
        LOG_ERROR("curl_global_init failed");
    impl_ = std::make_unique<Impl>();
}

CurlTransport::~CurlTransport() = default;

bool CurlTransport::stream_upload(const UploadRequest &req,
                                  std::string         &location,
                                  TransportError      &err)
{
    err = {};
    if (!req.destination || !req.payload)
    {
        err.code   = TransportErrc::Internal;
        err.detail = "incomplete upload request";
        return false;
    }
    const Destination             &dest    = *req.destination;
    const aead::AttachmentPayload &payload = *req.payload;
    const std::string              url     = upload_url_for(dest);
    const std::string &mime = req.mime_type.empty() ? payload.mime_type : req.mime_type;

    if (!ensure_curl_init())
    {
        err.code   = TransportErrc::Internal;
        err.detail = "libcurl is not initialised";
        return false;
    }
    std::unique_ptr<CURL, EasyDeleter> h(curl_easy_init());
    if (!h)
    {
        err.code   = TransportErrc::Internal;
        err.detail = "curl_easy_init failed";
        return false;
    }

    frag::ChunkCursor cursor(payload.ciphertext.data(), payload.ciphertext.size(), req.chunk_size,
                             [&req](std::uint64_t n) {
                                 if (req.on_bytes_sent)
                                     req.on_bytes_sent(n);
                             });
    Transfer t;
    t.req    = &req;
    t.cursor = &cursor;

    CURL *c = h.get();
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);  // we run on worker threads
    if (impl_->share)
        curl_easy_setopt(c, CURLOPT_SHARE, impl_->share);

    // connection parameters, verbatim
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(cfg_.connect_timeout.count()));
    curl_easy_setopt(c, CURLOPT_MAXAGE_CONN, static_cast<long>(cfg_.pool_idle_timeout.count()));
    curl_easy_setopt(c, CURLOPT_MAXCONNECTS, static_cast<long>(cfg_.pool_max_idle_per_host));
    // a peer that stops reading or never answers: CURLE_OPERATION_TIMEDOUT
    const long low_speed_s = std::max<long>(
        1, static_cast<long>((cfg_.response_timeout.count() + 999) / 1000));
    curl_easy_setopt(c, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(c, CURLOPT_LOW_SPEED_TIME, low_speed_s);
    std::string proxy;
    if (cfg_.proxy && !cfg_.proxy->empty())
    {
        proxy = "socks5h://" + *cfg_.proxy;
        curl_easy_setopt(c, CURLOPT_PROXY, proxy.c_str());
    }

    const long upload_buffer =
        std::clamp(static_cast<long>(req.chunk_size), MIN_UPLOAD_BUFFER, MAX_UPLOAD_BUFFER);
    curl_easy_setopt(c, CURLOPT_UPLOAD_BUFFERSIZE, upload_buffer);

    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, &t);

    curl_slist *raw_headers = curl_slist_append(nullptr, "Expect:");
    std::string auth_line;
    if (!req.authorization.empty())
    {
        auth_line   = "Authorization: " + req.authorization;
        raw_headers = curl_slist_append(raw_headers, auth_line.c_str());
    }

    std::unique_ptr<curl_mime, MimeDeleter> form;
    std::string                             content_type;
    if (dest.protocol == Protocol::Blossom)
    {
        content_type = "Content-Type: " + mime;
        raw_headers  = curl_slist_append(raw_headers, content_type.c_str());
        curl_easy_setopt(c, CURLOPT_UPLOAD, 1L);  // PUT
        curl_easy_setopt(c, CURLOPT_READFUNCTION, read_cb);
        curl_easy_setopt(c, CURLOPT_READDATA, &t);
        curl_easy_setopt(c, CURLOPT_SEEKFUNCTION, seek_cb);
        curl_easy_setopt(c, CURLOPT_SEEKDATA, &t);
        curl_easy_setopt(c, CURLOPT_INFILESIZE_LARGE,
                         static_cast<curl_off_t>(payload.ciphertext.size()));
    }
    else
    {
        form.reset(curl_mime_init(c));
        curl_mimepart *part = form ? curl_mime_addpart(form.get()) : nullptr;
        if (!part)
        {
            curl_slist_free_all(raw_headers);
            err.code   = TransportErrc::Internal;
            err.detail = "curl_mime_init failed";
            return false;
        }
        curl_mime_name(part, "file");
        curl_mime_filename(part, "filename");
        curl_mime_type(part, mime.c_str());
        curl_mime_data_cb(part, static_cast<curl_off_t>(payload.ciphertext.size()), read_cb,
                          seek_cb, nullptr, &t);
        curl_easy_setopt(c, CURLOPT_MIMEPOST, form.get());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());

    LOG_DEBUG("%s %s (%zu bytes, chunk %zu)",
              dest.protocol == Protocol::Blossom ? "PUT" : "POST", url.c_str(),
              payload.ciphertext.size(), req.chunk_size);

    const CURLcode rc = curl_easy_perform(c);
    if (rc != CURLE_OK)
    {
        err.code   = req.aborted() ? TransportErrc::Cancelled : classify_curl(rc);
        err.detail = curl_easy_strerror(rc);
        LOG_DEBUG("curl_easy_perform(%s): %s", url.c_str(), err.detail.c_str());
        return false;
    }

    long status = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300)
    {
        err.code   = TransportErrc::RemoteRejected;
        err.status = status;
        err.body   = t.response.substr(0, constants::MAX_ERROR_BODY);
        return false;
    }
    if (t.truncated)
        LOG_WARN("response from %s truncated at %zu bytes", url.c_str(), t.response.size());

    std::string loc;
    const bool  ok = dest.protocol == Protocol::Blossom
                         ? parse_blossom_response(t.response, loc, err)
                         : parse_nip96_response(status, t.response, loc, err);
    if (!ok)
        return false;

    location = std::move(loc);
    return true;
}

}  // namespace transport
