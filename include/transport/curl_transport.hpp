#pragma once
#include <memory>
#include <string>

#include "transport/itransport.hpp"

namespace transport
{

// libcurl-backed HTTP client. One instance may serve many concurrent sessions:
// each stream_upload() uses its own easy handle, idle connections are pooled in
// a locked share handle.
class CurlTransport final : public IUploadTransport
{
  public:
    explicit CurlTransport(TransportConfig cfg);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport &)            = delete;
    CurlTransport &operator=(const CurlTransport &) = delete;

    bool        stream_upload(const UploadRequest &req,
                              std::string         &location,
                              TransportError      &err) override;
    std::string name() const override { return "curl"; }

    const TransportConfig &config() const { return cfg_; }

  private:
    TransportConfig cfg_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace transport
