#include <string>

#include "transport/itransport.hpp"

namespace transport
{

const char *to_string(Protocol p)
{
    switch (p)
    {
        case Protocol::Blossom:
            return "blossom";
        case Protocol::Nip96:
            return "nip96";
    }
    return "?";
}

const char *to_string(TransportErrc c)
{
    switch (c)
    {
        case TransportErrc::Connect:
            return "connect";
        case TransportErrc::Timeout:
            return "timeout";
        case TransportErrc::RemoteRejected:
            return "remote rejected";
        case TransportErrc::BadResponse:
            return "bad response";
        case TransportErrc::Stalled:
            return "stalled";
        case TransportErrc::Cancelled:
            return "cancelled";
        case TransportErrc::CallbackAborted:
            return "callback aborted";
        case TransportErrc::Unauthorized:
            return "unauthorized";
        case TransportErrc::Internal:
            return "internal";
    }
    return "?";
}

std::string TransportError::describe() const
{
    std::string s = to_string(code);
    if (code == TransportErrc::RemoteRejected)
        s += " (HTTP " + std::to_string(status) + ")";
    if (!detail.empty())
        s += ": " + detail;
    else if (!body.empty())
        s += ": " + body.substr(0, 200);
    return s;
}

std::string upload_url_for(const Destination &dest)
{
    if (dest.protocol == Protocol::Nip96)
        return dest.url;  // NIP-96 api_url is the upload endpoint itself

    std::string base = dest.url;
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    return base + "/upload";
}

}  // namespace transport
