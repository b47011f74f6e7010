#include <nlohmann/json.hpp>
#include <utility>

#include "transport/upload_response.hpp"
#include "util/log.hpp"

namespace transport
{

using json = nlohmann::json;

namespace
{

bool looks_like_url(const std::string &s)
{
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

bool bad_response(TransportError &err, std::string detail)
{
    err        = {};
    err.code   = TransportErrc::BadResponse;
    err.detail = std::move(detail);
    return false;
}

// "" when missing or not a string; json::value() would throw on a type mismatch
std::string string_field(const json &j, const char *key)
{
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string{};
}

}  // namespace

bool parse_blossom_response(const std::string &body, std::string &url, TransportError &err)
{
    const json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        return bad_response(err, "blob descriptor is not a JSON object");

    auto it = j.find("url");
    if (it == j.end() || !it->is_string())
        return bad_response(err, "blob descriptor has no url");

    std::string u = it->get<std::string>();
    if (!looks_like_url(u))
        return bad_response(err, "blob descriptor url is not http(s): " + u);

    url = std::move(u);
    return true;
}

bool parse_nip96_response(long               http_status,
                          const std::string &body,
                          std::string       &url,
                          TransportError    &err)
{
    const json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        return bad_response(err, "NIP-96 response is not a JSON object");

    const std::string status  = string_field(j, "status");
    const std::string message = string_field(j, "message");
    if (status == "error")
    {
        err        = {};
        err.code   = TransportErrc::RemoteRejected;
        err.status = http_status;
        err.body   = message;
        err.detail = message.empty() ? "server reported status=error" : message;
        return false;
    }

    auto ev = j.find("nip94_event");
    if (ev == j.end() || !ev->is_object())
        return bad_response(err, "NIP-96 response has no nip94_event");

    auto tags = ev->find("tags");
    if (tags == ev->end() || !tags->is_array())
        return bad_response(err, "nip94_event has no tags");

    for (const auto &tag : *tags)
    {
        if (!tag.is_array() || tag.size() < 2 || !tag[0].is_string() || !tag[1].is_string())
            continue;
        if (tag[0].get<std::string>() != "url")
            continue;
        std::string u = tag[1].get<std::string>();
        if (!looks_like_url(u))
            return bad_response(err, "nip94_event url tag is not http(s): " + u);
        url = std::move(u);
        return true;
    }

    LOG_DEBUG("parse_nip96_response: status='%s' message='%s' but no url tag", status.c_str(),
              message.c_str());
    return bad_response(err, "nip94_event has no url tag");
}

}  // namespace transport
