#pragma once
#include <string>

#include "transport/itransport.hpp"

namespace transport
{

// Blossom blob descriptor: {"url": "...", "sha256": "...", "size": N, ...}
bool parse_blossom_response(const std::string &body, std::string &url, TransportError &err);

// NIP-96 upload response: {"status": "success"|"error", "message": "...",
//   "nip94_event": {"tags": [["url", "..."], ...]}}
// "status":"error" is a RemoteRejected carrying the HTTP status and the message.
bool parse_nip96_response(long               http_status,
                          const std::string &body,
                          std::string       &url,
                          TransportError    &err);

}  // namespace transport
