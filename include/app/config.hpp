#pragma once
#include <string>
#include <vector>

#include "transport/itransport.hpp"
#include "upload/failover.hpp"

namespace app
{

struct Config
{
    std::vector<transport::Destination> destinations;  // Blossom first, then NIP-96
    std::string                         auth;          // Authorization header value
    upload::UploadOptions               options;
};

// Comma-separated URLs; blanks are dropped, surrounding spaces trimmed.
std::vector<transport::Destination> parse_destination_list(const std::string &list,
                                                           transport::Protocol protocol);

// Reads SEALDROP_* over the defaults. Out-of-range values are logged and
// ignored. Also applies SEALDROP_LOG_LEVEL.
Config load_config_from_env();

}  // namespace app
