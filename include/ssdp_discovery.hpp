#ifndef ZONE_ANNOUNCE_SSDP_DISCOVERY_HPP
#define ZONE_ANNOUNCE_SSDP_DISCOVERY_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>

#include "device_description.hpp"

namespace discovery
{

#define DISCOVERY_IP "239.255.255.250"
#define DISCOVERY_PORT 1900
#define DISCOVERY_TIME 5000
#define DESCRIPTION_FETCH_TIME 3000
#define ZONE_PLAYER_TARGET "urn:schemas-upnp-org:device:ZonePlayer:1"

struct search_options
{
    std::string address {DISCOVERY_IP};
    uint16_t port = DISCOVERY_PORT;
    std::string search_target {ZONE_PLAYER_TARGET};
    int mx = 3;
    std::chrono::milliseconds timeout {DISCOVERY_TIME};          // one fixed window for all responses
    std::chrono::milliseconds fetch_timeout {DESCRIPTION_FETCH_TIME};
};

struct ssdp_res
{
    std::string location;
    std::string cache_control;
    std::string server;
    std::string usn;
    std::string st;
};

std::string build_search_request(const search_options& options);

/// Header names are matched case-insensitively, unknown headers are ignored
ssdp_res parse_response(std::string_view view);

/// Sends one M-SEARCH and collects the distinct LOCATION values answered until the deadline.
/// Throws std::runtime_error for an invalid address or if the search can not be sent at all.
std::set<std::string> search(const search_options& options);

/// Complete discovery pass: search, fetch and parse every distinct descriptor.
/// Unreachable or unparsable devices are skipped.
std::map<std::string, upnp::device_record> discover(const search_options& options);

} // namespace discovery

#endif
