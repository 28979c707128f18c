#ifndef ZONE_ANNOUNCE_API_SERVER_HPP
#define ZONE_ANNOUNCE_API_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <string>

#include "announcer.hpp"
#include "http/webserver.hpp"

namespace api
{

#define API_PORT 9000

/// JSON front end:
///   GET  /speakers  -> {"speakers": [{"name": ..., "id": ...}]}
///   POST /speak     <- {"text": ..., "target": ...}, target defaults to "all"
http::handler make_handler(announce::announcer& announcer);

/// Blocking api server until run_condition turns false
void serve_api(announce::announcer& announcer, const std::string& bind_address, uint16_t port, std::atomic<bool>& run_condition);

} // namespace api

#endif
