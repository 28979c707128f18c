#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "http/request.hpp"
#include "http/response.hpp"

namespace http
{

struct url
{
    std::string scheme;
    std::string host;
    uint16_t port = 80;
    std::string path = "/";

    /// host:port as used in the Host header
    std::string authority() const;
};

/// Splits http://host[:port][/path]; throws std::invalid_argument for other schemes or malformed urls
url parse_url(std::string_view location);

/// Sends req to the server named by target and returns its response.
/// Network errors and timeouts throw std::runtime_error, a non-2xx status does not throw.
response perform(const url& target, request req, std::chrono::milliseconds timeout);

response get(const std::string& location, std::chrono::milliseconds timeout);

response head(const std::string& location, std::chrono::milliseconds timeout);

response post(const std::string& location, const header_map& headers, std::string body, std::chrono::milliseconds timeout);

} // namespace http

#endif
