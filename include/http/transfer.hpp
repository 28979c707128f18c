#ifndef HTTP_TRANSFER_HPP
#define HTTP_TRANSFER_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "socketwrapper.hpp"

namespace http
{

using tcp_conn = net::tcp_connection<net::ip_version::v4>;

enum class message_kind
{
    request,        // body only with Content-Length
    response,       // body with Content-Length or up to connection close
    head_response   // never a body
};

/// Reads one complete http message; throws std::runtime_error on socket errors, timeouts or oversized messages
std::string read_message(tcp_conn& conn, message_kind kind);

/// Connects to host:port, throws std::runtime_error if the peer does not accept within timeout
tcp_conn connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

/// Applies send and receive timeouts to a connected socket
void set_timeout(int fd, std::chrono::milliseconds timeout);

} // namespace http

#endif
