#include "http/transfer.hpp"
#include "http/request.hpp"

#include <array>
#include <memory>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <stdexcept>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "fmt/format.h"

namespace http
{

static constexpr size_t max_message_size = 16 * 1024 * 1024;
static constexpr size_t until_close = std::string::npos;

static size_t expected_body_length(std::string_view head, message_kind kind)
{
    if(kind == message_kind::head_response)
        return 0;

    // Skip request or status line
    size_t endl = head.find("\r\n");
    header_map headers = (endl == std::string_view::npos) ? header_map {} : parse_headers(head.substr(endl + 2));

    auto it = headers.find("Content-Length");
    if(it == headers.end())
        return (kind == message_kind::request) ? 0 : until_close;

    size_t length = 0;
    const std::string& value = it->second;
    auto res = std::from_chars(value.data(), value.data() + value.size(), length);
    if(res.ec != std::errc {})
        throw std::runtime_error {"Invalid Content-Length header"};
    return length;
}

std::string read_message(tcp_conn& conn, message_kind kind)
{
    std::string data;
    std::array<char, 4096> buffer;
    size_t header_end = std::string::npos;
    size_t body_length = until_close;

    while(true)
    {
        if(header_end != std::string::npos && body_length != until_close && data.size() >= header_end + 4 + body_length)
        {
            data.resize(header_end + 4 + body_length);
            break;
        }

        size_t br = conn.read(net::span {buffer.data(), buffer.size()});
        if(br == 0)
            break;

        data.append(buffer.data(), br);
        if(data.size() > max_message_size)
            throw std::runtime_error {"Http message exceeds size limit"};

        if(header_end == std::string::npos && (header_end = data.find("\r\n\r\n")) != std::string::npos)
            body_length = expected_body_length(std::string_view {data}.substr(0, header_end + 2), kind);
    }

    if(header_end == std::string::npos)
        throw std::runtime_error {"Connection closed before the http header was complete"};

    return data;
}

// Closes the descriptor on scope exit
struct fd_guard
{
    int fd;

    ~fd_guard()
    {
        if(fd >= 0)
            close(fd);
    }
};

// Non blocking connect that gives up after timeout
static void wait_connectable(const std::string& host, uint16_t port, std::chrono::milliseconds timeout)
{
    addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    if(int err = getaddrinfo(host.c_str(), service.c_str(), &hints, &res); err != 0)
        throw std::runtime_error {fmt::format("Unable to resolve {}: {}", host, gai_strerror(err))};
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addrs {res, &freeaddrinfo};

    fd_guard sock {socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0)};
    if(sock.fd < 0)
        throw std::runtime_error {fmt::format("Unable to create socket: {}", std::strerror(errno))};

    if(::connect(sock.fd, addrs->ai_addr, addrs->ai_addrlen) == 0)
        return;
    if(errno != EINPROGRESS)
        throw std::runtime_error {fmt::format("Connecting to {}:{} failed: {}", host, port, std::strerror(errno))};

    pollfd pfd {sock.fd, POLLOUT, 0};
    int ready;
    do {
        ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while(ready < 0 && errno == EINTR);

    if(ready == 0)
        throw std::runtime_error {fmt::format("Connecting to {}:{} timed out", host, port)};
    if(ready < 0)
        throw std::runtime_error {fmt::format("Connecting to {}:{} failed: {}", host, port, std::strerror(errno))};

    int err = 0;
    socklen_t len = sizeof(err);
    if(getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0)
        throw std::runtime_error {fmt::format("Connecting to {}:{} failed: {}", host, port, std::strerror(err))};
}

tcp_conn connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout)
{
    // socketwrapper connects in its constructor without a deadline, so the
    // peer has to prove it accepts connections first
    wait_connectable(host, port, timeout);
    return tcp_conn {host, port};
}

void set_timeout(int fd, std::chrono::milliseconds timeout)
{
    timeval tv {};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    if(setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
        throw std::runtime_error {"Failed to set socket timeout"};
}

} // namespace http
