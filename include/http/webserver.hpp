#ifndef HTTP_WEBSERVER_HPP
#define HTTP_WEBSERVER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "socketwrapper.hpp"

#include "http/request.hpp"
#include "http/response.hpp"

namespace http
{

using handler = std::function<response(const request&)>;

// Plain http only, every connection carries exactly one request
class webserver
{
public:
    webserver() = delete;
    webserver(const webserver&) = delete;
    webserver& operator=(const webserver&) = delete;
    webserver(webserver&&) = default;
    webserver& operator=(webserver&&) = default;
    ~webserver() = default;

    /// Binds immediately, throws std::runtime_error if the address is not available
    webserver(std::string address, uint16_t port, handler on_request);

    /// Accepts and answers connections one after another until run_condition turns false
    void serve(std::atomic<bool>& run_condition);

    /// Unblocks a pending accept so that serve() can observe a changed run_condition
    void wake() const;

    /// The bound port, useful when constructed with port 0
    uint16_t port() const;

    void set_timeout(std::chrono::milliseconds timeout)
    {
        m_timeout = timeout;
    }

private:

    net::tcp_acceptor<net::ip_version::v4> m_acceptor;

    std::string m_address;

    handler m_handler;

    std::chrono::milliseconds m_timeout {5000};

};

/// Serves the files below root with GET and HEAD including byte ranges
handler directory_handler(std::string root);

/// Blocking file server until run_condition turns false
void serve_directory(const std::string& root, const std::string& bind_address, uint16_t port, std::atomic<bool>& run_condition);

} // namespace http

#endif
