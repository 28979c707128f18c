#include "http/client.hpp"
#include "http/transfer.hpp"
#include "utils.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

#include "fmt/format.h"

namespace http
{

std::string url::authority() const
{
    return fmt::format("{}:{}", host, port);
}

url parse_url(std::string_view view)
{
    url parsed;

    std::string::size_type tmp = view.find("://");
    if(tmp == std::string_view::npos)
        throw std::invalid_argument {"Url without scheme"};
    parsed.scheme = utils::to_lower(view.substr(0, tmp));
    if(parsed.scheme != "http")
        throw std::invalid_argument {fmt::format("Unsupported url scheme \"{}\"", parsed.scheme)};
    view.remove_prefix(tmp + 3);

    size_t slash = view.find('/');
    std::string_view host_port = view.substr(0, slash);
    if(slash != std::string_view::npos)
        parsed.path = std::string {view.substr(slash)};

    size_t colon = host_port.find(':');
    parsed.host = std::string {host_port.substr(0, colon)};
    if(parsed.host.empty())
        throw std::invalid_argument {"Url without host"};

    if(colon != std::string_view::npos)
    {
        std::string_view port_view = host_port.substr(colon + 1);
        auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), parsed.port);
        if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size())
            throw std::invalid_argument {"Invalid port in url"};
    }

    return parsed;
}

static std::string decode_chunked(std::string_view body)
{
    std::string decoded;
    while(!body.empty())
    {
        size_t endl = body.find("\r\n");
        if(endl == std::string_view::npos)
            throw std::runtime_error {"Malformed chunked body"};

        size_t size = 0;
        auto res = std::from_chars(body.data(), body.data() + endl, size, 16);
        if(res.ec != std::errc {})
            throw std::runtime_error {"Malformed chunk size"};
        if(size == 0)
            break;

        body.remove_prefix(endl + 2);
        if(body.size() < size)
            throw std::runtime_error {"Truncated chunked body"};
        decoded.append(body.substr(0, size));
        body.remove_prefix(std::min(body.size(), size + 2));
    }
    return decoded;
}

response perform(const url& target, request req, std::chrono::milliseconds timeout)
{
    req.set_header("Host", target.authority());
    req.set_header("Connection", "close");

    tcp_conn conn = connect(target.host, target.port, timeout);
    set_timeout(conn.get(), timeout);

    std::string req_str = req.to_string();
    conn.send(net::span {req_str.begin(), req_str.end()});

    message_kind kind = (req.get_method() == "HEAD") ? message_kind::head_response : message_kind::response;
    std::string raw = read_message(conn, kind);

    response res;
    try {
        res = response::parse(raw);
    } catch(std::invalid_argument& e) {
        throw std::runtime_error {fmt::format("Invalid response from {}: {}", target.authority(), e.what())};
    }

    if(utils::iequals(res.get_header("Transfer-Encoding"), "chunked"))
        res.set_body(decode_chunked(res.get_body()));

    return res;
}

response get(const std::string& location, std::chrono::milliseconds timeout)
{
    url target = parse_url(location);
    return perform(target, request {"GET", target.path}, timeout);
}

response head(const std::string& location, std::chrono::milliseconds timeout)
{
    url target = parse_url(location);
    return perform(target, request {"HEAD", target.path}, timeout);
}

response post(const std::string& location, const header_map& headers, std::string body, std::chrono::milliseconds timeout)
{
    url target = parse_url(location);
    request req {"POST", target.path};
    for(const auto& [key, value] : headers)
        req.set_header(key, value);
    req.set_body(std::move(body));
    return perform(target, std::move(req), timeout);
}

} // namespace http
