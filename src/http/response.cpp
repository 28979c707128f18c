#include <chrono>
#include <ctime>
#include <charconv>
#include <stdexcept>

#include "http/response.hpp"
#include "utils.hpp"

namespace http
{

static std::string get_http_phrase(int status_code)
{
    switch(status_code)
    {
        case 200: return "OK";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 416: return "Range Not Satisfiable";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        default: return "Unknown";
    }
}

static std::string http_date()
{
    std::time_t now(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    std::tm gmt {};
    gmtime_r(&now, &gmt);

    char buffer[64];
    size_t len = std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &gmt);
    return std::string {buffer, len};
}

response response::parse(std::string_view raw)
{
    size_t endl = raw.find("\r\n");
    std::string_view status_line = raw.substr(0, endl);

    // HTTP/1.1 200 OK
    size_t first = status_line.find(' ');
    if(first == std::string_view::npos || !utils::starts_with(status_line, "HTTP/"))
        throw std::invalid_argument {"invalid_statusline"};

    std::string_view rest = status_line.substr(first + 1);
    size_t second = rest.find(' ');
    std::string_view code_view = rest.substr(0, second);

    int code = 0;
    auto res = std::from_chars(code_view.data(), code_view.data() + code_view.size(), code);
    if(res.ec != std::errc {} || res.ptr != code_view.data() + code_view.size())
        throw std::invalid_argument {"invalid_statusline"};

    response parsed;
    parsed.m_code = code;
    if(second != std::string_view::npos)
        parsed.m_phrase = std::string {utils::trim(rest.substr(second + 1))};

    if(endl == std::string_view::npos)
        return parsed;

    std::string_view after = raw.substr(endl + 2);
    size_t header_end = after.find("\r\n\r\n");
    if(utils::starts_with(after, "\r\n"))
    {
        parsed.m_body = std::string {after.substr(2)};
    }
    else
    {
        parsed.m_headers = parse_headers(after.substr(0, header_end));
        if(header_end != std::string_view::npos)
            parsed.m_body = std::string {after.substr(header_end + 4)};
    }

    return parsed;
}

std::string response::to_string() const
{
    std::string response;
    int code = get_code();

    /* Begin with response line */
    response.append("HTTP/1.1 " + std::to_string(code) + " " + (m_phrase.empty() ? get_http_phrase(code) : m_phrase) + "\r\n");
    response.append("Date: " + http_date() + "\r\n");

    /* Append all headers to response and set some fields if missing */
    if(m_headers.find("Content-Type") == m_headers.end())
        response.append("Content-Type: text/html; charset=UTF-8\r\n");
    if(m_headers.find("Content-Length") == m_headers.end())
        response.append("Content-Length: " + std::to_string(m_body.size()) + "\r\n");
    response.append("Connection: close\r\n");

    for(const auto& it : m_headers)
    {
        if(utils::iequals(it.first, "Connection"))
            continue;
        response.append(it.first + ": " + it.second + "\r\n");
    }

    /* Append body to response line */
    response.append("\r\n");
    response.append(m_body);

    return response;
}

void response::set_body(const std::string& body)
{
    m_body = body;
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_body(std::string&& body)
{
    m_body = std::move(body);
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_header(const std::string& key, const std::string& value)
{
    m_headers[key] = value;
}

void response::set_header(const std::string& key, std::string&& value)
{
    m_headers[key] = std::move(value);
}

std::string response::get_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    return (it != m_headers.end()) ? it->second : std::string {};
}

std::string response::get_phrase() const
{
    return m_phrase.empty() ? get_http_phrase(get_code()) : m_phrase;
}

} // namespace http
