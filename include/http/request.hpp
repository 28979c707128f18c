#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include <map>

namespace http {

/// Header names compare case-insensitively as required by RFC 7230
struct header_less
{
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using header_map = std::map<std::string, std::string, header_less>;

/// Parses "Name: value" lines up to the first empty line; values are trimmed
header_map parse_headers(std::string_view header_block);

class request {

public:

    request() = default;
    request(const request& other) = default;
    request(request&& other) noexcept = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) noexcept = default;

    request(std::string method, std::string resource);

    explicit request(std::string_view request_string);

    /// Throws std::invalid_argument if the request line or a header line is malformed
    void parse(std::string_view request);

    std::string to_string() const;

    bool check_header(const std::string& key) const;

    std::string get_header(const std::string& key) const;

    void set_header(const std::string& key, std::string value) { m_headers[key] = std::move(value); }

    const std::string& get_method() const { return m_method; }

    const std::string& get_protocol() const { return m_protocol; }

    const std::string& get_path() const { return m_path; }

    std::string get_param(const std::string& key) const;

    const std::string& get_body() const { return m_body; }

    void set_body(std::string body);

private:

    void parse_requestline(std::string_view requestline);

    static void parse_params(std::string_view param_string, std::map<std::string, std::string>& param_container);

    std::string m_method;     /// http method used by this request (e.g. post, get, ...)
    std::string m_protocol {"HTTP/1.1"};   /// protocol of this request - should be HTTP/*.*
    std::string m_resource;   /// resource addressed by this request
    std::string m_path;       /// path of the resource addressed by this request
    std::string m_body;

    std::map<std::string, std::string> m_query_params; /// contains names and values of the query string
    header_map m_headers; /// contains names and values of the http request headers

};

} // namespace http

#endif
