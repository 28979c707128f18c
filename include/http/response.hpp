#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <string>
#include <string_view>

#include "http/request.hpp"

namespace http
{

class response
{
public:

    response() = default;

    explicit response(int code)
        : m_code {code}
    {}

    /// Parses a raw response as read from a connection, throws std::invalid_argument on a malformed status line
    static response parse(std::string_view raw);

    std::string to_string() const;

    void set_header(const std::string& key, const std::string& value);

    void set_header(const std::string& key, std::string&& value);

    std::string get_header(const std::string& key) const;

    bool check_header(const std::string& key) const
    {
        return m_headers.find(key) != m_headers.end();
    }

    void set_code(int code)
    {
        m_code = code;
    }

    void set_body(const std::string& body);

    void set_body(std::string&& body);

    int get_code() const
    {
        return (m_code == 0) ? 200 : m_code;
    }

    const std::string& get_body() const
    {
        return m_body;
    }

    std::string get_phrase() const;

private:

    int m_code = 0;
    std::string m_phrase;
    std::string m_body;

    header_map m_headers;

};

} // namespace http

#endif
