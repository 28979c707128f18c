#include "http/request.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace http
{

bool header_less::operator()(const std::string& lhs, const std::string& rhs) const
{
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](unsigned char a, unsigned char b) {
        return std::tolower(a) < std::tolower(b);
    });
}

header_map parse_headers(std::string_view view)
{
    header_map headers;
    while(!view.empty())
    {
        size_t endl = view.find("\r\n");
        std::string_view line = view.substr(0, endl);
        if(line.empty())
            break;

        size_t sep = line.find(':');
        if(sep == std::string_view::npos || sep == 0)
            throw std::invalid_argument {"invalid_header"};

        headers[std::string {utils::trim(line.substr(0, sep))}] = std::string {utils::trim(line.substr(sep + 1))};

        if(endl == std::string_view::npos)
            break;
        view.remove_prefix(endl + 2);
    }
    return headers;
}

request::request(std::string method, std::string resource)
    : m_method {std::move(method)}
{
    size_t pos_q = resource.find('?');
    m_path = resource.substr(0, pos_q);
    if(pos_q != std::string::npos)
        parse_params(std::string_view {resource}.substr(pos_q + 1), m_query_params);
    m_resource = std::move(resource);
}

request::request(std::string_view unparsed_request)
{
    parse(unparsed_request);
}

void request::parse(std::string_view request)
{
    /* extract the request line */
    size_t pos_q = request.find("\r\n");
    if(pos_q == std::string_view::npos)
        throw std::invalid_argument("invalid_request");
    this->parse_requestline(request.substr(0, pos_q));

    /* Parse resource to path and params */
    m_query_params.clear();
    if((pos_q = m_resource.find('?')) == std::string::npos)
    {
        m_path = m_resource;
    }
    else
    {
        m_path = m_resource.substr(0, pos_q);
        request::parse_params(std::string_view {m_resource}.substr(pos_q + 1), m_query_params);
    }

    /* Read and parse request headers, everything after the empty line is the body */
    std::string_view rest = request.substr(request.find("\r\n") + 2);
    size_t header_end = rest.find("\r\n\r\n");
    if(rest.substr(0, 2) == "\r\n")
    {
        m_headers.clear();
        m_body = std::string {rest.substr(2)};
    }
    else
    {
        m_headers = parse_headers(rest.substr(0, header_end));
        m_body = (header_end == std::string_view::npos) ? std::string {} : std::string {rest.substr(header_end + 4)};
    }
}

std::string request::to_string() const
{
    std::string request;
    ((((request += m_method) += " ") += m_resource) += " ") += m_protocol;
    request += "\r\n";

    for(const auto& it : m_headers)
        (((request += it.first) += ": ") += it.second) += "\r\n";

    request += "\r\n";
    request += m_body;
    return request;
}

void request::set_body(std::string body)
{
    m_body = std::move(body);
    m_headers["Content-Length"] = std::to_string(m_body.size());
}

void request::parse_requestline(std::string_view requestline)
{
    size_t first = requestline.find(' ');
    size_t second = (first == std::string_view::npos) ? first : requestline.find(' ', first + 1);
    if(first == std::string_view::npos || second == std::string_view::npos || first == 0 || second == first + 1)
        throw std::invalid_argument {"invalid_requestline"};

    this->m_method = std::string {requestline.substr(0, first)};
    this->m_resource = std::string {requestline.substr(first + 1, second - first - 1)};
    this->m_protocol = std::string {utils::trim(requestline.substr(second + 1))};
}

void request::parse_params(std::string_view param_string, std::map<std::string, std::string>& param_container)
{
    size_t fragment = param_string.find('#');
    param_string = param_string.substr(0, fragment);

    while(!param_string.empty())
    {
        size_t amp = param_string.find('&');
        std::string_view param = param_string.substr(0, amp);
        size_t pos = param.find('=');
        if(pos != std::string_view::npos)
            param_container.insert({std::string {param.substr(0, pos)}, std::string {param.substr(pos + 1)}});

        if(amp == std::string_view::npos)
            break;
        param_string.remove_prefix(amp + 1);
    }
}

bool request::check_header(const std::string& key) const
{
    return m_headers.find(key) != m_headers.end();
}

std::string request::get_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    return (it != m_headers.end()) ? it->second : std::string {};
}

std::string request::get_param(const std::string& key) const
{
    auto it = m_query_params.find(key);
    return (it != m_query_params.end()) ? it->second : std::string {};
}

} // namespace http
