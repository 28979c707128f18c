#include <utils.hpp>

#include <array>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>
#include <sys/wait.h>

#include "fmt/format.h"

namespace utils
{

const char* error_msg = "Unable to get local ip address";

std::string get_local_ipaddr()
{
    ifaddrs* addrs;
    if(getifaddrs(&addrs))
        throw std::runtime_error {error_msg};

    std::string result;
    for(ifaddrs* curr_addr = addrs; curr_addr != nullptr && result.empty(); curr_addr = curr_addr->ifa_next)
    {
        // Media urls are formatted as http://ip:port so only v4 addresses are of use here
        if(curr_addr->ifa_addr == nullptr || curr_addr->ifa_addr->sa_family != AF_INET)
            continue;

        if(!(curr_addr->ifa_flags & IFF_UP) || (curr_addr->ifa_flags & IFF_LOOPBACK))
            continue;

        std::array<char, NI_MAXHOST> host;
        int s = getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in), host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
        if(s == 0)
            result = host.data();
    }

    freeifaddrs(addrs);
    if(result.empty())
        throw std::runtime_error {error_msg};
    return result;
}

std::string to_lower(std::string_view str)
{
    std::string lower {str};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::string_view trim(std::string_view str)
{
    const char* whitespace = " \t\r\n\v\f";
    size_t start = str.find_first_not_of(whitespace);
    if(start == std::string_view::npos)
        return {};
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

bool starts_with(std::string_view str, std::string_view prefix)
{
    return str.substr(0, prefix.size()) == prefix;
}

std::string xml_escape(std::string_view str)
{
    std::string escaped;
    escaped.reserve(str.size());
    for(char c : str)
    {
        switch(c)
        {
            case '&': escaped.append("&amp;"); break;
            case '<': escaped.append("&lt;"); break;
            case '>': escaped.append("&gt;"); break;
            case '"': escaped.append("&quot;"); break;
            default: escaped.push_back(c);
        }
    }
    return escaped;
}

std::string xml_unescape(std::string_view str)
{
    static constexpr std::array<std::pair<std::string_view, char>, 4> entities {{
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}
    }};

    std::string plain;
    plain.reserve(str.size());
    for(size_t i = 0; i < str.size(); )
    {
        if(str[i] == '&')
        {
            auto it = std::find_if(entities.begin(), entities.end(), [view = str.substr(i)](const auto& entity) {
                return starts_with(view, entity.first);
            });
            if(it != entities.end())
            {
                plain.push_back(it->second);
                i += it->first.size();
                continue;
            }
        }
        plain.push_back(str[i++]);
    }
    return plain;
}

std::string shell_quote(std::string_view str)
{
    std::string quoted {"'"};
    for(char c : str)
    {
        if(c == '\'')
            quoted.append("'\\''");
        else
            quoted.push_back(c);
    }
    quoted.push_back('\'');
    return quoted;
}

void run_command(const std::string& cmd)
{
    int status = std::system(cmd.c_str());
    if(status == -1 || !WIFEXITED(status))
        throw std::runtime_error {fmt::format("Command did not finish: {}", cmd)};
    if(WEXITSTATUS(status) != 0)
        throw std::runtime_error {fmt::format("Command exited with {}: {}", WEXITSTATUS(status), cmd)};
}

} // utils
