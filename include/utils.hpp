#ifndef ZONE_ANNOUNCE_UTILS_HPP
#define ZONE_ANNOUNCE_UTILS_HPP

#include <string>
#include <string_view>

namespace utils
{

/// First address of an interface that is up and not a loopback device
std::string get_local_ipaddr();

std::string to_lower(std::string_view str);

std::string_view trim(std::string_view str);

bool iequals(std::string_view lhs, std::string_view rhs);

bool starts_with(std::string_view str, std::string_view prefix);

// Only the four entities used in control envelopes: & < > "
std::string xml_escape(std::string_view str);

std::string xml_unescape(std::string_view str);

/// Wraps str in single quotes so it reaches a shell command as one argument
std::string shell_quote(std::string_view str);

/// Runs cmd through the shell, throws std::runtime_error unless it exits with 0
void run_command(const std::string& cmd);

} // utils

#endif
