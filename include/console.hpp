#ifndef ZONE_ANNOUNCE_CONSOLE_HPP
#define ZONE_ANNOUNCE_CONSOLE_HPP

#include <atomic>
#include <cstdio>
#include <string>
#include <string_view>

#include "announcer.hpp"
#include "ssdp_discovery.hpp"

namespace console
{

// Line based front end: "/speakers", "/rescan" or an announcement per line
class front_end
{
public:

    front_end() = delete;
    front_end(const front_end&) = delete;
    front_end& operator=(const front_end&) = delete;

    /// sender identifies whoever types into this console for the announcer's sender check
    front_end(announce::announcer& announcer, discovery::search_options options, std::string sender, std::FILE* out = stdout);

    /// Never throws, failures are printed and logged
    void handle_line(std::string_view line);

    /// Reads lines from fd until EOF or run_condition turns false
    void run(int fd, std::atomic<bool>& run_condition);

    void print_devices() const;

    void print_usage() const;

private:

    void rescan();

    announce::announcer& m_announcer;

    discovery::search_options m_options;

    std::string m_sender;

    std::FILE* m_out;

};

} // namespace console

#endif
