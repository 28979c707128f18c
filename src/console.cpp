#include "console.hpp"

#include "logging.hpp"
#include "utils.hpp"

#include <array>
#include <poll.h>
#include <unistd.h>

#include "fmt/format.h"

namespace console
{

front_end::front_end(announce::announcer& announcer, discovery::search_options options, std::string sender, std::FILE* out)
    : m_announcer {announcer},
      m_options {std::move(options)},
      m_sender {std::move(sender)},
      m_out {out}
{}

void front_end::print_devices() const
{
    auto devices = m_announcer.list_devices();
    fmt::print(m_out, "Discovered speakers:\n");
    if(devices.empty())
    {
        fmt::print(m_out, "  (none found)\n");
        return;
    }
    for(const auto& device : devices)
        fmt::print(m_out, "- {} (id: {})\n", device.name, device.id);
}

void front_end::print_usage() const
{
    fmt::print(m_out, "\nSend:\nkitchen: Dinner is ready\nOR just:\nDinner is ready\n"
        "/speakers lists the speakers, /rescan searches the network again\n");
}

void front_end::rescan()
{
    fmt::print(m_out, "Scanning network for speakers...\n");
    try {
        m_announcer.refresh(m_options);
    } catch(std::exception& e) {
        // The previous device list stays in place
        logging::error("Discovery failed: {}", e.what());
        fmt::print(m_out, "Discovery failed: {}\n", e.what());
        return;
    }
    print_devices();
}

void front_end::handle_line(std::string_view line)
{
    line = utils::trim(line);
    if(line.empty())
        return;

    if(line == "/speakers")
    {
        print_devices();
        print_usage();
        return;
    }
    if(line == "/rescan")
    {
        rescan();
        return;
    }
    // Skip other commands
    if(line.front() == '/')
        return;

    announce::announce_result result = m_announcer.handle_message(std::string {line}, m_sender);
    if(result.status == announce::announce_status::not_allowed)
        return;
    if(result)
        fmt::print(m_out, "Announced: {}\n", line);
    else
        fmt::print(m_out, "Error: {}\n", result.message);
}

void front_end::run(int fd, std::atomic<bool>& run_condition)
{
    std::string pending;
    std::array<char, 1024> buffer;
    while(run_condition.load())
    {
        pollfd pfd {fd, POLLIN, 0};
        int ready = poll(&pfd, 1, 250);
        if(ready <= 0)
            continue;

        ssize_t br = read(fd, buffer.data(), buffer.size());
        if(br <= 0)
            return;
        pending.append(buffer.data(), static_cast<size_t>(br));

        size_t endl;
        while((endl = pending.find('\n')) != std::string::npos)
        {
            handle_line(std::string_view {pending}.substr(0, endl));
            pending.erase(0, endl + 1);
        }
        std::fflush(m_out);
    }
}

} // namespace console
