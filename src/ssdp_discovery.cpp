#include "ssdp_discovery.hpp"

#include "http/client.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <socketwrapper.hpp>

#include <chrono>
#include <stdexcept>
#include <cerrno>
#include <poll.h>
#include <arpa/inet.h>
#include <netinet/in.h>

#include "fmt/format.h"

namespace discovery
{

std::string build_search_request(const search_options& options)
{
    return fmt::format("M-SEARCH * HTTP/1.1\r\nHOST: {}:{}\r\nMAN: \"ssdp:discover\"\r\nMX: {}\r\nST: {}\r\n\r\n",
        options.address, options.port, options.mx, options.search_target);
}

ssdp_res parse_response(std::string_view view)
{
    ssdp_res res;

    // Skip the status line
    size_t endl = view.find("\r\n");
    if(endl == std::string_view::npos)
        return res;
    view.remove_prefix(endl + 2);

    while(!view.empty())
    {
        endl = view.find("\r\n");
        std::string_view line = view.substr(0, endl);
        if(line.empty())
            break;

        size_t sep = line.find(':');
        if(sep != std::string_view::npos)
        {
            std::string_view key = utils::trim(line.substr(0, sep));
            std::string_view val = utils::trim(line.substr(sep + 1));
            if(utils::iequals(key, "LOCATION"))
                res.location = val;
            else if(utils::iequals(key, "CACHE-CONTROL"))
                res.cache_control = val;
            else if(utils::iequals(key, "SERVER"))
                res.server = val;
            else if(utils::iequals(key, "USN"))
                res.usn = val;
            else if(utils::iequals(key, "ST"))
                res.st = val;
        }

        if(endl == std::string_view::npos)
            break;
        view.remove_prefix(endl + 2);
    }

    return res;
}

std::set<std::string> search(const search_options& options)
{
    using namespace std::chrono;

    in_addr target {};
    if(inet_pton(AF_INET, options.address.c_str(), &target) != 1 || options.port == 0)
        throw std::runtime_error {fmt::format("Invalid discovery address {}:{}", options.address, options.port)};

    std::set<std::string> locations;
    std::string msg = build_search_request(options);

    // Ephemeral port so that a responder on this host can keep port 1900
    net::udp_socket<net::ip_version::v4> d_sock {"0.0.0.0", 0};
    d_sock.send(options.address, options.port, msg);
    logging::debug("[SSDP] M-SEARCH for {} sent to {}:{}", options.search_target, options.address, options.port);

    const auto deadline = steady_clock::now() + options.timeout;
    while(true)
    {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if(remaining.count() <= 0)
            break;

        pollfd pfd {d_sock.get(), POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if(ready < 0)
        {
            if(errno == EINTR)
                continue;
            throw std::runtime_error {"poll on discovery socket failed"};
        }
        if(ready == 0)
            break;

        try {
            auto [buffer, peer] = d_sock.read<char>(4096);
            ssdp_res res = parse_response(std::string_view {buffer.data(), buffer.size()});
            if(res.location.empty())
                continue;

            if(locations.insert(res.location).second)
                logging::debug("[SSDP] {}:{} advertised {}", peer.addr, peer.port, res.location);
        } catch(std::runtime_error& e) {
            logging::warn("[SSDP] Read error: {}", e.what());
        }
    }

    return locations;
}

std::map<std::string, upnp::device_record> discover(const search_options& options)
{
    std::map<std::string, upnp::device_record> devices;

    for(const auto& location : search(options))
    {
        try {
            http::response res = http::get(location, options.fetch_timeout);
            if(res.get_code() != 200)
            {
                logging::warn("[SSDP] Fetching {} returned {}", location, res.get_code());
                continue;
            }

            auto record = upnp::parse_description(res.get_body(), location);
            if(!record)
                continue;

            std::string id = record->stable_id;
            devices.insert_or_assign(std::move(id), std::move(*record));
        } catch(std::exception& e) {
            logging::warn("[SSDP] Skipping {}: {}", location, e.what());
        }
    }

    return devices;
}

} // namespace discovery
