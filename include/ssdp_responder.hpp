#ifndef ZONE_ANNOUNCE_SSDP_RESPONDER_HPP
#define ZONE_ANNOUNCE_SSDP_RESPONDER_HPP

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "socketwrapper.hpp"
#include "ssdp_discovery.hpp"

namespace emulator
{

#define DESCRIPTION_PATH "/xml/device_description.xml"

struct advertised_device
{
    std::string name;
    uint16_t port;      // http port serving the description and control endpoints
};

// Answers M-SEARCH requests for the zone player type on behalf of emulated devices
class ssdp_responder
{
public:

    ssdp_responder() = delete;
    ssdp_responder(const ssdp_responder&) = delete;
    ssdp_responder& operator=(const ssdp_responder&) = delete;

    /// Binds the discovery port and joins the group if options.address is a multicast address.
    /// Throws std::runtime_error if either fails.
    ssdp_responder(std::vector<advertised_device> devices, std::string local_ip, discovery::search_options options);

    /// True for M-SEARCH requests whose ST is the zone player type
    bool matches(std::string_view datagram) const;

    std::string advertisement(const advertised_device& device) const;

    /// Receive loop until run_condition turns false, read errors are logged and skipped.
    /// Throws std::runtime_error if the socket becomes unusable.
    void serve(std::atomic<bool>& run_condition);

private:

    void join_group() const;

    std::vector<advertised_device> m_devices;

    std::string m_local_ip;

    discovery::search_options m_options;

    net::udp_socket<net::ip_version::v4> m_sock;

};

} // namespace emulator

#endif
