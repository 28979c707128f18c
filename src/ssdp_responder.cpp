#include "ssdp_responder.hpp"

#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include "fmt/format.h"

namespace emulator
{

ssdp_responder::ssdp_responder(std::vector<advertised_device> devices, std::string local_ip, discovery::search_options options)
    : m_devices {std::move(devices)},
      m_local_ip {std::move(local_ip)},
      m_options {std::move(options)},
      m_sock {"0.0.0.0", m_options.port}
{
    join_group();
    logging::info("[SSDP] Listening on {}:{}", m_options.address, m_options.port);
}

void ssdp_responder::join_group() const
{
    in_addr group {};
    if(inet_pton(AF_INET, m_options.address.c_str(), &group) != 1)
        throw std::runtime_error {fmt::format("Invalid discovery address {}", m_options.address)};

    // A unicast address is only used for tests on the loopback device
    if(!IN_MULTICAST(ntohl(group.s_addr)))
        return;

    ip_mreq mreq {};
    mreq.imr_multiaddr = group;
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    if(setsockopt(m_sock.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) != 0)
        throw std::runtime_error {fmt::format("Unable to join {}: {}", m_options.address, std::strerror(errno))};
}

bool ssdp_responder::matches(std::string_view datagram) const
{
    if(!utils::starts_with(datagram, "M-SEARCH "))
        return false;
    return discovery::parse_response(datagram).st == m_options.search_target;
}

std::string ssdp_responder::advertisement(const advertised_device& device) const
{
    std::string usn_name = device.name;
    usn_name.erase(std::remove(usn_name.begin(), usn_name.end(), ' '), usn_name.end());

    return fmt::format(
        "HTTP/1.1 200 OK\r\nCACHE-CONTROL: max-age=1800\r\nLOCATION: http://{}:{}{}\r\nST: {}\r\nUSN: uuid:RINCON_EMULATED_{}\r\n\r\n",
        m_local_ip, device.port, DESCRIPTION_PATH, m_options.search_target, usn_name);
}

void ssdp_responder::serve(std::atomic<bool>& run_condition)
{
    while(run_condition.load())
    {
        // Wake up regularly to notice a shutdown
        pollfd pfd {m_sock.get(), POLLIN, 0};
        int ready = poll(&pfd, 1, 250);
        if(ready < 0)
        {
            if(errno == EINTR)
                continue;
            throw std::runtime_error {fmt::format("[SSDP] poll failed: {}", std::strerror(errno))};
        }
        if(ready == 0)
            continue;
        if(pfd.revents & (POLLERR | POLLNVAL))
            throw std::runtime_error {"[SSDP] Discovery socket failed"};

        try {
            auto [buffer, peer] = m_sock.read<char>(4096);
            if(!matches(std::string_view {buffer.data(), buffer.size()}))
                continue;

            logging::info("[SSDP] M-SEARCH received from {}:{}", peer.addr, peer.port);
            for(const auto& device : m_devices)
            {
                std::string response = advertisement(device);
                m_sock.send(peer.addr, peer.port, response);
            }
        } catch(std::runtime_error& e) {
            logging::warn("[SSDP] Read error: {}", e.what());
        }
    }
}

} // namespace emulator
