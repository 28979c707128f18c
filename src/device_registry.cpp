#include "device_registry.hpp"

#include <mutex>
#include <stdexcept>

#include "fmt/format.h"

namespace upnp
{

void device_registry::replace(std::map<std::string, device_record> devices)
{
    std::map<std::string, device_record, std::less<>> next;
    for(auto& [id, record] : devices)
    {
        if(id != record.stable_id)
            throw std::invalid_argument {fmt::format("Registry key \"{}\" does not match device id \"{}\"", id, record.stable_id)};
        next.emplace(id, std::move(record));
    }

    std::unique_lock<std::shared_mutex> lock {m_mutex};
    m_devices.swap(next);
}

std::vector<device_record> device_registry::list() const
{
    std::shared_lock<std::shared_mutex> lock {m_mutex};
    std::vector<device_record> devices;
    devices.reserve(m_devices.size());
    for(const auto& it : m_devices)
        devices.push_back(it.second);
    return devices;
}

std::optional<device_record> device_registry::lookup(std::string_view id) const
{
    std::shared_lock<std::shared_mutex> lock {m_mutex};
    auto it = m_devices.find(id);
    if(it == m_devices.end())
        return std::nullopt;
    return it->second;
}

bool device_registry::contains(std::string_view id) const
{
    std::shared_lock<std::shared_mutex> lock {m_mutex};
    return m_devices.find(id) != m_devices.end();
}

size_t device_registry::size() const
{
    std::shared_lock<std::shared_mutex> lock {m_mutex};
    return m_devices.size();
}

} // namespace upnp
