#ifndef ZONE_ANNOUNCE_DEVICE_REGISTRY_HPP
#define ZONE_ANNOUNCE_DEVICE_REGISTRY_HPP

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "device_description.hpp"

namespace upnp
{

/// Devices of the latest discovery pass keyed by their stable id.
/// Any number of readers, a replace swaps the whole set at once.
class device_registry
{
public:

    device_registry() = default;
    device_registry(const device_registry&) = delete;
    device_registry& operator=(const device_registry&) = delete;
    ~device_registry() = default;

    /// Throws std::invalid_argument if a key is not the stable id of its record, the old set stays in place then
    void replace(std::map<std::string, device_record> devices);

    /// Snapshot ordered by stable id
    std::vector<device_record> list() const;

    std::optional<device_record> lookup(std::string_view id) const;

    bool contains(std::string_view id) const;

    size_t size() const;

private:

    mutable std::shared_mutex m_mutex;

    std::map<std::string, device_record, std::less<>> m_devices;

};

} // namespace upnp

#endif
