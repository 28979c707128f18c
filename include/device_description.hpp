#ifndef ZONE_ANNOUNCE_DEVICE_DESCRIPTION_HPP
#define ZONE_ANNOUNCE_DEVICE_DESCRIPTION_HPP

#include <optional>
#include <string>
#include <string_view>

namespace upnp
{

// Immutable once created, updates go through a registry replace
struct device_record
{
    std::string display_name;
    std::string stable_id;
    std::string control_base_url;   // scheme://host:port, never a path

    bool operator==(const device_record& other) const
    {
        return display_name == other.display_name && stable_id == other.stable_id &&
            control_base_url == other.control_base_url;
    }
};

/// Lower case with all spaces removed: "Living Room" -> "livingroom"
std::string make_stable_id(std::string_view display_name);

/// http://192.168.1.10:1400/xml/device.xml -> http://192.168.1.10:1400
std::string base_url(std::string_view location);

/// Returns nothing for malformed documents or devices without a usable name
std::optional<device_record> parse_description(std::string_view document, std::string_view location);

} // namespace upnp

#endif
