#include "device_description.hpp"

#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <vector>

#include "rapidxml/rapidxml.hpp"

using namespace rapidxml;

namespace upnp
{

std::string make_stable_id(std::string_view display_name)
{
    std::string id = utils::to_lower(display_name);
    id.erase(std::remove(id.begin(), id.end(), ' '), id.end());
    return id;
}

std::string base_url(std::string_view location)
{
    size_t scheme_end = location.find("://");
    if(scheme_end == std::string_view::npos)
        return std::string {location};

    size_t slash = location.find('/', scheme_end + 3);
    return std::string {location.substr(0, slash)};
}

static std::string_view child_value(xml_node<char>* node, const char* name)
{
    xml_node<char>* child = node->first_node(name);
    if(!child)
        return {};
    return utils::trim(std::string_view {child->value(), child->value_size()});
}

std::optional<device_record> parse_description(std::string_view document, std::string_view location)
{
    // rapidxml parses in place and needs a terminated, writable buffer
    std::vector<char> buffer {document.begin(), document.end()};
    buffer.push_back('\0');

    xml_document<char> doc;
    try {
        doc.parse<0>(buffer.data());
    } catch(rapidxml::parse_error& e) {
        logging::debug("Malformed description from {}: {}", location, e.what());
        return std::nullopt;
    }

    xml_node<char>* root = doc.first_node("root");
    if(!root)
        root = doc.first_node();
    xml_node<char>* device_node = root ? root->first_node("device") : nullptr;
    if(!device_node)
    {
        logging::debug("Description from {} has no device element", location);
        return std::nullopt;
    }

    std::string_view name = child_value(device_node, "roomName");
    if(name.empty())
        name = child_value(device_node, "displayName");
    if(name.empty())
    {
        logging::debug("Device at {} has no name", location);
        return std::nullopt;
    }

    return device_record {
        std::string {name},
        make_stable_id(name),
        base_url(location)
    };
}

} // namespace upnp
