#include "announcer.hpp"

#include "logging.hpp"
#include "utils.hpp"

#include <filesystem>

#include "fmt/format.h"

namespace announce
{

announcer::announcer(upnp::device_registry& registry, upnp::renderer_control& control, audio_producer& producer, std::string media_base_url)
    : m_registry {registry},
      m_control {control},
      m_producer {producer},
      m_media_base_url {std::move(media_base_url)}
{}

std::vector<device_summary> announcer::list_devices() const
{
    std::vector<device_summary> summaries;
    for(auto& device : m_registry.list())
        summaries.push_back(device_summary {std::move(device.display_name), std::move(device.stable_id)});
    return summaries;
}

announce_result announcer::announce(const std::string& text, const std::string& target)
{
    if(utils::trim(text).empty())
        return {announce_status::invalid_request, "Empty announcement text."};

    std::string audio_path;
    try {
        audio_path = m_producer.produce_audio(text);
    } catch(std::exception& e) {
        logging::error("Audio generation failed: {}", e.what());
        return {announce_status::audio_failed, e.what()};
    }

    std::string file_name = std::filesystem::path {audio_path}.filename().string();
    return play(fmt::format("{}/{}", m_media_base_url, file_name), target);
}

announce_result announcer::play(const std::string& media_url, const std::string& target)
{
    if(target.empty() || target == ANNOUNCE_ALL)
    {
        std::vector<upnp::device_record> devices = m_registry.list();
        if(devices.empty())
            logging::warn("No devices registered, nothing to play");

        // Every device gets its attempt, only the last failure is reported
        announce_result result;
        for(const auto& device : devices)
        {
            try {
                m_control.play_announcement(device, media_url);
            } catch(std::exception& e) {
                logging::error("Error playing on {}: {}", device.display_name, e.what());
                result = {announce_status::control_failed, e.what()};
            }
        }
        return result;
    }

    auto device = m_registry.lookup(target);
    if(!device)
        return {announce_status::not_found, fmt::format("Device \"{}\" not found", target)};

    try {
        m_control.play_announcement(*device, media_url);
    } catch(std::exception& e) {
        logging::error("Error playing on {}: {}", device->display_name, e.what());
        return {announce_status::control_failed, e.what()};
    }
    return {};
}

announce_result announcer::handle_message(const std::string& text, const std::string& sender)
{
    if(!m_allowed_sender.empty() && sender != m_allowed_sender)
    {
        logging::debug("Ignoring message from {}", sender);
        return {announce_status::not_allowed, fmt::format("Sender \"{}\" is not allowed", sender)};
    }

    std::string_view trimmed = utils::trim(text);
    std::string target {ANNOUNCE_ALL};
    std::string_view message = trimmed;

    // The left side of a colon names the device if it matches a registered id
    size_t idx = trimmed.find(':');
    if(idx != std::string_view::npos && idx > 0)
    {
        std::string candidate = upnp::make_stable_id(trimmed.substr(0, idx));
        if(m_registry.contains(candidate))
        {
            target = std::move(candidate);
            message = utils::trim(trimmed.substr(idx + 1));
        }
    }

    if(message.empty())
        return {announce_status::invalid_request, "Empty announcement text."};

    logging::info("Announcement: \"{}\" -> {}", message, target);
    return announce(std::string {message}, target);
}

size_t announcer::refresh(const discovery::search_options& options)
{
    auto devices = discovery::discover(options);
    size_t count = devices.size();
    m_registry.replace(std::move(devices));
    return count;
}

} // namespace announce
