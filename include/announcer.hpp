#ifndef ZONE_ANNOUNCE_ANNOUNCER_HPP
#define ZONE_ANNOUNCE_ANNOUNCER_HPP

#include <string>
#include <utility>
#include <vector>

#include "device_registry.hpp"
#include "media_renderer.hpp"
#include "ssdp_discovery.hpp"

namespace announce
{

#define ANNOUNCE_ALL "all"

class audio_producer
{
public:
    virtual ~audio_producer() = default;

    /// Renders text to an audio file and returns its path, throws std::runtime_error on failure
    virtual std::string produce_audio(const std::string& text) = 0;
};

enum class announce_status
{
    ok,
    not_found,          // named device is not registered
    invalid_request,
    not_allowed,        // message from a sender other than the allowed one
    audio_failed,
    control_failed      // at least one device did not accept the announcement
};

struct announce_result
{
    announce_status status = announce_status::ok;
    std::string message;

    explicit operator bool() const
    {
        return status == announce_status::ok;
    }
};

struct device_summary
{
    std::string name;
    std::string id;
};

class announcer
{
public:

    announcer() = delete;
    announcer(const announcer&) = delete;
    announcer& operator=(const announcer&) = delete;

    /// media_base_url is the http root under which produced audio files are served
    announcer(upnp::device_registry& registry, upnp::renderer_control& control, audio_producer& producer, std::string media_base_url);

    std::vector<device_summary> list_devices() const;

    /// Renders text and plays it on target, an empty target or "all" addresses every device
    announce_result announce(const std::string& text, const std::string& target);

    /// Plays an already served media url on target
    announce_result play(const std::string& media_url, const std::string& target);

    /// Chat style dispatch: "kitchen: Dinner is ready" or just "Dinner is ready" for all devices
    announce_result handle_message(const std::string& text, const std::string& sender = {});

    /// Only messages of this sender are dispatched, an empty name allows everyone
    void set_allowed_sender(std::string sender)
    {
        m_allowed_sender = std::move(sender);
    }

    /// Runs a discovery pass and replaces the registry content, returns the number of devices found
    size_t refresh(const discovery::search_options& options);

private:

    upnp::device_registry& m_registry;

    upnp::renderer_control& m_control;

    audio_producer& m_producer;

    std::string m_media_base_url;

    std::string m_allowed_sender;

};

} // namespace announce

#endif
