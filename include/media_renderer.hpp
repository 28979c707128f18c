#ifndef ZONE_ANNOUNCE_MEDIA_RENDERER_HPP
#define ZONE_ANNOUNCE_MEDIA_RENDERER_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>

#include "device_description.hpp"

namespace upnp
{

#define AV_TRANSPORT_SERVICE "urn:schemas-upnp-org:service:AVTransport:1"
#define AV_TRANSPORT_CONTROL_PATH "/MediaRenderer/AVTransport/Control"

struct control_options
{
    std::chrono::milliseconds settle_delay {300};   // between SetAVTransportURI and Play
    std::chrono::milliseconds timeout {5000};       // per control request
};

struct service_parameter
{
    std::string action;
    std::string body;   // arguments following InstanceID
};

/// A failed control request. status() is 0 when the device could not be reached at all.
class control_error : public std::runtime_error
{
public:

    control_error(std::string action, int status, std::string body);

    const std::string& action() const
    {
        return m_action;
    }

    int status() const
    {
        return m_status;
    }

    const std::string& body() const
    {
        return m_body;
    }

private:

    std::string m_action;
    int m_status;
    std::string m_body;

};

class renderer_control
{
public:
    virtual ~renderer_control() = default;

    /// Sets media_url as the current source and starts playback, throws control_error
    virtual void play_announcement(const device_record& device, const std::string& media_url) = 0;
};

// AVTransport control through SOAP requests
class media_renderer : public renderer_control
{
public:

    media_renderer() = default;

    explicit media_renderer(control_options options)
        : m_options {options}
    {}

    void play_announcement(const device_record& device, const std::string& media_url) override;

    static std::string build_envelope(const service_parameter& param);

private:

    void use_service(const device_record& device, const service_parameter& param) const;

    control_options m_options;

};

} // namespace upnp

#endif
