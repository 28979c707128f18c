#include "media_renderer.hpp"

#include "http/client.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <thread>

#include "fmt/format.h"

namespace upnp
{

control_error::control_error(std::string action, int status, std::string body)
    : std::runtime_error {(status == 0) ?
        fmt::format("{}: {}", action, body) :
        fmt::format("{} returned {}: {}", action, status, body)},
      m_action {std::move(action)},
      m_status {status},
      m_body {std::move(body)}
{}

std::string media_renderer::build_envelope(const service_parameter& param)
{
    return fmt::format(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?><s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\"><s:Body><u:{0} xmlns:u=\"{1}\"><InstanceID>0</InstanceID>{2}</u:{0}></s:Body></s:Envelope>",
        param.action,
        AV_TRANSPORT_SERVICE,
        param.body
    );
}

void media_renderer::use_service(const device_record& device, const service_parameter& param) const
{
    http::header_map headers {
        {"Content-Type", "text/xml; charset=\"utf-8\""},
        {"SOAPAction", fmt::format("{}#{}", AV_TRANSPORT_SERVICE, param.action)}
    };

    http::response res;
    try {
        res = http::post(device.control_base_url + AV_TRANSPORT_CONTROL_PATH, headers, build_envelope(param), m_options.timeout);
    } catch(std::exception& e) {
        throw control_error {param.action, 0, e.what()};
    }

    if(res.get_code() != 200)
        throw control_error {param.action, res.get_code(), res.get_body()};
}

void media_renderer::play_announcement(const device_record& device, const std::string& media_url)
{
    // First set the media content on the device
    use_service(device, service_parameter {
        "SetAVTransportURI", fmt::format("<CurrentURI>{}</CurrentURI><CurrentURIMetaData></CurrentURIMetaData>", utils::xml_escape(media_url))
    });
    logging::debug("[control] {} accepted {}", device.display_name, media_url);

    // Give the device time to buffer before starting
    std::this_thread::sleep_for(m_options.settle_delay);

    // Second send the play request
    use_service(device, service_parameter {
        "Play", "<Speed>1</Speed>"
    });
    logging::info("[control] Playing on {}", device.display_name);
}

} // namespace upnp
