#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <vector>

#include "media_renderer.hpp"

#include "test_server.hpp"

using namespace std::chrono_literals;

struct recorded_request
{
    std::string method;
    std::string path;
    std::string content_type;
    std::string soap_action;
    std::string body;
};

// Device double that records every control request and fails the configured action
class recording_device
{
public:

    explicit recording_device(std::string failing_action = {})
        : m_failing_action {std::move(failing_action)},
          m_server {[this](const http::request& req) { return record(req); }}
    {}

    upnp::device_record record_for(const std::string& name) const
    {
        return upnp::device_record {name, upnp::make_stable_id(name), m_server.base_url()};
    }

    std::vector<recorded_request> requests() const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        return m_requests;
    }

private:

    http::response record(const http::request& req)
    {
        recorded_request rec {req.get_method(), req.get_path(), req.get_header("Content-Type"),
            req.get_header("SOAPAction"), req.get_body()};
        {
            std::lock_guard<std::mutex> lock {m_mutex};
            m_requests.push_back(rec);
        }

        http::response res;
        if(!m_failing_action.empty() && rec.soap_action.find("#" + m_failing_action) != std::string::npos)
        {
            res.set_code(500);
            res.set_body("<s:Fault>UPnPError 714</s:Fault>");
        }
        else
        {
            res.set_body("<s:Envelope/>");
        }
        return res;
    }

    std::string m_failing_action;

    mutable std::mutex m_mutex;

    std::vector<recorded_request> m_requests;

    test_server m_server;

};

static upnp::control_options fast_options()
{
    upnp::control_options options;
    options.settle_delay = 10ms;
    options.timeout = 2s;
    return options;
}

TEST(MediaRenderer, EnvelopeCarriesActionAndInstance)
{
    std::string envelope = upnp::media_renderer::build_envelope(upnp::service_parameter {"Play", "<Speed>1</Speed>"});

    EXPECT_NE(envelope.find("<u:Play xmlns:u=\"urn:schemas-upnp-org:service:AVTransport:1\">"), std::string::npos);
    EXPECT_NE(envelope.find("<InstanceID>0</InstanceID><Speed>1</Speed></u:Play>"), std::string::npos);
    EXPECT_NE(envelope.find("<s:Body>"), std::string::npos);
}

TEST(MediaRenderer, SetsSourceThenPlays)
{
    recording_device device;
    upnp::media_renderer renderer {fast_options()};

    renderer.play_announcement(device.record_for("Kitchen"), "http://10.0.0.2:8080/1.wav");

    auto requests = device.requests();
    ASSERT_EQ(requests.size(), 2u);

    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].path, "/MediaRenderer/AVTransport/Control");
    EXPECT_EQ(requests[0].content_type, "text/xml; charset=\"utf-8\"");
    EXPECT_EQ(requests[0].soap_action, "urn:schemas-upnp-org:service:AVTransport:1#SetAVTransportURI");
    EXPECT_NE(requests[0].body.find("<InstanceID>0</InstanceID>"), std::string::npos);
    EXPECT_NE(requests[0].body.find("<CurrentURI>http://10.0.0.2:8080/1.wav</CurrentURI>"), std::string::npos);
    EXPECT_NE(requests[0].body.find("<CurrentURIMetaData></CurrentURIMetaData>"), std::string::npos);

    EXPECT_EQ(requests[1].path, "/MediaRenderer/AVTransport/Control");
    EXPECT_EQ(requests[1].soap_action, "urn:schemas-upnp-org:service:AVTransport:1#Play");
    EXPECT_NE(requests[1].body.find("<InstanceID>0</InstanceID>"), std::string::npos);
    EXPECT_NE(requests[1].body.find("<Speed>1</Speed>"), std::string::npos);
}

TEST(MediaRenderer, EscapesMediaUrl)
{
    recording_device device;
    upnp::media_renderer renderer {fast_options()};

    renderer.play_announcement(device.record_for("Kitchen"), "http://h/a.wav?x=1&y=\"<2>\"");

    auto requests = device.requests();
    ASSERT_FALSE(requests.empty());
    EXPECT_NE(requests[0].body.find("<CurrentURI>http://h/a.wav?x=1&amp;y=&quot;&lt;2&gt;&quot;</CurrentURI>"), std::string::npos);
}

TEST(MediaRenderer, FailedSetSourceSkipsPlay)
{
    recording_device device {"SetAVTransportURI"};
    upnp::media_renderer renderer {fast_options()};

    try {
        renderer.play_announcement(device.record_for("Kitchen"), "http://10.0.0.2:8080/1.wav");
        FAIL() << "control_error expected";
    } catch(const upnp::control_error& e) {
        EXPECT_EQ(e.action(), "SetAVTransportURI");
        EXPECT_EQ(e.status(), 500);
        EXPECT_EQ(e.body(), "<s:Fault>UPnPError 714</s:Fault>");
        EXPECT_NE(std::string {e.what()}.find("500"), std::string::npos);
    }

    ASSERT_EQ(device.requests().size(), 1u);
}

TEST(MediaRenderer, FailedPlayIsReported)
{
    recording_device device {"Play"};
    upnp::media_renderer renderer {fast_options()};

    try {
        renderer.play_announcement(device.record_for("Kitchen"), "http://10.0.0.2:8080/1.wav");
        FAIL() << "control_error expected";
    } catch(const upnp::control_error& e) {
        EXPECT_EQ(e.action(), "Play");
        EXPECT_EQ(e.status(), 500);
    }

    EXPECT_EQ(device.requests().size(), 2u);
}

TEST(MediaRenderer, UnreachableDeviceIsAControlError)
{
    upnp::media_renderer renderer {fast_options()};
    upnp::device_record device {"Ghost", "ghost", "http://127.0.0.1:1"};

    try {
        renderer.play_announcement(device, "http://10.0.0.2:8080/1.wav");
        FAIL() << "control_error expected";
    } catch(const upnp::control_error& e) {
        EXPECT_EQ(e.action(), "SetAVTransportURI");
        EXPECT_EQ(e.status(), 0);
    }
}
