#include "virtual_renderer.hpp"

#include "http/client.hpp"
#include "logging.hpp"
#include "ssdp_discovery.hpp"
#include "ssdp_responder.hpp"
#include "media_renderer.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

#include "fmt/format.h"

using namespace std::chrono_literals;

namespace emulator
{

verify_mode parse_verify_mode(std::string_view name)
{
    if(name == "none")
        return verify_mode::none;
    if(name == "head")
        return verify_mode::head;
    if(name == "fetch")
        return verify_mode::fetch;
    if(name == "play")
        return verify_mode::play;
    throw std::invalid_argument {fmt::format("Unknown verify mode \"{}\"", name)};
}

std::string action_name(std::string_view soap_action)
{
    // Format: "urn:schemas-upnp-org:service:AVTransport:1#SetAVTransportURI"
    size_t idx = soap_action.rfind('#');
    if(idx != std::string_view::npos)
        soap_action.remove_prefix(idx + 1);

    soap_action = utils::trim(soap_action);
    while(!soap_action.empty() && soap_action.front() == '"')
        soap_action.remove_prefix(1);
    while(!soap_action.empty() && soap_action.back() == '"')
        soap_action.remove_suffix(1);
    return std::string {soap_action};
}

std::string extract_tag_value(std::string_view body, std::string_view tag)
{
    std::string open = fmt::format("<{}>", tag);
    std::string close = fmt::format("</{}>", tag);

    size_t start = body.find(open);
    if(start == std::string_view::npos)
        return {};
    start += open.size();

    size_t end = body.find(close, start);
    if(end == std::string_view::npos)
        return {};

    return utils::xml_unescape(body.substr(start, end - start));
}

// Extension of the last path segment including the dot, ".m4a" if there is none
static std::string media_extension(const std::string& uri)
{
    std::string path = http::parse_url(uri).path;
    path = path.substr(0, path.find_first_of("?#"));
    std::string ext = std::filesystem::path {path}.extension().string();
    bool plain = std::all_of(ext.begin(), ext.end(), [](char c) {
        return c == '.' || std::isalnum(static_cast<unsigned char>(c));
    });
    return (ext.size() > 1 && plain) ? ext : ".m4a";
}

static void play_media(const std::string& name, const std::string& uri, const std::string& player)
{
    http::response res = http::get(uri, 10s);
    if(res.get_code() != 200)
        throw std::runtime_error {fmt::format("download returned {}", res.get_code())};

    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::filesystem::path file = std::filesystem::temp_directory_path()
        / fmt::format("zone_emulator_{}_{}{}", ::getpid(), stamp, media_extension(uri));
    {
        std::ofstream ofs {file, std::ios::binary};
        ofs.write(res.get_body().data(), static_cast<std::streamsize>(res.get_body().size()));
        if(!ofs)
            throw std::runtime_error {fmt::format("unable to write {}", file.string())};
    }

    logging::info("[{}] Playing {} ({} bytes)", name, uri, res.get_body().size());
    try {
        utils::run_command(fmt::format(fmt::runtime(player), fmt::arg("file", utils::shell_quote(file.string()))));
    } catch(std::exception&) {
        std::error_code ec;
        std::filesystem::remove(file, ec);
        throw;
    }

    std::error_code ec;
    std::filesystem::remove(file, ec);
    logging::info("[{}] Playback finished", name);
}

virtual_renderer::virtual_renderer(std::string name, uint16_t port, verify_mode verify, const std::string& address,
    std::string player_command)
    : m_name {std::move(name)},
      m_verify {verify},
      m_player {std::move(player_command)},
      m_server {address, port, [this](const http::request& req) { return handle(req); }}
{
    if(m_verify == verify_mode::play && m_player.find("{file}") == std::string::npos)
        throw std::invalid_argument {"Player command needs a {file} placeholder"};
}

virtual_renderer::~virtual_renderer()
{
    std::lock_guard<std::mutex> lock {m_checks_mutex};
    for(auto& check : m_checks)
        check.wait();
}

std::string virtual_renderer::description() const
{
    std::string name = utils::xml_escape(m_name);
    return fmt::format(
        "<?xml version=\"1.0\"?>\n"
        "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
        "  <device>\n"
        "    <deviceType>{}</deviceType>\n"
        "    <roomName>{}</roomName>\n"
        "    <displayName>{}</displayName>\n"
        "    <modelName>ZonePlayer (Emulated)</modelName>\n"
        "  </device>\n"
        "</root>", ZONE_PLAYER_TARGET, name, name);
}

std::string virtual_renderer::last_media_uri() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_media_uri;
}

http::response virtual_renderer::handle(const http::request& req)
{
    if(req.get_path() == DESCRIPTION_PATH && req.get_method() == "GET")
    {
        logging::info("[{}] Device description requested", m_name);
        http::response res;
        res.set_header("Content-Type", "text/xml; charset=utf-8");
        res.set_body(description());
        return res;
    }

    if(req.get_path() == AV_TRANSPORT_CONTROL_PATH && req.get_method() == "POST")
        return control(req);

    return http::response {404};
}

http::response virtual_renderer::control(const http::request& req)
{
    std::string action = action_name(req.get_header("SOAPAction"));

    {
        std::lock_guard<std::mutex> lock {m_mutex};
        if(action == "SetAVTransportURI")
        {
            m_media_uri = extract_tag_value(req.get_body(), "CurrentURI");
            logging::info("[{}] SetAVTransportURI -> URI: {}", m_name, m_media_uri);
        }
        else if(action == "Play")
        {
            logging::info("[{}] Play (URI: {})", m_name, m_media_uri);
            if(m_verify != verify_mode::none && !m_media_uri.empty())
                start_check(m_media_uri);
        }
        else
        {
            logging::warn("[{}] Unknown SOAP action: {}", m_name, action);
        }
    }

    http::response res;
    res.set_header("Content-Type", "text/xml; charset=utf-8");
    res.set_body(fmt::format(
        "<?xml version=\"1.0\"?>\n"
        "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">\n"
        "  <s:Body>\n"
        "    <u:{}Response xmlns:u=\"{}\"/>\n"
        "  </s:Body>\n"
        "</s:Envelope>", action, AV_TRANSPORT_SERVICE));
    return res;
}

void virtual_renderer::start_check(const std::string& uri)
{
    std::lock_guard<std::mutex> lock {m_checks_mutex};

    // Forget checks that are done already
    m_checks.erase(std::remove_if(m_checks.begin(), m_checks.end(), [](std::future<void>& check) {
        return check.wait_for(0s) == std::future_status::ready;
    }), m_checks.end());

    m_checks.push_back(std::async(std::launch::async, [name = m_name, uri, mode = m_verify, player = m_player]()
    {
        if(mode == verify_mode::play)
        {
            try {
                play_media(name, uri, player);
            } catch(std::exception& e) {
                logging::error("[{}] PLAY FAILED for {}: {}", name, uri, e.what());
            }
            return;
        }

        try {
            if(mode == verify_mode::head)
            {
                http::response res = http::head(uri, 5s);
                logging::info("[{}] VERIFY {}: {} -> {} ({})", name, (res.get_code() == 200) ? "OK" : "FAILED",
                    uri, res.get_code(), res.get_header("Content-Type"));
            }
            else
            {
                http::response res = http::get(uri, 10s);
                logging::info("[{}] FETCH {}: {} -> {} ({} bytes of {})", name, (res.get_code() == 200) ? "OK" : "FAILED",
                    uri, res.get_code(), res.get_body().size(), res.get_header("Content-Type"));
            }
        } catch(std::exception& e) {
            logging::error("[{}] VERIFY FAILED for {}: {}", name, uri, e.what());
        }
    }));
}

} // namespace emulator
