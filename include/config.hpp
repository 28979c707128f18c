#ifndef ZONE_ANNOUNCE_CONFIG_HPP
#define ZONE_ANNOUNCE_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "api_server.hpp"
#include "logging.hpp"
#include "media_renderer.hpp"
#include "ssdp_discovery.hpp"
#include "tts.hpp"
#include "virtual_renderer.hpp"

using nlohmann::json;

namespace config
{

struct media_config
{
    std::string root {"./tts"};
    uint16_t port = 8080;
};

struct api_config
{
    bool enabled = true;
    uint16_t port = API_PORT;
};

struct tts_config
{
    std::string command {TTS_COMMAND};
    std::string extension {"wav"};
};

struct gateway_config
{
    std::string local_ip;       // empty means detect from the interfaces
    logging::level log_level = logging::level::info;
    std::string allowed_sender;     // empty means every console user
    discovery::search_options discovery;
    upnp::control_options control;
    media_config media;
    api_config api;
    tts_config tts;
};

struct emulator_config
{
    std::string local_ip;
    logging::level log_level = logging::level::info;
    std::vector<std::string> speakers {"Living Room", "Kitchen"};
    uint16_t base_port = 1400;
    emulator::verify_mode verify = emulator::verify_mode::none;
    std::string player = PLAYER_COMMAND;
    discovery::search_options discovery;
};

/// Missing keys keep their defaults, wrong types or values throw std::runtime_error
gateway_config parse_gateway_config(const json& j);

emulator_config parse_emulator_config(const json& j);

/// An empty path yields the defaults, an unreadable file or invalid json throws std::runtime_error
gateway_config load_gateway_config(const std::string& path);

emulator_config load_emulator_config(const std::string& path);

/// LOCAL_IP from the environment, then the configured value, then interface detection
std::string resolve_local_ip(const std::string& configured);

} // namespace config

#endif
