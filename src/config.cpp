#include "config.hpp"

#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "fmt/format.h"

namespace config
{

static json read_json_file(const std::string& path)
{
    if(path.empty())
        return json::object();

    std::ifstream ifs {path};
    if(!ifs.good())
        throw std::runtime_error {fmt::format("Unable to open config file {}", path)};

    try {
        return json::parse(ifs);
    } catch(json::parse_error& e) {
        throw std::runtime_error {fmt::format("Invalid config file {}: {}", path, e.what())};
    }
}

template<typename T>
static void read_value(const json& j, const char* key, T& target)
{
    if(j.contains(key))
        target = j.at(key).get<T>();
}

static void read_millis(const json& j, const char* key, std::chrono::milliseconds& target)
{
    if(j.contains(key))
        target = std::chrono::milliseconds {j.at(key).get<int64_t>()};
}

static void read_level(const json& j, logging::level& target)
{
    if(j.contains("log_level"))
        target = logging::parse_level(j.at("log_level").get<std::string>());
}

static void read_discovery(const json& j, discovery::search_options& options)
{
    if(!j.contains("discovery"))
        return;

    const json& d = j.at("discovery");
    read_value(d, "address", options.address);
    read_value(d, "port", options.port);
    read_value(d, "search_target", options.search_target);
    read_value(d, "mx", options.mx);
    read_millis(d, "timeout_ms", options.timeout);
    read_millis(d, "fetch_timeout_ms", options.fetch_timeout);
}

gateway_config parse_gateway_config(const json& j)
{
    gateway_config cfg;
    try {
        read_value(j, "local_ip", cfg.local_ip);
        read_level(j, cfg.log_level);
        read_value(j, "allowed_sender", cfg.allowed_sender);
        read_discovery(j, cfg.discovery);

        if(j.contains("control"))
        {
            const json& c = j.at("control");
            read_millis(c, "settle_delay_ms", cfg.control.settle_delay);
            read_millis(c, "timeout_ms", cfg.control.timeout);
        }
        if(j.contains("media"))
        {
            read_value(j.at("media"), "root", cfg.media.root);
            read_value(j.at("media"), "port", cfg.media.port);
        }
        if(j.contains("api"))
        {
            read_value(j.at("api"), "enabled", cfg.api.enabled);
            read_value(j.at("api"), "port", cfg.api.port);
        }
        if(j.contains("tts"))
        {
            read_value(j.at("tts"), "command", cfg.tts.command);
            read_value(j.at("tts"), "extension", cfg.tts.extension);
        }
    } catch(json::exception& e) {
        throw std::runtime_error {fmt::format("Invalid gateway config: {}", e.what())};
    } catch(std::invalid_argument& e) {
        throw std::runtime_error {fmt::format("Invalid gateway config: {}", e.what())};
    }
    return cfg;
}

emulator_config parse_emulator_config(const json& j)
{
    emulator_config cfg;
    try {
        read_value(j, "local_ip", cfg.local_ip);
        read_level(j, cfg.log_level);
        read_value(j, "speakers", cfg.speakers);
        read_value(j, "base_port", cfg.base_port);
        read_discovery(j, cfg.discovery);
        if(j.contains("verify"))
            cfg.verify = emulator::parse_verify_mode(j.at("verify").get<std::string>());
        read_value(j, "player", cfg.player);
    } catch(json::exception& e) {
        throw std::runtime_error {fmt::format("Invalid emulator config: {}", e.what())};
    } catch(std::invalid_argument& e) {
        throw std::runtime_error {fmt::format("Invalid emulator config: {}", e.what())};
    }

    if(cfg.verify == emulator::verify_mode::play && cfg.player.find("{file}") == std::string::npos)
        throw std::runtime_error {"Invalid emulator config: player needs a {file} placeholder"};

    // Blank names are dropped
    std::vector<std::string> speakers;
    for(const auto& name : cfg.speakers)
    {
        std::string_view trimmed = utils::trim(name);
        if(!trimmed.empty())
            speakers.emplace_back(trimmed);
    }
    cfg.speakers = std::move(speakers);
    return cfg;
}

gateway_config load_gateway_config(const std::string& path)
{
    return parse_gateway_config(read_json_file(path));
}

emulator_config load_emulator_config(const std::string& path)
{
    return parse_emulator_config(read_json_file(path));
}

std::string resolve_local_ip(const std::string& configured)
{
    if(const char* env = std::getenv("LOCAL_IP"); env != nullptr && *env != '\0')
        return env;
    if(!configured.empty())
        return configured;
    return utils::get_local_ipaddr();
}

} // namespace config
