#ifndef ZONE_ANNOUNCE_VIRTUAL_RENDERER_HPP
#define ZONE_ANNOUNCE_VIRTUAL_RENDERER_HPP

#include <atomic>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "http/webserver.hpp"

namespace emulator
{

enum class verify_mode
{
    none,
    head,   // HEAD request against the media url
    fetch,  // download the whole file
    play    // download and hand the file to the player command
};

#define PLAYER_COMMAND "ffplay -nodisp -autoexit -loglevel quiet {file}"

/// Accepts "none", "head", "fetch" and "play"; throws std::invalid_argument otherwise
verify_mode parse_verify_mode(std::string_view name);

/// Soap action name from a SOAPAction header: the part after the last '#' without quotes
std::string action_name(std::string_view soap_action);

/// Content between <tag> and </tag> with the four xml entities resolved, empty if missing
std::string extract_tag_value(std::string_view body, std::string_view tag);

// Emulated zone player serving its description and the AVTransport control endpoint
class virtual_renderer
{
public:

    virtual_renderer() = delete;
    virtual_renderer(const virtual_renderer&) = delete;
    virtual_renderer& operator=(const virtual_renderer&) = delete;
    virtual_renderer(virtual_renderer&&) = delete;
    virtual_renderer& operator=(virtual_renderer&&) = delete;

    /// Binds the http port right away, throws std::runtime_error if it is taken.
    /// The player command needs a {file} placeholder when verify is play.
    virtual_renderer(std::string name, uint16_t port, verify_mode verify = verify_mode::none,
        const std::string& address = "0.0.0.0", std::string player_command = PLAYER_COMMAND);

    /// Waits for pending media checks
    ~virtual_renderer();

    http::response handle(const http::request& req);

    std::string description() const;

    std::string last_media_uri() const;

    const std::string& name() const
    {
        return m_name;
    }

    uint16_t port() const
    {
        return m_server.port();
    }

    void serve(std::atomic<bool>& run_condition)
    {
        m_server.serve(run_condition);
    }

    void wake() const
    {
        m_server.wake();
    }

private:

    http::response control(const http::request& req);

    void start_check(const std::string& uri);

    const std::string m_name;

    const verify_mode m_verify;

    const std::string m_player;

    mutable std::mutex m_mutex;     // guards m_media_uri across one control request

    std::string m_media_uri;

    std::mutex m_checks_mutex;

    std::vector<std::future<void>> m_checks;

    http::webserver m_server;

};

} // namespace emulator

#endif
