#include "api_server.hpp"

#include "logging.hpp"

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace api
{

static http::response json_response(int code, const json& body)
{
    http::response res {code};
    res.set_header("Content-Type", "application/json");
    // Device names come from the network and may not be valid utf-8
    res.set_body(body.dump(-1, ' ', false, json::error_handler_t::replace));
    return res;
}

static http::response error_response(int code, const std::string& message)
{
    return json_response(code, json {{"error", message}});
}

static int status_code(announce::announce_status status)
{
    switch(status)
    {
        case announce::announce_status::ok: return 200;
        case announce::announce_status::invalid_request: return 400;
        case announce::announce_status::not_found: return 404;
        case announce::announce_status::not_allowed: return 403;
        default: return 500;
    }
}

static http::response list_speakers(announce::announcer& announcer)
{
    json speakers = json::array();
    for(const auto& device : announcer.list_devices())
        speakers.push_back(json {{"name", device.name}, {"id", device.id}});
    return json_response(200, json {{"speakers", speakers}});
}

static http::response speak(announce::announcer& announcer, const http::request& req)
{
    json body;
    try {
        body = json::parse(req.get_body());
    } catch(json::parse_error& e) {
        return error_response(400, std::string {"Invalid JSON: "} + e.what());
    }

    std::string text, target;
    try {
        if(body.contains("text"))
            text = body.at("text").get<std::string>();
        if(body.contains("target"))
            target = body.at("target").get<std::string>();
    } catch(json::exception& e) {
        return error_response(400, e.what());
    }

    if(text.empty())
        return error_response(400, "\"text\" is required");
    if(target.empty())
        target = ANNOUNCE_ALL;

    logging::info("[api] Announcement: \"{}\" -> {}", text, target);
    announce::announce_result result = announcer.announce(text, target);
    if(!result)
        return error_response(status_code(result.status), result.message);
    return json_response(200, json {{"status", "ok"}});
}

http::handler make_handler(announce::announcer& announcer)
{
    return [&announcer](const http::request& req) {
        if(req.get_path() == "/speakers")
        {
            if(req.get_method() != "GET")
                return error_response(405, "Method not allowed");
            return list_speakers(announcer);
        }
        if(req.get_path() == "/speak")
        {
            if(req.get_method() != "POST")
                return error_response(405, "Method not allowed");
            return speak(announcer, req);
        }
        return error_response(404, "Not found");
    };
}

void serve_api(announce::announcer& announcer, const std::string& bind_address, uint16_t port, std::atomic<bool>& run_condition)
{
    http::webserver server {bind_address, port, make_handler(announcer)};
    logging::info("API server on {}:{}", bind_address, port);
    server.serve(run_condition);
}

} // namespace api
