#include "http/webserver.hpp"
#include "http/transfer.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string_view>
#include <vector>
#include <netinet/in.h>
#include <sys/socket.h>

namespace http
{

webserver::webserver(std::string address, uint16_t port, handler on_request)
    : m_acceptor {address, port},
      m_address {std::move(address)},
      m_handler {std::move(on_request)}
{}

static void handle_connection(tcp_conn&& conn, const handler& on_request, std::chrono::milliseconds timeout)
{
    response res;
    try {
        set_timeout(conn.get(), timeout);
        request req {read_message(conn, message_kind::request)};
        res = on_request(req);
    } catch(const std::invalid_argument& e) {
        res = response {400};
        res.set_body(e.what());
    } catch(const std::runtime_error& e) {
        // Peer went away or timed out, nobody left to answer
        logging::debug("[http] Dropping connection: {}", e.what());
        return;
    } catch(const std::exception& e) {
        logging::error("[http] Handler failed: {}", e.what());
        res = response {500};
    }

    std::string res_str = res.to_string();
    conn.send(net::span {res_str.begin(), res_str.end()});
}

void webserver::serve(std::atomic<bool>& run_condition)
{
    logging::debug("[http] Serving on {}:{}", m_address, port());
    while(run_condition.load())
    {
        try {
            tcp_conn conn = m_acceptor.accept();
            if(!run_condition.load())
                break;
            handle_connection(std::move(conn), m_handler, m_timeout);
        } catch(std::runtime_error& e) {
            logging::debug("[http] Connection failed: {}", e.what());
        }
    }
    logging::debug("[http] Closing {}:{}", m_address, port());
}

void webserver::wake() const
{
    // Connecting to ourselves lets the blocking accept return
    try {
        tcp_conn sock {(m_address == "0.0.0.0") ? "127.0.0.1" : m_address, port()};
    } catch(std::runtime_error& e) {
        logging::debug("[http] Wake up failed: {}", e.what());
    }
}

uint16_t webserver::port() const
{
    sockaddr_in addr {};
    socklen_t len = sizeof(addr);
    if(getsockname(m_acceptor.get(), reinterpret_cast<sockaddr*>(&addr), &len) != 0)
        throw std::runtime_error {"Unable to query bound port"};
    return ntohs(addr.sin_port);
}

static std::vector<char> file_to_binary(const std::string& path)
{
    std::ifstream ifs(path, std::ios::binary);

    return std::vector<char> {(std::istreambuf_iterator<char>(ifs)),
        (std::istreambuf_iterator<char>())};
}

static std::string content_type(std::string_view path)
{
    size_t dot = path.rfind('.');
    std::string ext = (dot == std::string_view::npos) ? std::string {} : utils::to_lower(path.substr(dot + 1));
    if(ext == "mp3")
        return "audio/mpeg";
    if(ext == "wav")
        return "audio/wav";
    if(ext == "m4a" || ext == "mp4")
        return "audio/mp4";
    if(ext == "aiff" || ext == "aif")
        return "audio/aiff";
    if(ext == "ogg")
        return "audio/ogg";
    return "application/octet-stream";
}

static response serve_file(const std::string& root, const request& req)
{
    if(req.get_method() != "GET" && req.get_method() != "HEAD")
        return response {405};

    const std::string& pv = req.get_path();
    if(pv.find("..") != std::string::npos)
        return response {400};

    std::string path;
    path.reserve(root.size() + pv.size());
    path.assign(root);
    std::copy(pv.begin(), pv.end(), std::back_inserter(path));

    // Read file
    std::vector<char> data = file_to_binary(path);
    if(data.empty())
        return response {404};

    response res;
    res.set_header("Content-Type", content_type(path));
    res.set_header("Accept-Ranges", "bytes");

    size_t start = 0, end = data.size() - 1;
    if(req.check_header("Range"))
    {
        // Only single ranges of the form bytes=start-[end]
        std::string hdr = req.get_header("Range");
        size_t hyphen_pos = hdr.find('-');
        if(!utils::starts_with(hdr, "bytes=") || hyphen_pos == std::string::npos)
            return response {416};

        std::from_chars(hdr.data() + 6, hdr.data() + hyphen_pos, start);
        if(hyphen_pos + 1 < hdr.size())
            std::from_chars(hdr.data() + hyphen_pos + 1, hdr.data() + hdr.size(), end);
        end = std::min(end, data.size() - 1);
        if(start > end)
            return response {416};

        res.set_code(206);
        res.set_header("Content-Range", "bytes " + std::to_string(start) + '-' +
            std::to_string(end) + '/' + std::to_string(data.size()));
    }

    if(req.get_method() == "HEAD")
        res.set_header("Content-Length", std::to_string(end - start + 1));
    else
        res.set_body(std::string {data.begin() + start, data.begin() + end + 1});

    return res;
}

handler directory_handler(std::string root)
{
    return [root = std::move(root)](const request& req) {
        return serve_file(root, req);
    };
}

void serve_directory(const std::string& root, const std::string& bind_address, uint16_t port, std::atomic<bool>& run_condition)
{
    webserver server {bind_address, port, directory_handler(root)};
    logging::info("Serving {} on {}:{}", root, bind_address, port);
    server.serve(run_condition);
}

} // namespace http
