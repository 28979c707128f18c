#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "http/client.hpp"
#include "http/request.hpp"
#include "http/response.hpp"
#include "http/webserver.hpp"

#include "test_server.hpp"

using namespace std::chrono_literals;

TEST(HttpRequest, ParsesRequestLineHeadersAndBody)
{
    http::request req {"POST /MediaRenderer/AVTransport/Control?x=1&y=2 HTTP/1.1\r\n"
        "Host: 127.0.0.1:1400\r\n"
        "SOAPAction: urn:schemas-upnp-org:service:AVTransport:1#Play\r\n"
        "Content-Length: 4\r\n"
        "\r\n"
        "body"};

    EXPECT_EQ(req.get_method(), "POST");
    EXPECT_EQ(req.get_path(), "/MediaRenderer/AVTransport/Control");
    EXPECT_EQ(req.get_protocol(), "HTTP/1.1");
    EXPECT_EQ(req.get_param("x"), "1");
    EXPECT_EQ(req.get_param("y"), "2");
    EXPECT_EQ(req.get_header("soapaction"), "urn:schemas-upnp-org:service:AVTransport:1#Play");
    EXPECT_TRUE(req.check_header("HOST"));
    EXPECT_EQ(req.get_body(), "body");
}

TEST(HttpRequest, RejectsMalformedRequestLine)
{
    EXPECT_THROW(http::request {"GARBAGE\r\n\r\n"}, std::invalid_argument);
    EXPECT_THROW(http::request {"no line end"}, std::invalid_argument);
}

TEST(HttpRequest, ToStringRoundTrip)
{
    http::request req {"POST", "/control"};
    req.set_header("SOAPAction", "x#Play");
    req.set_body("<xml/>");

    http::request parsed {req.to_string()};
    EXPECT_EQ(parsed.get_method(), "POST");
    EXPECT_EQ(parsed.get_path(), "/control");
    EXPECT_EQ(parsed.get_header("Content-Length"), "6");
    EXPECT_EQ(parsed.get_body(), "<xml/>");
}

TEST(HttpResponse, SerializesStatusAndLength)
{
    http::response res {404};
    res.set_body("missing");
    std::string raw = res.to_string();

    EXPECT_EQ(raw.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_NE(raw.find("Content-Length: 7\r\n"), std::string::npos);
    EXPECT_EQ(raw.substr(raw.size() - 7), "missing");
}

TEST(HttpResponse, ParsesRawResponse)
{
    http::response res = http::response::parse("HTTP/1.1 500 Internal Server Error\r\n"
        "content-type: text/xml\r\n"
        "\r\n"
        "<fault/>");

    EXPECT_EQ(res.get_code(), 500);
    EXPECT_EQ(res.get_phrase(), "Internal Server Error");
    EXPECT_EQ(res.get_header("Content-Type"), "text/xml");
    EXPECT_EQ(res.get_body(), "<fault/>");

    EXPECT_THROW(http::response::parse("SSDP/1.0 OK\r\n\r\n"), std::invalid_argument);
}

TEST(HttpUrl, SplitsLocation)
{
    http::url u = http::parse_url("http://192.168.1.10:1400/xml/device_description.xml");
    EXPECT_EQ(u.host, "192.168.1.10");
    EXPECT_EQ(u.port, 1400);
    EXPECT_EQ(u.path, "/xml/device_description.xml");
    EXPECT_EQ(u.authority(), "192.168.1.10:1400");

    http::url plain = http::parse_url("http://10.0.0.1");
    EXPECT_EQ(plain.port, 80);
    EXPECT_EQ(plain.path, "/");
}

TEST(HttpUrl, RejectsUnsupportedUrls)
{
    EXPECT_THROW(http::parse_url("https://10.0.0.1/"), std::invalid_argument);
    EXPECT_THROW(http::parse_url("10.0.0.1:1400/"), std::invalid_argument);
    EXPECT_THROW(http::parse_url("http://10.0.0.1:port/"), std::invalid_argument);
    EXPECT_THROW(http::parse_url("http:///path"), std::invalid_argument);
}

TEST(HttpClient, ExchangesRequestWithServer)
{
    test_server server {[](const http::request& req) {
        http::response res;
        res.set_header("X-Method", req.get_method());
        res.set_body(req.get_path() + "|" + req.get_body());
        return res;
    }};

    http::response got = http::get(server.base_url() + "/hello", 2s);
    EXPECT_EQ(got.get_code(), 200);
    EXPECT_EQ(got.get_body(), "/hello|");
    EXPECT_EQ(got.get_header("X-Method"), "GET");

    http::response posted = http::post(server.base_url() + "/submit", {{"Content-Type", "text/plain"}}, "payload", 2s);
    EXPECT_EQ(posted.get_body(), "/submit|payload");
}

TEST(HttpClient, ThrowsWhenNothingListens)
{
    EXPECT_THROW(http::get("http://127.0.0.1:1/", 1s), std::runtime_error);
}

TEST(HttpClient, ConnectGivesUpAtTimeout)
{
    // Non routable, the connect never completes
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(http::get("http://10.255.255.1/", 300ms), std::runtime_error);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

class DirectoryHandlerTest : public ::testing::Test
{
protected:

    void SetUp() override
    {
        m_root = std::filesystem::temp_directory_path() / "zone_announce_http_test";
        std::filesystem::create_directories(m_root);
        std::ofstream {m_root / "clip.mp3", std::ios::binary} << "0123456789";
    }

    void TearDown() override
    {
        std::filesystem::remove_all(m_root);
    }

    std::filesystem::path m_root;
};

TEST_F(DirectoryHandlerTest, ServesWholeFile)
{
    http::handler serve = http::directory_handler(m_root.string());
    http::response res = serve(http::request {"GET", "/clip.mp3"});

    EXPECT_EQ(res.get_code(), 200);
    EXPECT_EQ(res.get_body(), "0123456789");
    EXPECT_EQ(res.get_header("Content-Type"), "audio/mpeg");
}

TEST_F(DirectoryHandlerTest, ServesByteRange)
{
    http::handler serve = http::directory_handler(m_root.string());
    http::request req {"GET", "/clip.mp3"};
    req.set_header("Range", "bytes=2-5");
    http::response res = serve(req);

    EXPECT_EQ(res.get_code(), 206);
    EXPECT_EQ(res.get_body(), "2345");
    EXPECT_EQ(res.get_header("Content-Range"), "bytes 2-5/10");
}

TEST_F(DirectoryHandlerTest, HeadHasLengthWithoutBody)
{
    test_server server {http::directory_handler(m_root.string())};
    http::response res = http::head(server.base_url() + "/clip.mp3", 2s);

    EXPECT_EQ(res.get_code(), 200);
    EXPECT_EQ(res.get_header("Content-Length"), "10");
    EXPECT_TRUE(res.get_body().empty());
}

TEST_F(DirectoryHandlerTest, RejectsTraversalAndMissingFiles)
{
    http::handler serve = http::directory_handler(m_root.string());
    EXPECT_EQ(serve(http::request {"GET", "/../etc/passwd"}).get_code(), 400);
    EXPECT_EQ(serve(http::request {"GET", "/nothing.mp3"}).get_code(), 404);
    EXPECT_EQ(serve(http::request {"POST", "/clip.mp3"}).get_code(), 405);
}
