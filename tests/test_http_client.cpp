#include <gtest/gtest.h>
#include "../src/net/HttpClient.h"
#include "../src/net/Prober.h"
#include "../src/net/Socket.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>

namespace plug_scan {

static const uint32_t LOOPBACK = 0x7F000001u;

// Serves one canned response to the first connection and keeps the request text.
class OneShotServer {
public:
    explicit OneShotServer(std::string response) : response_(std::move(response)) {
        listener_.reset(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
        sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_addr.s_addr = htonl(LOOPBACK);
        socklen_t len = sizeof(sa);
        if (::bind(listener_.get(), reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0 || ::listen(listener_.get(), 4) != 0) return;
        if (::getsockname(listener_.get(), reinterpret_cast<sockaddr*>(&sa), &len) != 0) return;
        port_ = ntohs(sa.sin_port);
        thread_ = std::thread([this]{
            SocketGuard peer(::accept(listener_.get(), nullptr, nullptr));
            if (!peer.valid()) return;
            char buf[4096];
            auto deadline = Clock::now() + std::chrono::seconds(2);
            while (request_.find("\r\n\r\n") == std::string::npos && Clock::now() < deadline) {
                ssize_t n = ::recv(peer.get(), buf, sizeof(buf), 0);
                if (n <= 0) break;
                request_.append(buf, static_cast<size_t>(n));
            }
            if (!response_.empty()) ::send(peer.get(), response_.data(), response_.size(), MSG_NOSIGNAL);
        });
    }
    ~OneShotServer() { if (thread_.joinable()) thread_.join(); }
    uint16_t port() const { return port_; }
    // Valid once the client call has returned.
    const std::string& request() { if (thread_.joinable()) thread_.join(); return request_; }
private:
    SocketGuard listener_;
    std::string response_;
    std::string request_;
    uint16_t port_ = 0;
    std::thread thread_;
};

class HttpClientTest : public ::testing::Test {
protected:
    std::chrono::milliseconds timeout_{2000};
};

TEST_F(HttpClientTest, ParsesStatusHeadersAndBody) {
    HttpResponse r = parse_http_response("HTTP/1.1 200 OK\r\nContent-Type: text/xml\r\nX-Thing:  spaced  \r\n\r\n<root/>");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.headers["content-type"], "text/xml");
    EXPECT_EQ(r.headers["x-thing"], "spaced");
    EXPECT_EQ(r.body, "<root/>");
}

TEST_F(HttpClientTest, AcceptsBareNewlines) {
    HttpResponse r = parse_http_response("HTTP/1.0 404 Not Found\nServer: x\n\nmissing");
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(r.body, "missing");
}

TEST_F(HttpClientTest, DechunksBody) {
    HttpResponse r = parse_http_response(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n6;ext=1\r\n world\r\n0\r\n\r\n");
    EXPECT_EQ(r.body, "hello world");
}

TEST_F(HttpClientTest, RejectsMalformedResponses) {
    EXPECT_THROW(parse_http_response(""), HttpError);
    EXPECT_THROW(parse_http_response("HTTP/1.1 200 OK\r\nno terminator"), HttpError);
    EXPECT_THROW(parse_http_response("SSH-2.0-OpenSSH\r\n\r\n"), HttpError);
    EXPECT_THROW(parse_http_response("HTTP/1.1 abc\r\n\r\n"), HttpError);
    EXPECT_THROW(parse_http_response("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nffff\r\nshort"), HttpError);
    EXPECT_THROW(parse_http_response("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"), HttpError);
}

TEST_F(HttpClientTest, StringHelpers) {
    EXPECT_EQ(to_lower("LOCATION"), "location");
    EXPECT_EQ(trim("  a b \r\n"), "a b");
    EXPECT_EQ(trim(" \t "), "");
}

TEST_F(HttpClientTest, PostsRequestOverLoopback) {
    OneShotServer server("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
    ASSERT_NE(server.port(), 0);
    HttpResponse r = http_request(LOOPBACK, server.port(), "POST", "/upnp/control/basicevent1",
                                  {{"SOAPACTION", "\"x#y\""}}, "<a/>", timeout_);
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "ok");
    const std::string& req = server.request();
    EXPECT_EQ(req.rfind("POST /upnp/control/basicevent1 HTTP/1.0\r\n", 0), 0u);
    EXPECT_NE(req.find("Host: 127.0.0.1:" + std::to_string(server.port())), std::string::npos);
    EXPECT_NE(req.find("SOAPACTION: \"x#y\""), std::string::npos);
    EXPECT_NE(req.find("Content-Length: 4"), std::string::npos);
    EXPECT_NE(req.find("Connection: close"), std::string::npos);
}

TEST_F(HttpClientTest, ConnectFailureThrows) {
    uint16_t port = 0;
    {
        OneShotServer closed("");
        port = closed.port();
        SocketGuard wake;
        ASSERT_EQ(connect_tcp(LOOPBACK, port, Clock::now() + timeout_, wake), ConnectResult::Connected);
    }
    EXPECT_THROW(http_request(LOOPBACK, port, "GET", "/", {}, "", timeout_), HttpError);
}

TEST_F(HttpClientTest, EmptyReplyThrows) {
    OneShotServer server("");
    ASSERT_NE(server.port(), 0);
    auto start = Clock::now();
    EXPECT_THROW(http_request(LOOPBACK, server.port(), "GET", "/setup.xml", {}, "", std::chrono::milliseconds(200)), HttpError);
    EXPECT_LT(Clock::now() - start, std::chrono::seconds(3));
}

TEST_F(HttpClientTest, SignatureDetection) {
    EXPECT_TRUE(has_device_signature("<manufacturer>Belkin International Inc.</manufacturer>"));
    EXPECT_TRUE(has_device_signature("<friendlyName>WeMo Switch</friendlyName>"));
    EXPECT_TRUE(has_device_signature("urn:Belkin:device:controllee:1"));
    EXPECT_FALSE(has_device_signature("<manufacturer>Acme Printers</manufacturer>"));
}

TEST_F(HttpClientTest, ProberVerifiesSignature) {
    TcpProber prober;
    {
        OneShotServer server("HTTP/1.1 200 OK\r\n\r\n<root><manufacturer>Belkin</manufacturer></root>");
        EXPECT_EQ(prober.verify_signature(LOOPBACK, server.port(), timeout_), SignatureResult::Match);
        EXPECT_EQ(server.request().rfind("GET /setup.xml ", 0), 0u);
    }
    {
        OneShotServer server("HTTP/1.1 200 OK\r\n\r\n<html>router login</html>");
        EXPECT_EQ(prober.verify_signature(LOOPBACK, server.port(), timeout_), SignatureResult::Mismatch);
    }
    {
        OneShotServer server("garbage without headers");
        EXPECT_EQ(prober.verify_signature(LOOPBACK, server.port(), timeout_), SignatureResult::Unavailable);
    }
}

TEST_F(HttpClientTest, ProberGivesErrorStatusTheBenefitOfTheDoubt) {
    TcpProber prober;
    {
        OneShotServer server("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
        EXPECT_EQ(prober.verify_signature(LOOPBACK, server.port(), timeout_), SignatureResult::Unavailable);
    }
    {
        OneShotServer server("HTTP/1.0 500 Internal Server Error\r\n\r\nbelkin");
        EXPECT_EQ(prober.verify_signature(LOOPBACK, server.port(), timeout_), SignatureResult::Unavailable);
    }
}

TEST_F(HttpClientTest, ProberConnect) {
    TcpProber prober;
    OneShotServer server("HTTP/1.1 200 OK\r\n\r\n");
    EXPECT_EQ(prober.connect(LOOPBACK, server.port(), timeout_), ConnectResult::Connected);
}

} // namespace plug_scan
