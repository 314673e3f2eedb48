/**
 * @file http_client_test.cpp
 * @brief Tests for URL handling, response parsing and the HTTP fingerprint.
 */

#include "lanmonitor/HttpClient.h"
#include "lanmonitor/HttpProbe.h"
#include "lanmonitor/TransportStream.h"

#include <gtest/gtest.h>

#include <cstring>
#include <deque>

using namespace LanMonitor;

namespace {

// Hands out one scripted chunk per read; an empty chunk with an error ends the stream.
class ScriptedStream : public TransportStream {
public:
    std::deque<std::string> chunks;
    std::string failure;
    int reads = 0;

    bool writeAll(const std::string&, std::string&) override { return true; }

    size_t readSome(uint8_t* buffer, size_t size, std::string& errorMsg) override {
        ++reads;
        if (chunks.empty()) {
            errorMsg = failure;
            return 0;
        }
        std::string next = chunks.front();
        chunks.pop_front();
        if (next.size() > size) {
            chunks.push_front(next.substr(size));
            next.resize(size);
        }
        std::memcpy(buffer, next.data(), next.size());
        return next.size();
    }

    void close() override {}
    bool isTls() const override { return false; }
};

std::chrono::steady_clock::time_point later() {
    return std::chrono::steady_clock::now() + std::chrono::seconds(5);
}

}  // namespace

TEST(HttpUrlTest, ParsesSchemePortAndPath) {
    auto u = HttpUrl::parse("http://192.168.1.1:8080/setup.xml?x=1#frag");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->scheme, "http");
    EXPECT_EQ(u->host, "192.168.1.1");
    EXPECT_EQ(u->port, 8080);
    EXPECT_EQ(u->path, "/setup.xml?x=1");
    EXPECT_EQ(u->hostHeader(), "192.168.1.1:8080");

    auto tls = HttpUrl::parse("HTTPS://nas.local");
    ASSERT_TRUE(tls.has_value());
    EXPECT_TRUE(tls->isTls());
    EXPECT_EQ(tls->port, 443);
    EXPECT_EQ(tls->path, "/");
    EXPECT_EQ(tls->toString(), "https://nas.local/");
}

TEST(HttpUrlTest, RejectsUnsupportedUrls) {
    EXPECT_FALSE(HttpUrl::parse("ftp://host/").has_value());
    EXPECT_FALSE(HttpUrl::parse("192.168.1.1/").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://host:99999/").has_value());
    EXPECT_FALSE(HttpUrl::parse("http:///path").has_value());
}

TEST(HttpClientTest, ParsesResponseWithContentLength) {
    const std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Server: nginx/1.18.0\r\n"
        "Content-Type: text/html\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "helloEXTRA";
    HttpResponse r;
    std::string err;
    ASSERT_TRUE(HttpClient::parseResponse(raw, r, err)) << err;
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.header("SERVER"), "nginx/1.18.0");
    EXPECT_EQ(r.body, "hello");
}

TEST(HttpClientTest, DecodesChunkedBody) {
    const std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "7\r\n<title>\r\n"
        "A;ext=1\r\nRouter Web\r\n"
        "8\r\n</title>\r\n"
        "0\r\n\r\n";
    HttpResponse r;
    std::string err;
    ASSERT_TRUE(HttpClient::parseResponse(raw, r, err)) << err;
    EXPECT_EQ(r.body, "<title>Router Web</title>");

    EXPECT_FALSE(HttpClient::decodeChunked("zz\r\nbad\r\n").has_value());
    EXPECT_EQ(HttpClient::decodeChunked("5\r\nhel").value_or(""), "hel");
}

TEST(HttpClientTest, RejectsNonHttp) {
    HttpResponse r;
    std::string err;
    EXPECT_FALSE(HttpClient::parseResponse("SSH-2.0-OpenSSH_8.9\r\n", r, err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(HttpClient::parseResponse("HTTP/1.1 abc\r\n\r\n", r, err));
}

TEST(HttpClientTest, ResolvesRedirects) {
    const HttpUrl base = *HttpUrl::parse("http://192.168.1.1/cgi/index.html?a=1");

    EXPECT_EQ(HttpClient::resolveRedirect(base, "https://192.168.1.1/")->toString(), "https://192.168.1.1/");
    EXPECT_EQ(HttpClient::resolveRedirect(base, "/login")->toString(), "http://192.168.1.1/login");
    EXPECT_EQ(HttpClient::resolveRedirect(base, "login.html")->toString(), "http://192.168.1.1/cgi/login.html");
    EXPECT_EQ(HttpClient::resolveRedirect(base, "//other.local:81/x")->toString(), "http://other.local:81/x");
}

//=============================================================================
// HttpProbe
//=============================================================================

TEST(TransportStreamTest, ReadUntilStopsWhenComplete) {
    ScriptedStream stream;
    stream.chunks = {"HTTP/1.1 200 OK\r\n", "\r\nbody", "never read"};

    std::string out;
    std::string err;
    auto done = [](const std::string& received) { return received.find("body") != std::string::npos; };
    ASSERT_TRUE(stream.readUntil(out, 1024, later(), done, err));
    EXPECT_EQ(out, "HTTP/1.1 200 OK\r\n\r\nbody");
    EXPECT_EQ(stream.reads, 2);
}

TEST(TransportStreamTest, ReadUntilCapsSizeAndKeepsPartialData) {
    ScriptedStream stream;
    stream.chunks = {std::string(10000, 'a'), std::string(10000, 'b')};

    std::string out;
    std::string err;
    ASSERT_TRUE(stream.readUntil(out, 9000, later(), nullptr, err));
    EXPECT_GE(out.size(), 9000u);
    EXPECT_LT(out.size(), 20000u);

    ScriptedStream dropped;
    dropped.chunks = {"HTTP/1.0 200 OK\r\n"};
    dropped.failure = "connection reset";
    out.clear();
    EXPECT_TRUE(dropped.readUntil(out, 1024, later(), nullptr, err));
    EXPECT_EQ(out, "HTTP/1.0 200 OK\r\n");
}

TEST(TransportStreamTest, ReadUntilReportsFailureBeforeAnyData) {
    ScriptedStream stream;
    stream.failure = "read timed out";

    std::string out;
    std::string err;
    EXPECT_FALSE(stream.readUntil(out, 1024, later(), nullptr, err));
    EXPECT_EQ(err, "read timed out");

    ScriptedStream expired;
    expired.chunks = {"data"};
    EXPECT_TRUE(expired.readUntil(out, 1024, std::chrono::steady_clock::now() - std::chrono::seconds(1),
                                  nullptr, err));
    EXPECT_EQ(expired.reads, 0);
}

TEST(HttpProbeTest, CandidateUrlOrder) {
    auto urls = HttpProbe::candidateUrls("10.0.0.2");
    ASSERT_EQ(urls.size(), 4u);
    EXPECT_EQ(urls[0], "http://10.0.0.2/");
    EXPECT_EQ(urls[1], "https://10.0.0.2/");
    EXPECT_EQ(urls[2], "http://10.0.0.2:8080/");
    EXPECT_EQ(urls[3], "http://10.0.0.2:8443/");
}

TEST(HttpProbeTest, ExtractsTitleCaseInsensitively) {
    EXPECT_EQ(HttpProbe::extractTitle("<html><TITLE lang=\"en\">\n  Synology DiskStation </TITLE>").value_or(""),
              "Synology DiskStation");
    EXPECT_FALSE(HttpProbe::extractTitle("<html><title>   </title>").has_value());
    EXPECT_FALSE(HttpProbe::extractTitle("no markup").has_value());
}

TEST(HttpProbeTest, FingerprintOnlyFor200) {
    HttpResponse ok;
    ok.status = 200;
    ok.url = "http://10.0.0.2/";
    ok.headers["server"] = "lighttpd/1.4";
    ok.body = "<title>Pi-hole</title>";

    auto fp = HttpProbe::fingerprint(ok);
    ASSERT_TRUE(fp.has_value());
    EXPECT_EQ(fp->server, "lighttpd/1.4");
    EXPECT_EQ(fp->title.value_or(""), "Pi-hole");
    EXPECT_EQ(fp->url, "http://10.0.0.2/");

    HttpResponse denied = ok;
    denied.status = 401;
    EXPECT_FALSE(HttpProbe::fingerprint(denied).has_value());
}
