#include "IndicatorSuite/Errors.hpp"
#include "IndicatorSuite/HttpClient.hpp"
#include "IndicatorSuite/UrlResolver.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Serves one canned reply per accepted connection on 127.0.0.1. "{port}" in a
// reply is replaced by the bound port. An empty reply keeps the connection open
// without answering until the client hangs up.
class LoopbackServer {
  public:
    explicit LoopbackServer(std::vector<std::string> replies) : replies(std::move(replies)) {
        listener = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listener < 0) {
            throw std::runtime_error("socket failed");
        }
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t length = sizeof(addr);
        if (::bind(listener, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
            ::listen(listener, 4) != 0 ||
            ::getsockname(listener, reinterpret_cast<sockaddr *>(&addr), &length) != 0) {
            ::close(listener);
            throw std::runtime_error("unable to listen on loopback");
        }
        boundPort = ntohs(addr.sin_port);
        worker = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        ::shutdown(listener, SHUT_RDWR);
        if (worker.joinable()) {
            worker.join();
        }
        ::close(listener);
    }

    std::uint16_t port() const { return boundPort; }

    std::string url(const std::string &path) const {
        return "http://127.0.0.1:" + std::to_string(boundPort) + path;
    }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex);
        return received;
    }

  private:
    void serve() {
        for (const auto &reply : replies) {
            const int client = ::accept(listener, nullptr, nullptr);
            if (client < 0) {
                return;
            }
            std::string request;
            char buffer[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                const auto n = ::recv(client, buffer, sizeof(buffer), 0);
                if (n <= 0) {
                    break;
                }
                request.append(buffer, static_cast<std::size_t>(n));
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                received.push_back(request);
            }
            if (reply.empty()) {
                pollfd pfd{client, POLLIN, 0};
                ::poll(&pfd, 1, 3000);
            } else {
                auto text = reply;
                const auto placeholder = text.find("{port}");
                if (placeholder != std::string::npos) {
                    text.replace(placeholder, 6, std::to_string(boundPort));
                }
                ::send(client, text.data(), text.size(), MSG_NOSIGNAL);
            }
            ::close(client);
        }
    }

    std::vector<std::string> replies;
    int listener{-1};
    std::uint16_t boundPort{0};
    std::thread worker;
    mutable std::mutex mutex;
    std::vector<std::string> received;
};

std::string redirectTo(const std::string &location) {
    return "HTTP/1.1 301 Moved Permanently\r\nLocation: " + location + "\r\nContent-Length: 0\r\n\r\n";
}

const std::string kOk = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\nX-Test: Yes\r\n\r\nhello";

indicators::HttpUrlResolver makeResolver(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    return indicators::HttpUrlResolver(indicators::HttpClient("resolver-test/1.0"), timeout);
}

TEST(HttpClientTest, HeadRequestParsesStatusAndHeaders) {
    LoopbackServer server({kOk});
    const indicators::HttpClient client("resolver-test/1.0");

    const auto response = client.head("127.0.0.1", server.port(), "/status", std::chrono::milliseconds(2000));
    EXPECT_EQ(response.statusCode, 200);
    EXPECT_FALSE(response.isRedirect());
    ASSERT_EQ(response.headers.count("x-test"), 1u);
    EXPECT_EQ(response.headers.at("x-test"), "Yes");
    EXPECT_FALSE(client.usesProxy());

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].rfind("HEAD /status HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(requests[0].find("User-Agent: resolver-test/1.0"), std::string::npos);
}

TEST(HttpClientTest, GarbageResponseIsNetworkError) {
    LoopbackServer server({"SSH-2.0-OpenSSH_9.0\r\n\r\n"});
    const indicators::HttpClient client;
    EXPECT_THROW(client.head("127.0.0.1", server.port(), "/", std::chrono::milliseconds(2000)),
                 indicators::NetworkError);
}

TEST(HttpClientTest, HostNamesAreResolvedBeforeConnecting) {
    LoopbackServer server({kOk});
    const indicators::HttpClient client;

    const auto response = client.head("localhost", server.port(), "/", std::chrono::milliseconds(2000));
    EXPECT_EQ(response.statusCode, 200);
}

TEST(HttpClientTest, CancelledTokenStopsBeforeResolving) {
    LoopbackServer server({kOk});
    const indicators::HttpClient client;
    const indicators::CancellationToken token;
    token.cancel();

    EXPECT_THROW(client.head("localhost", server.port(), "/", std::chrono::milliseconds(2000), token),
                 indicators::TimeoutError);
    EXPECT_TRUE(server.requests().empty());
}

TEST(HttpUrlResolverTest, ReturnsAbsoluteLocation) {
    LoopbackServer server({redirectTo("http://login.evil.com/verify")});
    const auto resolver = makeResolver();

    EXPECT_EQ(resolver.unshorten(server.url("/abc"), indicators::CancellationToken()),
              "http://login.evil.com/verify");
}

TEST(HttpUrlResolverTest, ResolvesRelativeLocationAgainstRequestUrl) {
    LoopbackServer server({redirectTo("/landing?id=7")});
    const auto resolver = makeResolver();

    EXPECT_EQ(resolver.unshorten(server.url("/abc"), indicators::CancellationToken()), server.url("/landing?id=7"));
}

TEST(HttpUrlResolverTest, NonRedirectReturnsUrlUnchanged) {
    LoopbackServer server({kOk});
    const auto resolver = makeResolver();
    const auto url = server.url("/abc");

    EXPECT_EQ(resolver.unshorten(url, indicators::CancellationToken()), url);
}

TEST(HttpUrlResolverTest, SchemeUpgradeIsReturnedAsNextHop) {
    LoopbackServer server({redirectTo("https://127.0.0.1:{port}/abc")});
    const auto resolver = makeResolver();

    EXPECT_EQ(resolver.unshorten(server.url("/abc"), indicators::CancellationToken()),
              "https://127.0.0.1:" + std::to_string(server.port()) + "/abc");
}

TEST(HttpUrlResolverTest, SilentServerTimesOut) {
    LoopbackServer server({""});
    const auto resolver = makeResolver(std::chrono::milliseconds(200));

    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(resolver.unshorten(server.url("/slow"), indicators::CancellationToken()), indicators::TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
}

TEST(HttpUrlResolverTest, CancelInterruptsPendingRequest) {
    LoopbackServer server({""});
    const auto resolver = makeResolver(std::chrono::milliseconds(3000));
    const indicators::CancellationToken token;

    std::thread canceller([token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(resolver.unshorten(server.url("/slow"), token), indicators::TimeoutError);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_LT(elapsed, std::chrono::seconds(1));
}

TEST(HttpUrlResolverTest, ExpiredTokenFailsWithoutConnecting) {
    LoopbackServer server({kOk});
    const auto resolver = makeResolver();

    indicators::CancellationToken token;
    token.cancel();
    EXPECT_THROW(resolver.unshorten(server.url("/abc"), token), indicators::TimeoutError);

    const auto expired = indicators::CancellationToken::withTimeout(std::chrono::milliseconds(0));
    EXPECT_THROW(resolver.unshorten(server.url("/abc"), expired), indicators::TimeoutError);
    EXPECT_TRUE(server.requests().empty());
}

TEST(HttpUrlResolverTest, NonHttpSchemesAreNotContacted) {
    const auto resolver = makeResolver();
    EXPECT_EQ(resolver.unshorten("ftp://bit.ly/file", indicators::CancellationToken()), "ftp://bit.ly/file");
}

// Shell script standing in for curl. It records its arguments one per line in
// args.txt and runs the given body.
class TlsClientTest : public ::testing::Test {
  protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("ioc-scan-curl-" + std::to_string(::getpid()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override { fs::remove_all(dir); }

    indicators::HttpClient clientRunning(const std::string &body, const std::string &proxyHost = {},
                                         std::uint16_t proxyPort = 0) {
        const auto script = dir / "fake-curl";
        {
            std::ofstream output(script);
            output << "#!/bin/sh\nprintf '%s\\n' \"$@\" > '" << (dir / "args.txt").string() << "'\n" << body << "\n";
        }
        fs::permissions(script, fs::perms::owner_all);
        indicators::HttpClient client("resolver-test/1.0", proxyHost, proxyPort);
        client.setCurlCommand(script.string());
        return client;
    }

    std::vector<std::string> arguments() const {
        std::ifstream input(dir / "args.txt");
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(input, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    bool hasArgument(const std::string &value) const {
        const auto args = arguments();
        return std::find(args.begin(), args.end(), value) != args.end();
    }

    fs::path dir;
};

TEST_F(TlsClientTest, HttpsShortenerResolvesThroughTls) {
    const auto client =
        clientRunning("printf 'HTTP/2 301 \\r\\nlocation: https://login.evil.com/verify\\r\\n\\r\\n'");
    const indicators::HttpUrlResolver resolver(client, std::chrono::milliseconds(2000));

    EXPECT_EQ(resolver.unshorten("https://bit.ly/abc", indicators::CancellationToken()),
              "https://login.evil.com/verify");
    EXPECT_TRUE(hasArgument("--head"));
    EXPECT_TRUE(hasArgument("https://bit.ly/abc"));
    EXPECT_TRUE(hasArgument("resolver-test/1.0"));
    EXPECT_TRUE(hasArgument("2.000"));
    EXPECT_FALSE(hasArgument("--location"));
    EXPECT_FALSE(hasArgument("--proxy"));
}

TEST_F(TlsClientTest, ProxyIsHandedToCurl) {
    const auto client = clientRunning("printf 'HTTP/1.1 200 OK\\r\\n\\r\\n'", "127.0.0.1", 9050);

    const auto response = client.headTls("https://t.co/x", std::chrono::milliseconds(2000));
    EXPECT_EQ(response.statusCode, 200);
    EXPECT_TRUE(hasArgument("socks5h://127.0.0.1:9050"));
}

TEST_F(TlsClientTest, CurlExitStatusIsReported) {
    EXPECT_THROW(clientRunning("exit 6").headTls("https://t.co/x", std::chrono::milliseconds(2000)),
                 indicators::NetworkError);
    EXPECT_THROW(clientRunning("exit 28").headTls("https://t.co/x", std::chrono::milliseconds(2000)),
                 indicators::TimeoutError);
    EXPECT_THROW(clientRunning("printf 'garbage'").headTls("https://t.co/x", std::chrono::milliseconds(2000)),
                 indicators::NetworkError);
}

TEST_F(TlsClientTest, CancelKillsRunningCurl) {
    const auto client = clientRunning("exec sleep 5");
    const indicators::CancellationToken token;

    std::thread canceller([token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(client.headTls("https://t.co/x", std::chrono::milliseconds(3000), token), indicators::TimeoutError);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_LT(elapsed, std::chrono::seconds(1));
}

TEST_F(TlsClientTest, MissingCurlIsNetworkError) {
    indicators::HttpClient client;
    client.setCurlCommand((dir / "no-such-curl").string());
    EXPECT_THROW(client.headTls("https://t.co/x", std::chrono::milliseconds(2000)), indicators::NetworkError);
}

} // namespace
