#include "IndicatorSuite/HttpClient.hpp"

#include "IndicatorSuite/Errors.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <future>
#include <iomanip>
#include <memory>
#include <netdb.h>
#include <poll.h>
#include <spawn.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace indicators {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
// Longest single wait before the cancellation flag is looked at again.
constexpr int kPollSliceMs = 50;
// curl's exit status for CURLE_OPERATION_TIMEDOUT.
constexpr int kCurlTimedOut = 28;

class Socket {
  public:
    explicit Socket(int descriptor) : fd(descriptor) {}
    ~Socket() {
        if (fd >= 0) {
            ::close(fd);
        }
    }
    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;

    int get() const { return fd; }

    int release() {
        const int descriptor = fd;
        fd = -1;
        return descriptor;
    }

  private:
    int fd;
};

// Deadline of one request together with the caller's token.
struct Budget {
    Clock::time_point deadline;
    const CancellationToken &token;
};

int remainingMillis(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void checkBudget(const Budget &budget, const std::string &what) {
    if (budget.token.isCancelled()) {
        throw TimeoutError("Cancelled while " + what);
    }
    if (remainingMillis(budget.deadline) == 0) {
        throw TimeoutError("Timed out while " + what);
    }
}

void waitFor(int fd, short events, const Budget &budget, const std::string &what) {
    while (true) {
        checkBudget(budget, what);
        pollfd descriptor{fd, events, 0};
        const int ready = ::poll(&descriptor, 1, std::min(kPollSliceMs, remainingMillis(budget.deadline)));
        if (ready > 0) {
            return;
        }
        if (ready < 0 && errno != EINTR) {
            throw NetworkError("poll failed while " + what + ": " + std::strerror(errno));
        }
    }
}

using AddressList = std::unique_ptr<addrinfo, void (*)(addrinfo *)>;

// getaddrinfo cannot be interrupted, so the lookup runs on a detached thread
// and is abandoned once the budget runs out. The thread frees its own result
// when nobody is left to collect it.
AddressList resolveHost(const std::string &host, std::uint16_t port, const Budget &budget) {
    const std::string what = "resolving " + host;
    checkBudget(budget, what);

    auto pending = std::make_shared<std::promise<AddressList>>();
    auto lookup = pending->get_future();
    std::thread([pending, host, port] {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo *resolved = nullptr;
        const int status = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &resolved);
        if (status != 0) {
            pending->set_exception(
                std::make_exception_ptr(NetworkError("Unable to resolve " + host + ": " + gai_strerror(status))));
            return;
        }
        pending->set_value(AddressList(resolved, freeaddrinfo));
    }).detach();

    while (lookup.wait_for(std::chrono::milliseconds(kPollSliceMs)) != std::future_status::ready) {
        checkBudget(budget, what);
    }
    return lookup.get();
}

int connectWithDeadline(const std::string &host, std::uint16_t port, const Budget &budget) {
    const auto resolved = resolveHost(host, port, budget);

    std::string lastError = "no addresses";
    for (auto *ptr = resolved.get(); ptr != nullptr; ptr = ptr->ai_next) {
        Socket sock(::socket(ptr->ai_family, ptr->ai_socktype, ptr->ai_protocol));
        if (sock.get() < 0) {
            lastError = std::strerror(errno);
            continue;
        }
        const int flags = ::fcntl(sock.get(), F_GETFL, 0);
        ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK);

        if (::connect(sock.get(), ptr->ai_addr, ptr->ai_addrlen) == 0) {
            return sock.release();
        }
        if (errno != EINPROGRESS) {
            lastError = std::strerror(errno);
            continue;
        }

        waitFor(sock.get(), POLLOUT, budget, "connecting to " + host);

        int socketError = 0;
        socklen_t length = sizeof(socketError);
        ::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &socketError, &length);
        if (socketError == 0) {
            return sock.release();
        }
        lastError = std::strerror(socketError);
    }
    throw NetworkError("Unable to connect to " + host + ":" + std::to_string(port) + ": " + lastError);
}

void sendAll(int fd, const void *data, std::size_t size, const Budget &budget) {
    const auto *bytes = static_cast<const char *>(data);
    std::size_t sent = 0;
    while (sent < size) {
        waitFor(fd, POLLOUT, budget, "sending request");
        const ssize_t written = ::send(fd, bytes + sent, size - sent, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            throw NetworkError(std::string("send failed: ") + std::strerror(errno));
        }
        sent += static_cast<std::size_t>(written);
    }
}

// Reads exactly size bytes; used for the fixed-length SOCKS5 replies.
void receiveExact(int fd, unsigned char *buffer, std::size_t size, const Budget &budget) {
    std::size_t received = 0;
    while (received < size) {
        waitFor(fd, POLLIN, budget, "reading proxy reply");
        const ssize_t bytes = ::recv(fd, buffer + received, size - received, 0);
        if (bytes == 0) {
            throw NetworkError("Proxy closed the connection");
        }
        if (bytes < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            throw NetworkError(std::string("recv failed: ") + std::strerror(errno));
        }
        received += static_cast<std::size_t>(bytes);
    }
}

std::string receiveHeaders(int fd, const Budget &budget) {
    std::string result;
    char buffer[4096];
    while (result.find("\r\n\r\n") == std::string::npos) {
        if (result.size() > kMaxHeaderBytes) {
            throw NetworkError("HTTP response headers too large");
        }
        waitFor(fd, POLLIN, budget, "reading response");
        const ssize_t bytes = ::recv(fd, buffer, sizeof(buffer), 0);
        if (bytes == 0) {
            break;
        }
        if (bytes < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            throw NetworkError(std::string("recv failed: ") + std::strerror(errno));
        }
        result.append(buffer, static_cast<std::size_t>(bytes));
    }
    return result;
}

void socks5Connect(int fd, const std::string &host, std::uint16_t port, const Budget &budget) {
    if (host.size() > 255) {
        throw NetworkError("Host name too long for SOCKS5: " + host);
    }

    const unsigned char greeting[3] = {0x05, 0x01, 0x00};
    sendAll(fd, greeting, sizeof(greeting), budget);

    unsigned char response[2];
    receiveExact(fd, response, sizeof(response), budget);
    if (response[0] != 0x05 || response[1] != 0x00) {
        throw NetworkError("SOCKS5 proxy requires unsupported authentication");
    }

    std::vector<unsigned char> connectRequest = {0x05, 0x01, 0x00, 0x03};
    connectRequest.push_back(static_cast<unsigned char>(host.size()));
    connectRequest.insert(connectRequest.end(), host.begin(), host.end());
    connectRequest.push_back(static_cast<unsigned char>((port >> 8) & 0xFF));
    connectRequest.push_back(static_cast<unsigned char>(port & 0xFF));
    sendAll(fd, connectRequest.data(), connectRequest.size(), budget);

    unsigned char reply[4];
    receiveExact(fd, reply, sizeof(reply), budget);
    if (reply[0] != 0x05 || reply[1] != 0x00) {
        throw NetworkError("SOCKS5 proxy rejected connection to " + host);
    }

    // Drain the bound address, its length depends on the address type.
    std::size_t remaining = 2;
    if (reply[3] == 0x01) {
        remaining += 4;
    } else if (reply[3] == 0x04) {
        remaining += 16;
    } else if (reply[3] == 0x03) {
        unsigned char length = 0;
        receiveExact(fd, &length, 1, budget);
        remaining += length;
    } else {
        throw NetworkError("SOCKS5 proxy returned an unknown address type");
    }
    std::vector<unsigned char> bound(remaining);
    receiveExact(fd, bound.data(), bound.size(), budget);
}

std::string toLower(const std::string &value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

// Header lines between the status line and the blank line. Repeated names keep
// the last value.
std::map<std::string, std::string> parseHeaders(const std::string &block) {
    std::map<std::string, std::string> fields;
    std::size_t lineStart = 0;
    while (lineStart < block.size()) {
        auto lineEnd = block.find("\r\n", lineStart);
        if (lineEnd == std::string::npos) {
            lineEnd = block.size();
        }
        const auto separator = block.find(':', lineStart);
        if (separator != std::string::npos && separator < lineEnd) {
            auto valueStart = block.find_first_not_of(" \t", separator + 1);
            auto valueEnd = block.find_last_not_of(" \t", lineEnd - 1);
            const auto value = (valueStart == std::string::npos || valueStart >= lineEnd || valueEnd < valueStart)
                                   ? std::string()
                                   : block.substr(valueStart, valueEnd - valueStart + 1);
            fields[toLower(block.substr(lineStart, separator - lineStart))] = value;
        }
        lineStart = lineEnd + 2;
    }
    return fields;
}

std::string hostHeader(const std::string &host, std::uint16_t port) {
    const bool ipv6 = host.find(':') != std::string::npos;
    std::string value = ipv6 ? "[" + host + "]" : host;
    if (port != 80) {
        value += ":" + std::to_string(port);
    }
    return value;
}

// Status line and header block of a raw response. Anything after the blank
// line is ignored.
HttpResponse parseResponse(const std::string &raw, const std::string &peer) {
    if (raw.empty()) {
        throw NetworkError("Empty response from " + peer);
    }

    const auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        throw NetworkError("Invalid HTTP response received from " + peer);
    }

    const auto statusEnd = raw.find("\r\n");
    const auto statusLine = raw.substr(0, statusEnd);
    std::istringstream statusStream(statusLine);
    std::string httpVersion;
    int statusCode = 0;
    statusStream >> httpVersion >> statusCode;
    if (httpVersion.rfind("HTTP/", 0) != 0 || statusCode < 100 || statusCode > 999) {
        throw NetworkError("Malformed status line from " + peer + ": " + statusLine);
    }

    HttpResponse response;
    response.statusCode = statusCode;
    response.headers = parseHeaders(raw.substr(statusEnd + 2, headerEnd - statusEnd - 2));
    response.bytesTransferred = raw.size();
    return response;
}

// curl child with its stdout on a pipe and stderr discarded. A child that is
// still running when this goes out of scope is killed and reaped.
class CurlProcess {
  public:
    explicit CurlProcess(const std::vector<std::string> &arguments) {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw NetworkError(std::string("pipe failed: ") + std::strerror(errno));
        }

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

        std::vector<char *> argv;
        for (const auto &argument : arguments) {
            argv.push_back(const_cast<char *>(argument.c_str()));
        }
        argv.push_back(nullptr);

        const int status = ::posix_spawnp(&child, argv[0], &actions, nullptr, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);
        ::close(fds[1]);
        if (status != 0) {
            ::close(fds[0]);
            throw NetworkError("Unable to run " + arguments.front() + ": " + std::strerror(status));
        }
        output = fds[0];
    }

    ~CurlProcess() {
        if (output >= 0) {
            ::close(output);
        }
        if (running) {
            ::kill(child, SIGKILL);
            ::waitpid(child, nullptr, 0);
        }
    }

    CurlProcess(const CurlProcess &) = delete;
    CurlProcess &operator=(const CurlProcess &) = delete;

    // Reads stdout until curl closes it.
    std::string readAll(const Budget &budget) {
        std::string result;
        char buffer[4096];
        while (true) {
            if (result.size() > kMaxHeaderBytes) {
                throw NetworkError("HTTP response headers too large");
            }
            waitFor(output, POLLIN, budget, "waiting for curl");
            const ssize_t bytes = ::read(output, buffer, sizeof(buffer));
            if (bytes == 0) {
                return result;
            }
            if (bytes < 0) {
                if (errno == EAGAIN || errno == EINTR) {
                    continue;
                }
                throw NetworkError(std::string("read failed: ") + std::strerror(errno));
            }
            result.append(buffer, static_cast<std::size_t>(bytes));
        }
    }

    // Exit code, or -1 when curl was killed by a signal.
    int wait() {
        int status = 0;
        while (::waitpid(child, &status, 0) < 0) {
            if (errno != EINTR) {
                throw NetworkError(std::string("waitpid failed: ") + std::strerror(errno));
            }
        }
        running = false;
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }

  private:
    pid_t child{-1};
    int output{-1};
    bool running{true};
};

} // namespace

HttpClient::HttpClient(std::string agent, std::string proxy, std::uint16_t port)
    : userAgent(std::move(agent)), proxyHost(std::move(proxy)), proxyPort(port) {}

HttpResponse HttpClient::head(const std::string &host, std::uint16_t port, const std::string &target,
                              std::chrono::milliseconds timeout, const CancellationToken &token) const {
    return request("HEAD", host, port, target, {}, timeout, token);
}

HttpResponse HttpClient::request(const std::string &method, const std::string &host, std::uint16_t port,
                                 const std::string &target,
                                 const std::vector<std::pair<std::string, std::string>> &headers,
                                 std::chrono::milliseconds timeout, const CancellationToken &token) const {
    const auto start = Clock::now();
    const Budget budget{start + timeout, token};

    Socket sock(usesProxy() ? connectWithDeadline(proxyHost, proxyPort, budget)
                            : connectWithDeadline(host, port, budget));
    if (usesProxy()) {
        socks5Connect(sock.get(), host, port, budget);
    }

    std::ostringstream request;
    request << method << ' ' << (target.empty() ? "/" : target) << " HTTP/1.1\r\n";
    request << "Host: " << hostHeader(host, port) << "\r\n";
    request << "User-Agent: " << userAgent << "\r\n";
    request << "Accept: */*\r\n";
    for (const auto &[headerKey, headerValue] : headers) {
        request << headerKey << ": " << headerValue << "\r\n";
    }
    request << "Connection: close\r\n\r\n";

    const auto requestStr = request.str();
    sendAll(sock.get(), requestStr.data(), requestStr.size(), budget);

    auto response = parseResponse(receiveHeaders(sock.get(), budget), host);
    response.elapsedSeconds = std::chrono::duration_cast<std::chrono::duration<double>>(Clock::now() - start).count();
    return response;
}

HttpResponse HttpClient::headTls(const std::string &url, std::chrono::milliseconds timeout,
                                 const CancellationToken &token) const {
    const auto start = Clock::now();
    const Budget budget{start + timeout, token};
    checkBudget(budget, "requesting " + url);

    std::ostringstream maxTime;
    maxTime << std::fixed << std::setprecision(3) << static_cast<double>(timeout.count()) / 1000.0;

    // No --location: the redirect is the answer.
    std::vector<std::string> arguments = {
        curlCommand, "--silent", "--head", "--max-time", maxTime.str(), "--user-agent", userAgent,
        "--header", "Accept: */*",
    };
    if (usesProxy()) {
        arguments.push_back("--proxy");
        arguments.push_back("socks5h://" + proxyHost + ":" + std::to_string(proxyPort));
    }
    arguments.push_back("--url");
    arguments.push_back(url);

    CurlProcess process(arguments);
    const auto raw = process.readAll(budget);
    const int exitCode = process.wait();
    if (exitCode == kCurlTimedOut) {
        throw TimeoutError("Timed out while requesting " + url);
    }
    if (exitCode != 0) {
        throw NetworkError("curl failed for " + url + " with exit code " + std::to_string(exitCode));
    }

    auto response = parseResponse(raw, url);
    response.elapsedSeconds = std::chrono::duration_cast<std::chrono::duration<double>>(Clock::now() - start).count();
    return response;
}

} // namespace indicators
