#include "loopback_http_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fmt/format.h>

namespace fetcher::testing {

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

void sendAll(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return;
        }
        sent += static_cast<std::size_t>(n);
    }
}

} // namespace

LoopbackHttpServer::LoopbackHttpServer() {
    listener_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listener_ < 0) {
        throw std::runtime_error(fmt::format("socket failed: {}", std::strerror(errno)));
    }

    int opt = 1;
    ::setsockopt(listener_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    address.sin_port = 0;
    if (::bind(listener_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0 ||
        ::listen(listener_, 16) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(listener_);
        throw std::runtime_error(fmt::format("cannot listen on loopback: {}", reason));
    }

    socklen_t length = sizeof(address);
    ::getsockname(listener_, reinterpret_cast<sockaddr*>(&address), &length);
    port_ = ntohs(address.sin_port);

    worker_ = std::thread([this] { serve(); });
}

LoopbackHttpServer::~LoopbackHttpServer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    stopped_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    ::close(listener_);
}

void LoopbackHttpServer::route(const std::string& path, CannedResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[path] = std::move(response);
}

std::string LoopbackHttpServer::url(const std::string& path) const {
    return fmt::format("http://127.0.0.1:{}{}", port_, path);
}

std::map<std::string, std::string> LoopbackHttpServer::lastRequestHeaders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_headers_;
}

std::size_t LoopbackHttpServer::requestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_count_;
}

void LoopbackHttpServer::serve() {
    while (running_) {
        pollfd entry{listener_, POLLIN, 0};
        if (::poll(&entry, 1, 20) <= 0) {
            continue;
        }
        const int client = ::accept(listener_, nullptr, nullptr);
        if (client < 0) {
            continue;
        }
        handle(client);
        ::close(client);
    }
}

void LoopbackHttpServer::handle(int client) {
    std::string request;
    char buffer[4096];
    while (request.find("\r\n\r\n") == std::string::npos) {
        const ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            return;
        }
        request.append(buffer, static_cast<std::size_t>(n));
    }

    const auto line_end = request.find("\r\n");
    const std::string request_line = request.substr(0, line_end);
    const auto first_space = request_line.find(' ');
    const auto second_space = request_line.find(' ', first_space + 1);
    const std::string path = request_line.substr(first_space + 1, second_space - first_space - 1);

    std::map<std::string, std::string> headers;
    std::size_t pos = line_end + 2;
    while (pos < request.size()) {
        const auto next = request.find("\r\n", pos);
        if (next == std::string::npos || next == pos) {
            break;
        }
        const std::string header = request.substr(pos, next - pos);
        const auto colon = header.find(':');
        if (colon != std::string::npos) {
            headers[lower(trim(header.substr(0, colon)))] = trim(header.substr(colon + 1));
        }
        pos = next + 2;
    }

    CannedResponse response{404, "Not Found", {}, {}, std::chrono::milliseconds{0}};
    {
        std::unique_lock<std::mutex> lock(mutex_);
        last_headers_ = headers;
        ++request_count_;
        const auto it = routes_.find(path);
        if (it != routes_.end()) {
            response = it->second;
        }
        if (response.delay.count() > 0) {
            stopped_.wait_for(lock, response.delay, [this] { return !running_; });
            if (!running_) {
                return;
            }
        }
    }

    std::string body = response.body;
    int status = response.status;
    std::string reason = response.reason;
    std::string extra;
    const auto range = headers.find("range");
    if (status == 200 && range != headers.end() && range->second.rfind("bytes=", 0) == 0) {
        const auto offset = std::stoull(range->second.substr(6));
        if (offset < body.size()) {
            extra = fmt::format("Content-Range: bytes {}-{}/{}\r\n", offset, body.size() - 1,
                                body.size());
            body = body.substr(offset);
            status = 206;
            reason = "Partial Content";
        }
    }

    std::string reply = fmt::format("HTTP/1.1 {} {}\r\n", status, reason);
    for (const auto& [name, value] : response.headers) {
        reply += fmt::format("{}: {}\r\n", name, value);
    }
    reply += extra;
    reply += fmt::format("Content-Length: {}\r\nConnection: close\r\n\r\n", body.size());
    reply += body;
    sendAll(client, reply);
}

} // namespace fetcher::testing
