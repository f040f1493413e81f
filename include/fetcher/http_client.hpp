#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace fetcher {

struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const noexcept;
};

using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

// Connection settings handed to the transport. An absent agent means every
// request opens a fresh connection that is closed afterwards.
struct TransportAgent {
    std::string http_proxy;
    std::string https_proxy;
    bool keep_alive{true};

    // Same proxy for both schemes; nullopt for an empty proxy string.
    static std::optional<TransportAgent> forProxy(const std::string& proxy);
    // http_proxy / https_proxy (either case); nullopt when neither is set.
    static std::optional<TransportAgent> fromEnvironment();
};

// Instance proxies win over the defaults when set; `disable` drops the agent
// outright.
std::optional<TransportAgent> mergeAgents(const std::optional<TransportAgent>& defaults,
                                          const std::optional<TransportAgent>& instance,
                                          bool disable);

struct HttpRequestOptions {
    std::string url;
    std::string method{"GET"};
    Headers headers;
    std::optional<TransportAgent> agent;
    std::chrono::milliseconds response_timeout{10000};
    long max_redirects{10};
};

struct HttpResponse {
    long status_code{0};
    Headers headers;
    std::optional<std::uint64_t> content_length;
};

enum class HttpErrorKind {
    timeout,
    http_status,
    too_many_redirects,
    network,
    cancelled,
};

struct HttpError {
    HttpErrorKind kind{HttpErrorKind::network};
    long status_code{0};
    std::string message;
};

// Receives the events of one streaming fetch. Exactly one of onError/onEnd is
// the last call made for a request.
class HttpStreamHandler {
public:
    virtual ~HttpStreamHandler() = default;

    virtual void onResponse(const HttpResponse& response) = 0;
    // Returning false aborts the transfer.
    virtual bool onData(const char* data, std::size_t size) = 0;
    virtual void onError(const HttpError& error) = 0;
    virtual void onEnd() = 0;
};

class HttpRequest {
public:
    virtual ~HttpRequest() = default;

    // Requests termination. Returns immediately; the handler is told through
    // onError(cancelled) on a later poll.
    virtual void cancel() = 0;
    [[nodiscard]] virtual bool cancelled() const = 0;
};

using HttpRequestPtr = std::shared_ptr<HttpRequest>;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpRequestPtr streamFetch(const HttpRequestOptions& options,
                                       std::shared_ptr<HttpStreamHandler> handler) = 0;

    // Drives I/O for up to `timeout`, delivering handler callbacks on the
    // calling thread. Returns the number of requests still in flight.
    virtual std::size_t poll(std::chrono::milliseconds timeout) = 0;
};

} // namespace fetcher
