#pragma once

#include "fetcher/http_client.hpp"

#include <memory>

namespace fetcher {

// HttpClient over one curl multi handle. Every transfer progresses inside
// poll() on the calling thread; requests started from a handler callback are
// attached on the next poll.
class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    HttpRequestPtr streamFetch(const HttpRequestOptions& options,
                               std::shared_ptr<HttpStreamHandler> handler) override;
    std::size_t poll(std::chrono::milliseconds timeout) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fetcher
