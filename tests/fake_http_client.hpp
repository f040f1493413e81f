#pragma once

#include "fetcher/http_client.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fetcher::testing {

// HttpClient whose requests are driven by the test. Nothing is delivered
// from streamFetch() itself; cancellations surface on poll(), like curl.
class FakeHttpClient final : public HttpClient {
public:
    class FakeRequest final : public HttpRequest {
    public:
        void cancel() override { cancelled_ = true; }
        [[nodiscard]] bool cancelled() const override { return cancelled_; }

    private:
        bool cancelled_{false};
    };

    struct Call {
        HttpRequestOptions options;
        std::shared_ptr<HttpStreamHandler> handler;
        std::shared_ptr<FakeRequest> request;
        bool finished{false};
    };

    HttpRequestPtr streamFetch(const HttpRequestOptions& options,
                               std::shared_ptr<HttpStreamHandler> handler) override;
    std::size_t poll(std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::size_t callCount() const noexcept { return calls_.size(); }
    [[nodiscard]] const Call& call(std::size_t index) const { return calls_.at(index); }
    [[nodiscard]] std::size_t inFlight() const;

    void respond(std::size_t index, long status = 200,
                 std::optional<std::uint64_t> content_length = std::nullopt);
    bool send(std::size_t index, const std::string& bytes);
    void end(std::size_t index);
    void fail(std::size_t index, HttpError error);

    // respond(200, body size) + send(body) + end()
    void serve(std::size_t index, const std::string& body);

private:
    std::vector<Call> calls_;
};

} // namespace fetcher::testing
