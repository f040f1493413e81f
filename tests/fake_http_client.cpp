#include "fake_http_client.hpp"

#include <stdexcept>
#include <utility>

namespace fetcher::testing {

HttpRequestPtr FakeHttpClient::streamFetch(const HttpRequestOptions& options,
                                           std::shared_ptr<HttpStreamHandler> handler) {
    Call call;
    call.options = options;
    call.handler = std::move(handler);
    call.request = std::make_shared<FakeRequest>();
    calls_.push_back(call);
    return call.request;
}

std::size_t FakeHttpClient::poll(std::chrono::milliseconds) {
    for (std::size_t i = 0; i < calls_.size(); ++i) {
        if (calls_[i].finished || !calls_[i].request->cancelled()) {
            continue;
        }
        calls_[i].finished = true;
        auto handler = calls_[i].handler;
        handler->onError(HttpError{HttpErrorKind::cancelled, 0, "Request cancelled"});
    }
    return inFlight();
}

std::size_t FakeHttpClient::inFlight() const {
    std::size_t count = 0;
    for (const auto& call : calls_) {
        if (!call.finished) {
            ++count;
        }
    }
    return count;
}

void FakeHttpClient::respond(std::size_t index, long status, std::optional<std::uint64_t> content_length) {
    auto& call = calls_.at(index);
    if (call.finished || call.request->cancelled()) {
        throw std::logic_error("respond() on a finished request");
    }
    HttpResponse response;
    response.status_code = status;
    response.content_length = content_length;
    if (content_length) {
        response.headers["Content-Length"] = std::to_string(*content_length);
    }
    auto handler = call.handler;
    handler->onResponse(response);
}

bool FakeHttpClient::send(std::size_t index, const std::string& bytes) {
    auto& call = calls_.at(index);
    if (call.finished || call.request->cancelled()) {
        return false;
    }
    auto handler = call.handler;
    if (!handler->onData(bytes.data(), bytes.size())) {
        calls_.at(index).finished = true;
        handler->onError(HttpError{HttpErrorKind::network, 0, "Transfer aborted by receiver"});
        return false;
    }
    return true;
}

void FakeHttpClient::end(std::size_t index) {
    auto& call = calls_.at(index);
    if (call.finished || call.request->cancelled()) {
        return;
    }
    call.finished = true;
    auto handler = call.handler;
    handler->onEnd();
}

void FakeHttpClient::fail(std::size_t index, HttpError error) {
    auto& call = calls_.at(index);
    if (call.finished) {
        return;
    }
    call.finished = true;
    auto handler = call.handler;
    handler->onError(error);
}

void FakeHttpClient::serve(std::size_t index, const std::string& body) {
    respond(index, 200, body.size());
    send(index, body);
    end(index);
}

} // namespace fetcher::testing
