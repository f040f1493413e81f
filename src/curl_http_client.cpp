#include "fetcher/curl_http_client.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fetcher {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using MultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// Process-wide curl_global_init, released when static storage is torn down.
class LibcurlGlobal {
public:
    LibcurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        spdlog::debug("libcurl initialized: {}", curl_version());
    }
    ~LibcurlGlobal() { curl_global_cleanup(); }

    LibcurlGlobal(const LibcurlGlobal&) = delete;
    LibcurlGlobal& operator=(const LibcurlGlobal&) = delete;
};

void acquireLibcurl() {
    static const LibcurlGlobal global;
}

std::string trim(std::string value) {
    const auto not_space = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

bool startsWithHttps(const std::string& url) {
    if (url.size() < 6) {
        return false;
    }
    std::string scheme = url.substr(0, 6);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return scheme == "https:";
}

class CurlRequest final : public HttpRequest {
public:
    CurlRequest(HttpRequestOptions options, std::shared_ptr<HttpStreamHandler> handler)
        : options_(std::move(options)), handler_(std::move(handler)) {}

    void cancel() override { cancelled_ = true; }
    [[nodiscard]] bool cancelled() const override { return cancelled_; }

    HttpRequestOptions options_;
    std::shared_ptr<HttpStreamHandler> handler_;
    CurlHandle easy_{nullptr, &curl_easy_cleanup};
    HeaderList header_list_{nullptr, &curl_slist_free_all};

    Headers response_headers_;
    std::string reason_;
    std::chrono::steady_clock::time_point started_{};
    bool responded_{false};
    bool attached_{false};
    bool cancelled_{false};
    std::optional<HttpError> failure_;
    char error_buffer_[CURL_ERROR_SIZE]{};
};

using CurlRequestPtr = std::shared_ptr<CurlRequest>;

} // namespace

class CurlHttpClient::Impl {
public:
    Impl() : multi_(curl_multi_init(), &curl_multi_cleanup) {
        if (!multi_) {
            throw std::runtime_error("Failed to allocate curl multi handle");
        }
    }

    ~Impl() {
        for (auto& [easy, request] : running_) {
            curl_multi_remove_handle(multi_.get(), easy);
        }
        running_.clear();
        pending_.clear();
    }

    HttpRequestPtr streamFetch(const HttpRequestOptions& options,
                               std::shared_ptr<HttpStreamHandler> handler) {
        auto request = std::make_shared<CurlRequest>(options, std::move(handler));
        request->started_ = std::chrono::steady_clock::now();
        configure(*request);
        pending_.push_back(request);
        return request;
    }

    std::size_t poll(std::chrono::milliseconds timeout) {
        attachPending();
        sweep();

        if (!running_.empty()) {
            int still_running = 0;
            curl_multi_perform(multi_.get(), &still_running);

            int numfds = 0;
            const CURLMcode code = curl_multi_wait(multi_.get(), nullptr, 0,
                                                   static_cast<int>(timeout.count()), &numfds);
            if (code != CURLM_OK) {
                spdlog::error("curl_multi_wait failed: {}", curl_multi_strerror(code));
            }
            curl_multi_perform(multi_.get(), &still_running);
            drainMessages();
        }

        sweep();
        return running_.size() + pending_.size();
    }

private:
    void configure(CurlRequest& request) {
        request.easy_.reset(curl_easy_init());
        CURL* easy = request.easy_.get();
        if (!easy) {
            request.failure_ = HttpError{HttpErrorKind::network, 0, "Failed to allocate curl handle"};
            return;
        }

        const auto& options = request.options_;
        curl_easy_setopt(easy, CURLOPT_URL, options.url.c_str());
        if (options.method == "GET") {
            curl_easy_setopt(easy, CURLOPT_HTTPGET, 1L);
        } else {
            curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, options.method.c_str());
        }

        for (const auto& [name, value] : options.headers) {
            const std::string line = name + ": " + value;
            curl_slist* appended = curl_slist_append(request.header_list_.get(), line.c_str());
            if (!appended) {
                request.failure_ = HttpError{HttpErrorKind::network, 0, "Failed to build request headers"};
                return;
            }
            request.header_list_.release();
            request.header_list_.reset(appended);
        }
        if (request.header_list_) {
            curl_easy_setopt(easy, CURLOPT_HTTPHEADER, request.header_list_.get());
        }

        curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(easy, CURLOPT_MAXREDIRS, options.max_redirects);
        curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(easy, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options.response_timeout.count()));
        curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, request.error_buffer_);
        curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(easy, CURLOPT_HEADERDATA, &request);
        curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(easy, CURLOPT_WRITEDATA, &request);

        // An empty proxy keeps libcurl from reading http_proxy itself; the
        // agent is the only source of proxy settings.
        if (options.agent) {
            const std::string& proxy = startsWithHttps(options.url) ? options.agent->https_proxy
                                                                    : options.agent->http_proxy;
            curl_easy_setopt(easy, CURLOPT_PROXY, proxy.c_str());
            curl_easy_setopt(easy, CURLOPT_TCP_KEEPALIVE, options.agent->keep_alive ? 1L : 0L);
        } else {
            curl_easy_setopt(easy, CURLOPT_PROXY, "");
            curl_easy_setopt(easy, CURLOPT_FORBID_REUSE, 1L);
            curl_easy_setopt(easy, CURLOPT_FRESH_CONNECT, 1L);
        }
    }

    void attachPending() {
        auto batch = std::move(pending_);
        pending_.clear();
        for (auto& request : batch) {
            if (request->failure_ || request->cancelled_) {
                finish(request, CURLE_OK);
                continue;
            }
            const CURLMcode code = curl_multi_add_handle(multi_.get(), request->easy_.get());
            if (code != CURLM_OK) {
                spdlog::error("curl_multi_add_handle failed: {}", curl_multi_strerror(code));
                request->failure_ = HttpError{HttpErrorKind::network, 0, curl_multi_strerror(code)};
                finish(request, CURLE_OK);
                continue;
            }
            request->attached_ = true;
            running_.emplace(request->easy_.get(), request);
            spdlog::debug("GET {} started", request->options_.url);
        }
    }

    // Finishes requests that were cancelled or still have no response after
    // the response timeout.
    void sweep() {
        const auto now = std::chrono::steady_clock::now();
        std::vector<CurlRequestPtr> expired;
        for (auto& [easy, request] : running_) {
            if (request->cancelled_) {
                expired.push_back(request);
            } else if (!request->responded_ &&
                       now - request->started_ > request->options_.response_timeout) {
                request->failure_ = HttpError{
                    HttpErrorKind::timeout, 0,
                    fmt::format("Timeout awaiting 'response' for {}ms",
                                request->options_.response_timeout.count())};
                expired.push_back(request);
            }
        }
        for (auto& request : expired) {
            finish(request, CURLE_OK);
        }
    }

    void drainMessages() {
        std::vector<std::pair<CurlRequestPtr, CURLcode>> done;
        int msgs_left = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &msgs_left)) {
            if (msg->msg != CURLMSG_DONE) {
                continue;
            }
            const auto it = running_.find(msg->easy_handle);
            if (it != running_.end()) {
                done.emplace_back(it->second, msg->data.result);
            }
        }
        for (auto& [request, result] : done) {
            finish(request, result);
        }
    }

    void finish(const CurlRequestPtr& request, CURLcode result) {
        if (request->attached_) {
            curl_multi_remove_handle(multi_.get(), request->easy_.get());
            running_.erase(request->easy_.get());
            request->attached_ = false;
        }

        auto handler = std::move(request->handler_);
        if (!handler) {
            return;
        }

        if (request->cancelled_) {
            handler->onError(HttpError{HttpErrorKind::cancelled, 0, "Request cancelled"});
            return;
        }
        if (request->failure_) {
            handler->onError(*request->failure_);
            return;
        }

        switch (result) {
            case CURLE_OK:
                handler->onEnd();
                return;
            case CURLE_OPERATION_TIMEDOUT:
                handler->onError(HttpError{HttpErrorKind::timeout, 0, describe(*request, result)});
                return;
            case CURLE_TOO_MANY_REDIRECTS:
                handler->onError(HttpError{HttpErrorKind::too_many_redirects, 0,
                                           describe(*request, result)});
                return;
            default:
                handler->onError(HttpError{HttpErrorKind::network, 0, describe(*request, result)});
                return;
        }
    }

    static std::string describe(const CurlRequest& request, CURLcode result) {
        if (request.error_buffer_[0] != '\0') {
            return request.error_buffer_;
        }
        return curl_easy_strerror(result);
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* request = static_cast<CurlRequest*>(userdata);
        const size_t total = size * nitems;
        if (!request || request->cancelled_) {
            return 0;
        }

        const std::string line{buffer, total};
        if (line.rfind("HTTP/", 0) == 0) {
            request->response_headers_.clear();
            const auto first_space = line.find(' ');
            const auto second_space = first_space == std::string::npos
                                          ? std::string::npos
                                          : line.find(' ', first_space + 1);
            request->reason_ = second_space == std::string::npos ? std::string{}
                                                                 : trim(line.substr(second_space + 1));
            return total;
        }

        if (line == "\r\n" || line == "\n") {
            return endOfHeaders(*request) ? total : 0;
        }

        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            request->response_headers_[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
        }
        return total;
    }

    static bool endOfHeaders(CurlRequest& request) {
        long status = 0;
        curl_easy_getinfo(request.easy_.get(), CURLINFO_RESPONSE_CODE, &status);

        if (status < 200) {
            return true;
        }
        if (status >= 300 && status < 400 &&
            request.response_headers_.find("location") != request.response_headers_.end()) {
            return true;
        }
        if (status >= 400) {
            request.failure_ = HttpError{
                HttpErrorKind::http_status, status,
                request.reason_.empty() ? fmt::format("Response code {}", status)
                                        : fmt::format("Response code {} ({})", status, request.reason_)};
            return false;
        }

        HttpResponse response;
        response.status_code = status;
        response.headers = request.response_headers_;
        curl_off_t length = -1;
        if (curl_easy_getinfo(request.easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) ==
                CURLE_OK &&
            length >= 0) {
            response.content_length = static_cast<std::uint64_t>(length);
        }

        request.responded_ = true;
        if (request.handler_) {
            request.handler_->onResponse(response);
        }
        return !request.cancelled_;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* request = static_cast<CurlRequest*>(userdata);
        const size_t total = size * nmemb;
        if (!request || request->cancelled_ || !request->handler_) {
            return 0;
        }
        if (!request->responded_ && !endOfHeaders(*request)) {
            return 0;
        }
        if (total == 0) {
            return 0;
        }
        if (!request->handler_->onData(ptr, total)) {
            if (!request->cancelled_ && !request->failure_) {
                request->failure_ = HttpError{HttpErrorKind::network, 0, "Transfer aborted by receiver"};
            }
            return 0;
        }
        return request->cancelled_ ? 0 : total;
    }

    MultiHandle multi_;
    std::vector<CurlRequestPtr> pending_;
    std::unordered_map<CURL*, CurlRequestPtr> running_;
};

CurlHttpClient::CurlHttpClient() {
    acquireLibcurl();
    impl_ = std::make_unique<Impl>();
}

CurlHttpClient::~CurlHttpClient() = default;

HttpRequestPtr CurlHttpClient::streamFetch(const HttpRequestOptions& options,
                                           std::shared_ptr<HttpStreamHandler> handler) {
    return impl_->streamFetch(options, std::move(handler));
}

std::size_t CurlHttpClient::poll(std::chrono::milliseconds timeout) {
    return impl_->poll(timeout);
}

} // namespace fetcher
