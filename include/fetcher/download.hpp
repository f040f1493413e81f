#pragma once

#include "fetcher/download_error.hpp"
#include "fetcher/events.hpp"
#include "fetcher/http_client.hpp"
#include "fetcher/progress.hpp"

#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fetcher {

class DownloadList;
class Downloader;

enum class DownloadStatus {
    init,
    active,
    waiting,
    paused,
    error,
    complete,
    removed,
};

enum class OverwritePolicy {
    fail_if_exists,
    overwrite,
    rename_on_conflict,
};

[[nodiscard]] const char* toString(DownloadStatus status) noexcept;
[[nodiscard]] const char* toString(OverwritePolicy policy) noexcept;
[[nodiscard]] bool isTerminal(DownloadStatus status) noexcept;

// One requested download. State is written only by the Downloader that
// created it; everyone else gets read access.
class Download : public std::enable_shared_from_this<Download> {
public:
    // Called once when the record becomes terminal. `error` is null on success.
    using StoppedCallback = std::function<void(const Download&, const DownloadError* error)>;

    Download(std::string url, std::string directory, std::string file_name);

    Download(const Download&) = delete;
    Download& operator=(const Download&) = delete;

    [[nodiscard]] const std::string& gid() const noexcept { return gid_; }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] const std::string& directory() const noexcept { return directory_; }
    [[nodiscard]] const std::string& fileName() const noexcept { return file_name_; }
    [[nodiscard]] const std::string& originPath() const noexcept { return origin_path_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::string partialPath() const { return path_ + ".tmp"; }
    [[nodiscard]] int renameCount() const noexcept { return rename_count_; }

    [[nodiscard]] DownloadStatus status() const noexcept { return status_; }
    [[nodiscard]] bool isTerminal() const noexcept { return fetcher::isTerminal(status_); }

    [[nodiscard]] std::uint64_t totalLength() const noexcept { return total_length_; }
    [[nodiscard]] std::uint64_t completedLength() const noexcept { return completed_length_; }
    [[nodiscard]] std::uint64_t downloadSpeed() const noexcept { return download_speed_; }

    [[nodiscard]] OverwritePolicy overwritePolicy() const noexcept { return overwrite_; }
    [[nodiscard]] const Headers& headers() const noexcept { return headers_; }
    [[nodiscard]] const std::optional<TransportAgent>& agent() const noexcept { return agent_; }

    [[nodiscard]] const DownloadError* error() const noexcept { return error_ ? &*error_ : nullptr; }
    [[nodiscard]] bool hasActiveRequest() const noexcept { return request_ != nullptr; }

    [[nodiscard]] DownloadProgress progress() const;

    // Cancels the in-flight request. No-op unless ACTIVE. The record fails
    // with ABORTED once the transport reports the cancellation.
    void abort();

    void whenStopped(StoppedCallback callback);

    SubscriptionId on(EventKind kind, EventHub::Listener listener);
    bool off(SubscriptionId id);
    [[nodiscard]] std::size_t listenerCount(EventKind kind) const noexcept {
        return events_.listenerCount(kind);
    }

private:
    friend class Downloader;
    friend class DownloadList;

    struct QueuePosition {
        DownloadList* list;
        std::list<Download*>::iterator node;
    };

    void emit(EventKind kind) const { events_.emit(kind, *this); }
    void settle();

    std::string gid_;
    std::string url_;
    std::string directory_;
    std::string file_name_;
    std::string origin_path_;
    std::string path_;
    int rename_count_{0};

    DownloadStatus status_{DownloadStatus::init};
    std::uint64_t total_length_{0};
    std::uint64_t completed_length_{0};
    std::uint64_t download_speed_{0};

    OverwritePolicy overwrite_{OverwritePolicy::fail_if_exists};
    Headers headers_;
    std::optional<TransportAgent> agent_;
    std::optional<DownloadError> error_;

    HttpRequestPtr request_;
    std::optional<QueuePosition> position_;

    EventHub events_;
    std::vector<StoppedCallback> stopped_callbacks_;
};

using DownloadPtr = std::shared_ptr<Download>;

} // namespace fetcher
