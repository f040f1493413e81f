#pragma once

#include "fetcher/download.hpp"
#include "fetcher/download_list.hpp"
#include "fetcher/events.hpp"
#include "fetcher/file_system.hpp"
#include "fetcher/http_client.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fetcher {

// Per-download overrides. Unset fields fall back to the Downloader settings.
struct DownloadOptions {
    std::optional<std::string> dir;
    std::optional<std::string> out;
    Headers headers;
    std::optional<OverwritePolicy> overwrite;
    std::optional<TransportAgent> agent;
    bool disable_agent{false};
};

struct DownloaderSettings {
    std::string directory{defaultDirectory()};
    std::size_t max_concurrent_downloads{1};
    Headers headers;
    std::optional<TransportAgent> agent;
    std::chrono::milliseconds speed_sample_interval{100};
    OverwritePolicy overwrite{OverwritePolicy::fail_if_exists};
    std::chrono::milliseconds response_timeout{10000};

    // $HOME/Download, or the working directory when HOME is unset.
    static std::string defaultDirectory();
};

// Owns every Download it creates and drives them through
// INIT -> ACTIVE/WAITING -> ... -> COMPLETE/ERROR/REMOVED.
//
// Single threaded: state changes only inside API calls and inside poll(),
// which is where transport callbacks are delivered.
class Downloader {
public:
    Downloader();
    Downloader(std::shared_ptr<HttpClient> http, std::shared_ptr<FileSystem> fs,
               DownloaderSettings settings = {});
    ~Downloader();

    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    DownloadPtr add(const std::string& url, const DownloadOptions& options = {});

    bool pause(const std::string& gid);
    bool pause(const DownloadPtr& download);
    void pauseAll();

    // False unless the record is PAUSED.
    bool unpause(const std::string& gid);
    bool unpause(const DownloadPtr& download);
    void unpauseAll();

    bool remove(const std::string& gid, bool delete_files = false);
    bool remove(const DownloadPtr& download, bool delete_files = false);
    void removeAll(bool delete_files = false);

    [[nodiscard]] std::vector<DownloadPtr> tellActive() const { return active_.toVector(); }
    [[nodiscard]] std::vector<DownloadPtr> tellWaiting() const { return waiting_.toVector(); }
    [[nodiscard]] std::vector<DownloadPtr> tellPaused() const { return paused_.toVector(); }
    [[nodiscard]] std::vector<DownloadPtr> tellCompleted() const { return completed_.toVector(); }
    [[nodiscard]] std::vector<DownloadPtr> tellFailed() const { return failed_.toVector(); }
    [[nodiscard]] std::vector<DownloadPtr> tellStopped() const;

    [[nodiscard]] std::size_t countActive() const noexcept { return active_.size(); }
    [[nodiscard]] std::size_t countWaiting() const noexcept { return waiting_.size(); }
    [[nodiscard]] std::size_t countPaused() const noexcept { return paused_.size(); }
    [[nodiscard]] std::size_t countCompleted() const noexcept { return completed_.size(); }
    [[nodiscard]] std::size_t countFailed() const noexcept { return failed_.size(); }
    [[nodiscard]] std::size_t countStopped() const noexcept {
        return completed_.size() + failed_.size();
    }

    // nullptr for an unknown or removed gid.
    [[nodiscard]] DownloadPtr tellStatus(const std::string& gid) const;

    // Throws std::invalid_argument for an unknown gid.
    void whenStopped(const std::string& gid, Download::StoppedCallback callback);

    // Polls until the record is terminal. Returns it on COMPLETE, throws its
    // DownloadError on ERROR/REMOVED and std::logic_error when it is PAUSED.
    DownloadPtr waitStopped(const std::string& gid);
    DownloadPtr waitStopped(const DownloadPtr& download);

    [[nodiscard]] const DownloaderSettings& settings() const noexcept { return settings_; }
    void setDirectory(std::string directory) { settings_.directory = std::move(directory); }
    void setHeaders(Headers headers) { settings_.headers = std::move(headers); }
    void setAgent(std::optional<TransportAgent> agent) { settings_.agent = std::move(agent); }
    void setSpeedSampleInterval(std::chrono::milliseconds interval) {
        settings_.speed_sample_interval = interval;
    }
    void setOverwritePolicy(OverwritePolicy policy) { settings_.overwrite = policy; }
    // Rejects 0 and anything below the current active count with
    // std::errc::invalid_argument. Raising the limit admits waiting records.
    std::error_code setMaxConcurrentDownloads(std::size_t limit);

    SubscriptionId on(EventKind kind, EventHub::Listener listener);
    bool off(SubscriptionId id);

    std::size_t poll(std::chrono::milliseconds timeout = std::chrono::milliseconds{100});
    void run();
    [[nodiscard]] bool hasPending() const noexcept { return !active_.empty() || !waiting_.empty(); }

private:
    class Transfer;

    DownloadPtr find(const std::string& gid) const;
    void enqueueOrActivate(Download& download);
    void activate(Download& download);
    void startTransfer(Download& download);
    void admitWaiting();
    void releaseTransfer(Download& download);

    void fail(Download& download, ErrorCode code, const std::string& message = {});
    void complete(Download& download);

    bool pauseRecord(Download& download);
    bool unpauseRecord(Download& download);
    bool removeRecord(Download& download, bool delete_files);

    [[nodiscard]] bool pathTracked(const Download& download) const;
    [[nodiscard]] bool pathBeingWritten(const Download& download) const;
    void renameNext(Download& download);

    void emit(EventKind kind, const Download& download) const;
    [[nodiscard]] bool wantsProgress(const Download& download) const noexcept;

    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<FileSystem> fs_;
    DownloaderSettings settings_;

    // Declared before the lists: they reference records owned here.
    std::unordered_map<std::string, DownloadPtr> downloads_;
    DownloadList active_;
    DownloadList waiting_;
    DownloadList paused_;
    DownloadList completed_;
    DownloadList failed_;
    std::unordered_map<const Download*, std::shared_ptr<Transfer>> transfers_;

    EventHub events_;
    bool admission_locked_{false};
    bool admitting_{false};
};

} // namespace fetcher
