#include "fetcher/download.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <random>
#include <utility>

#include <fmt/format.h>

namespace fetcher {

namespace {

// 4 bytes of seconds, 5 random bytes, 3 bytes of counter, hex encoded.
std::string generateGid() {
    static std::atomic<std::uint32_t> counter{std::random_device{}()};
    static thread_local std::mt19937_64 engine{std::random_device{}()};

    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
    const std::uint64_t random = engine() & 0xFFFFFFFFFFULL;
    const std::uint32_t sequence = counter.fetch_add(1) & 0xFFFFFFU;

    return fmt::format("{:08x}{:010x}{:06x}", static_cast<std::uint32_t>(seconds), random, sequence);
}

} // namespace

const char* toString(DownloadStatus status) noexcept {
    switch (status) {
        case DownloadStatus::init:     return "INIT";
        case DownloadStatus::active:   return "ACTIVE";
        case DownloadStatus::waiting:  return "WAITING";
        case DownloadStatus::paused:   return "PAUSED";
        case DownloadStatus::error:    return "ERROR";
        case DownloadStatus::complete: return "COMPLETE";
        case DownloadStatus::removed:  return "REMOVED";
    }
    return "UNKNOWN";
}

const char* toString(OverwritePolicy policy) noexcept {
    switch (policy) {
        case OverwritePolicy::fail_if_exists:     return "fail";
        case OverwritePolicy::overwrite:          return "overwrite";
        case OverwritePolicy::rename_on_conflict: return "rename";
    }
    return "unknown";
}

bool isTerminal(DownloadStatus status) noexcept {
    return status == DownloadStatus::complete || status == DownloadStatus::error ||
           status == DownloadStatus::removed;
}

Download::Download(std::string url, std::string directory, std::string file_name)
    : gid_(generateGid()),
      url_(std::move(url)),
      directory_(std::move(directory)),
      file_name_(std::move(file_name)) {
    origin_path_ = (std::filesystem::path{directory_} / file_name_).string();
    path_ = origin_path_;
}

DownloadProgress Download::progress() const {
    DownloadProgress snapshot;
    snapshot.gid = gid_;
    snapshot.url = url_;
    snapshot.path = path_;
    snapshot.total_length = total_length_;
    snapshot.completed_length = completed_length_;
    snapshot.download_speed = download_speed_;
    snapshot.percent = total_length_ == 0
                           ? 0.0
                           : 100.0 * static_cast<double>(completed_length_) /
                                 static_cast<double>(total_length_);
    return snapshot;
}

void Download::abort() {
    if (status_ != DownloadStatus::active || !request_) {
        return;
    }
    request_->cancel();
}

void Download::whenStopped(StoppedCallback callback) {
    if (!callback) {
        return;
    }
    if (isTerminal()) {
        callback(*this, status_ == DownloadStatus::complete ? nullptr : error());
        return;
    }
    stopped_callbacks_.push_back(std::move(callback));
}

SubscriptionId Download::on(EventKind kind, EventHub::Listener listener) {
    return events_.on(kind, std::move(listener));
}

bool Download::off(SubscriptionId id) {
    return events_.off(id);
}

void Download::settle() {
    auto callbacks = std::move(stopped_callbacks_);
    stopped_callbacks_.clear();
    const DownloadError* failure = status_ == DownloadStatus::complete ? nullptr : error();
    for (auto& callback : callbacks) {
        callback(*this, failure);
    }
}

} // namespace fetcher
