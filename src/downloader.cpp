#include "fetcher/downloader.hpp"

#include "fetcher/curl_http_client.hpp"
#include "fetcher/detail/path_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fetcher {

namespace {

// Sets a flag for the lifetime of a scope and restores its previous value,
// also when a listener throws.
class FlagGuard {
public:
    explicit FlagGuard(bool& flag) : flag_(flag), previous_(flag) { flag_ = true; }
    ~FlagGuard() { flag_ = previous_; }

    FlagGuard(const FlagGuard&) = delete;
    FlagGuard& operator=(const FlagGuard&) = delete;

private:
    bool& flag_;
    bool previous_;
};

} // namespace

// One activation of a download: the handler for its HTTP stream plus the
// partial file being appended to. A transfer is detached when the record
// leaves ACTIVE for any reason; late callbacks from the transport then only
// release the file.
class Downloader::Transfer final : public HttpStreamHandler {
public:
    Transfer(Downloader& owner, DownloadPtr download, std::uint64_t prior_length)
        : owner_(&owner), download_(std::move(download)), prior_length_(prior_length) {}

    void detach() {
        owner_ = nullptr;
        closeFile();
    }

    void onResponse(const HttpResponse& response) override {
        if (!owner_) {
            return;
        }
        Download& download = *download_;
        FileSystem& fs = *owner_->fs_;
        const std::filesystem::path partial{download.partialPath()};

        if (prior_length_ > 0 && response.status_code != 206) {
            spdlog::info("[{}] server ignored the range request (status {}), restarting from 0",
                         download.gid(), response.status_code);
            if (const auto ec = fs.deleteFile(partial)) {
                owner_->fail(download, ErrorCode::file_io, ec.message());
                return;
            }
            prior_length_ = 0;
        }

        content_length_ = response.content_length;
        download.total_length_ = prior_length_ + content_length_.value_or(0);
        download.completed_length_ = prior_length_;
        last_sample_time_ = std::chrono::steady_clock::now();
        last_sample_bytes_ = prior_length_;

        std::error_code ec;
        file_ = fs.openAppend(partial, ec);
        if (!file_) {
            spdlog::warn("[{}] cannot open {}: {}", download.gid(), partial.string(), ec.message());
            owner_->fail(download, ErrorCode::create_file_failed);
        }
    }

    bool onData(const char* data, std::size_t size) override {
        if (!owner_ || !file_) {
            return false;
        }
        Download& download = *download_;
        if (const auto ec = file_->write(data, size)) {
            owner_->fail(download, ErrorCode::file_io, ec.message());
            return false;
        }

        received_ += size;
        download.completed_length_ = prior_length_ + received_;
        sampleSpeed(download);

        if (owner_->wantsProgress(download)) {
            owner_->emit(EventKind::progress, download);
        }
        return true;
    }

    void onError(const HttpError& error) override {
        closeFile();
        if (!owner_) {
            return;
        }
        switch (error.kind) {
            case HttpErrorKind::timeout:
                owner_->fail(*download_, ErrorCode::timeout);
                return;
            case HttpErrorKind::too_many_redirects:
                owner_->fail(*download_, ErrorCode::too_many_redirects);
                return;
            case HttpErrorKind::cancelled:
                owner_->fail(*download_, ErrorCode::aborted);
                return;
            case HttpErrorKind::http_status:
                if (error.status_code == 403) {
                    owner_->fail(*download_, ErrorCode::auth_failed);
                } else if (error.status_code == 404) {
                    owner_->fail(*download_, ErrorCode::not_found);
                } else {
                    owner_->fail(*download_, ErrorCode::network, error.message);
                }
                return;
            case HttpErrorKind::network:
                owner_->fail(*download_, ErrorCode::network, error.message);
                return;
        }
    }

    void onEnd() override {
        if (!owner_) {
            closeFile();
            return;
        }
        Download& download = *download_;
        FileSystem& fs = *owner_->fs_;
        const std::filesystem::path partial{download.partialPath()};

        if (!file_) {
            owner_->fail(download, ErrorCode::unknown);
            return;
        }
        if (const auto ec = file_->close()) {
            owner_->fail(download, ErrorCode::file_io, ec.message());
            return;
        }

        std::error_code ec;
        const std::uint64_t size = fs.statSize(partial, ec);
        if (ec || size == 0) {
            if (!ec) {
                if (const auto delete_ec = fs.deleteFile(partial)) {
                    spdlog::warn("[{}] cannot delete empty {}: {}", download.gid(), partial.string(),
                                 delete_ec.message());
                }
            }
            owner_->fail(download, ErrorCode::unknown);
            return;
        }

        if (content_length_ && size != prior_length_ + *content_length_) {
            owner_->fail(download, ErrorCode::network,
                         fmt::format("Transfer truncated: received {} of {} bytes", size,
                                     prior_length_ + *content_length_));
            return;
        }

        download.completed_length_ = size;
        if (download.total_length_ == 0) {
            download.total_length_ = size;
        }

        if (const auto rename_ec = fs.renameAtomic(partial, download.path())) {
            spdlog::warn("[{}] rename {} failed: {}", download.gid(), partial.string(),
                         rename_ec.message());
            owner_->fail(download, ErrorCode::rename_failed);
            return;
        }
        owner_->complete(download);
    }

private:
    void closeFile() {
        if (file_) {
            if (const auto ec = file_->close()) {
                spdlog::warn("[{}] closing partial file failed: {}", download_->gid(), ec.message());
            }
            file_.reset();
        }
    }

    // Resamples at most once per interval, except for the first chunk and the
    // chunk that drains the response.
    void sampleSpeed(Download& download) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_sample_time_);
        const bool drained = content_length_ && received_ >= *content_length_;
        if (sampled_ && !drained && elapsed < owner_->settings_.speed_sample_interval) {
            return;
        }
        const double seconds = static_cast<double>(std::max<std::int64_t>(elapsed.count(), 1)) / 1000.0;
        const std::uint64_t advanced = download.completed_length_ - last_sample_bytes_;
        download.download_speed_ = static_cast<std::uint64_t>(static_cast<double>(advanced) / seconds);
        last_sample_time_ = now;
        last_sample_bytes_ = download.completed_length_;
        sampled_ = true;
    }

    Downloader* owner_;
    DownloadPtr download_;
    std::uint64_t prior_length_;
    std::uint64_t received_{0};
    std::optional<std::uint64_t> content_length_;
    std::unique_ptr<OutputFile> file_;

    std::chrono::steady_clock::time_point last_sample_time_{};
    std::uint64_t last_sample_bytes_{0};
    bool sampled_{false};
};

std::string DownloaderSettings::defaultDirectory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return (std::filesystem::path{home} / "Download").string();
    }
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    return ec ? std::string{"."} : cwd.string();
}

Downloader::Downloader()
    : Downloader(std::make_shared<CurlHttpClient>(), std::make_shared<LocalFileSystem>()) {}

Downloader::Downloader(std::shared_ptr<HttpClient> http, std::shared_ptr<FileSystem> fs,
                       DownloaderSettings settings)
    : http_(std::move(http)), fs_(std::move(fs)), settings_(std::move(settings)) {
    if (!http_ || !fs_) {
        throw std::invalid_argument("Downloader requires an HTTP client and a file system");
    }
    if (settings_.max_concurrent_downloads == 0) {
        settings_.max_concurrent_downloads = 1;
    }
    active_.removed().connect([this](Download&) {
        if (!admission_locked_) {
            admitWaiting();
        }
    });
}

Downloader::~Downloader() {
    for (auto& [download, transfer] : transfers_) {
        transfer->detach();
    }
    transfers_.clear();
    for (auto& [gid, download] : downloads_) {
        if (download->request_) {
            download->request_->cancel();
            download->request_.reset();
        }
    }
}

DownloadPtr Downloader::add(const std::string& url, const DownloadOptions& options) {
    const std::string dir = options.dir.value_or(settings_.directory);
    const std::string out = options.out.value_or(detail::fileNameFromUrl(url));

    auto download = std::make_shared<Download>(url, dir, out);
    download->overwrite_ = options.overwrite.value_or(settings_.overwrite);

    if (download->overwrite_ == OverwritePolicy::rename_on_conflict) {
        while (pathTracked(*download) || fs_->exists(download->path_)) {
            renameNext(*download);
        }
    }

    download->headers_ = settings_.headers;
    for (const auto& [name, value] : options.headers) {
        download->headers_[name] = value;
    }
    download->agent_ = mergeAgents(settings_.agent, options.agent, options.disable_agent);

    downloads_.emplace(download->gid(), download);
    spdlog::debug("[{}] added {} -> {}", download->gid(), url, download->path());

    enqueueOrActivate(*download);
    return download;
}

bool Downloader::pause(const std::string& gid) {
    const auto download = find(gid);
    if (!download) {
        spdlog::warn("pause: no download with gid {}", gid);
        return false;
    }
    return pauseRecord(*download);
}

bool Downloader::pause(const DownloadPtr& download) {
    return download && pauseRecord(*download);
}

void Downloader::pauseAll() {
    {
        // Active first so unpauseAll() restores the original order.
        const FlagGuard lock(admission_locked_);
        for (const auto& download : active_.toVector()) {
            pauseRecord(*download);
        }
        for (const auto& download : waiting_.toVector()) {
            pauseRecord(*download);
        }
    }
    admitWaiting();
}

bool Downloader::unpause(const std::string& gid) {
    const auto download = find(gid);
    if (!download) {
        spdlog::warn("unpause: no download with gid {}", gid);
        return false;
    }
    return unpauseRecord(*download);
}

bool Downloader::unpause(const DownloadPtr& download) {
    return download && unpauseRecord(*download);
}

void Downloader::unpauseAll() {
    {
        const FlagGuard lock(admission_locked_);
        for (const auto& download : paused_.toVector()) {
            unpauseRecord(*download);
        }
    }
    admitWaiting();
}

bool Downloader::remove(const std::string& gid, bool delete_files) {
    const auto download = find(gid);
    if (!download) {
        spdlog::warn("remove: no download with gid {}", gid);
        return false;
    }
    return removeRecord(*download, delete_files);
}

bool Downloader::remove(const DownloadPtr& download, bool delete_files) {
    return download && removeRecord(*download, delete_files);
}

void Downloader::removeAll(bool delete_files) {
    std::vector<DownloadPtr> all;
    all.reserve(downloads_.size());
    for (const auto& [gid, download] : downloads_) {
        all.push_back(download);
    }

    {
        const FlagGuard lock(admission_locked_);
        for (const auto& download : all) {
            removeRecord(*download, delete_files);
        }
    }
    admitWaiting();
}

std::vector<DownloadPtr> Downloader::tellStopped() const {
    auto stopped = completed_.toVector();
    auto failed = failed_.toVector();
    stopped.insert(stopped.end(), failed.begin(), failed.end());
    return stopped;
}

DownloadPtr Downloader::tellStatus(const std::string& gid) const {
    return find(gid);
}

void Downloader::whenStopped(const std::string& gid, Download::StoppedCallback callback) {
    const auto download = find(gid);
    if (!download) {
        throw std::invalid_argument("Can not find download with given gid: " + gid);
    }
    download->whenStopped(std::move(callback));
}

DownloadPtr Downloader::waitStopped(const std::string& gid) {
    const auto download = find(gid);
    if (!download) {
        throw std::invalid_argument("Can not find download with given gid: " + gid);
    }
    return waitStopped(download);
}

DownloadPtr Downloader::waitStopped(const DownloadPtr& download) {
    if (!download) {
        throw std::invalid_argument("waitStopped requires a download");
    }
    while (!download->isTerminal()) {
        if (download->status() == DownloadStatus::paused) {
            throw std::logic_error("Download " + download->gid() + " is paused");
        }
        poll();
    }
    if (download->status() != DownloadStatus::complete) {
        throw *download->error();
    }
    return download;
}

std::error_code Downloader::setMaxConcurrentDownloads(std::size_t limit) {
    if (limit == 0 || limit < active_.size()) {
        spdlog::warn("rejected maxConcurrentDownloads={} ({} downloads active)", limit,
                     active_.size());
        return std::make_error_code(std::errc::invalid_argument);
    }
    settings_.max_concurrent_downloads = limit;
    admitWaiting();
    return {};
}

SubscriptionId Downloader::on(EventKind kind, EventHub::Listener listener) {
    return events_.on(kind, std::move(listener));
}

bool Downloader::off(SubscriptionId id) {
    return events_.off(id);
}

std::size_t Downloader::poll(std::chrono::milliseconds timeout) {
    return http_->poll(timeout);
}

void Downloader::run() {
    while (hasPending()) {
        poll();
    }
}

DownloadPtr Downloader::find(const std::string& gid) const {
    const auto it = downloads_.find(gid);
    return it == downloads_.end() ? nullptr : it->second;
}

void Downloader::enqueueOrActivate(Download& download) {
    if (active_.size() < settings_.max_concurrent_downloads) {
        activate(download);
        return;
    }
    download.status_ = DownloadStatus::waiting;
    waiting_.pushBack(download);
    spdlog::debug("[{}] waiting ({} active)", download.gid(), active_.size());
    emit(EventKind::queue, download);
}

void Downloader::activate(Download& download) {
    download.status_ = DownloadStatus::active;
    download.download_speed_ = 0;
    active_.pushBack(download);
    spdlog::debug("[{}] active", download.gid());
    emit(EventKind::activate, download);
    startTransfer(download);
}

void Downloader::startTransfer(Download& download) {
    const std::filesystem::path target{download.path_};

    if (const auto ec = fs_->mkdirRecursive(target.parent_path())) {
        spdlog::warn("[{}] cannot create {}: {}", download.gid(), target.parent_path().string(),
                     ec.message());
        fail(download, ErrorCode::mkdir_failed);
        return;
    }

    switch (download.overwrite_) {
        case OverwritePolicy::fail_if_exists:
            if (fs_->exists(target) || pathBeingWritten(download)) {
                fail(download, ErrorCode::file_exists);
                return;
            }
            break;
        case OverwritePolicy::overwrite:
            if (fs_->exists(target)) {
                if (const auto ec = fs_->deleteFile(target)) {
                    fail(download, ErrorCode::file_io, ec.message());
                    return;
                }
            }
            break;
        case OverwritePolicy::rename_on_conflict:
            while (fs_->exists(download.path_) || pathTracked(download)) {
                renameNext(download);
            }
            break;
    }

    const std::filesystem::path partial{download.partialPath()};
    std::uint64_t prior_length = 0;
    Headers headers = download.headers_;
    if (fs_->exists(partial)) {
        std::error_code ec;
        const std::uint64_t size = fs_->statSize(partial, ec);
        if (!ec && size > 0) {
            prior_length = size;
            headers["Range"] = fmt::format("bytes={}-", size);
            spdlog::info("[{}] resuming from byte {}", download.gid(), size);
        }
    }
    download.completed_length_ = prior_length;

    auto transfer = std::make_shared<Transfer>(*this, download.shared_from_this(), prior_length);
    transfers_[&download] = transfer;

    HttpRequestOptions options;
    options.url = download.url_;
    options.headers = std::move(headers);
    options.agent = download.agent_;
    options.response_timeout = settings_.response_timeout;
    download.request_ = http_->streamFetch(options, transfer);
}

void Downloader::admitWaiting() {
    if (admitting_) {
        return;
    }
    const FlagGuard guard(admitting_);
    while (active_.size() < settings_.max_concurrent_downloads && !waiting_.empty()) {
        Download* next = waiting_.popFront();
        activate(*next);
    }
}

void Downloader::releaseTransfer(Download& download) {
    const auto it = transfers_.find(&download);
    if (it != transfers_.end()) {
        auto transfer = it->second;
        transfers_.erase(it);
        transfer->detach();
    }
    if (download.request_) {
        download.request_->cancel();
        download.request_.reset();
    }
}

void Downloader::fail(Download& download, ErrorCode code, const std::string& message) {
    if (download.status_ == DownloadStatus::complete || download.status_ == DownloadStatus::error) {
        return;
    }
    if (code == ErrorCode::ok) {
        complete(download);
        return;
    }

    const DownloadPtr keep = download.shared_from_this();
    releaseTransfer(download);
    download.download_speed_ = 0;
    download.status_ = DownloadStatus::error;
    download.error_.emplace(download.gid_, download.url_, download.path_, code, message);
    spdlog::warn("[{}] failed: {} ({})", download.gid(), download.error_->what(), toString(code));

    failed_.pushBack(download);
    emit(EventKind::fail, download);
    emit(EventKind::error, download);
    emit(EventKind::done, download);
    download.settle();
}

void Downloader::complete(Download& download) {
    if (download.status_ == DownloadStatus::complete || download.status_ == DownloadStatus::error) {
        return;
    }

    const DownloadPtr keep = download.shared_from_this();
    releaseTransfer(download);
    download.download_speed_ = 0;
    download.status_ = DownloadStatus::complete;
    download.error_.reset();
    spdlog::info("[{}] complete: {}", download.gid(), download.path());

    completed_.pushBack(download);
    emit(EventKind::complete, download);
    emit(EventKind::done, download);
    download.settle();
}

bool Downloader::pauseRecord(Download& download) {
    if (download.status_ != DownloadStatus::active && download.status_ != DownloadStatus::waiting) {
        return false;
    }
    releaseTransfer(download);
    download.status_ = DownloadStatus::paused;
    download.download_speed_ = 0;
    spdlog::debug("[{}] paused at {} bytes", download.gid(), download.completed_length_);

    paused_.pushBack(download);
    emit(EventKind::pause, download);
    return true;
}

bool Downloader::unpauseRecord(Download& download) {
    if (download.status_ != DownloadStatus::paused) {
        spdlog::warn("unpause: download {} is {}", download.gid(), toString(download.status_));
        return false;
    }
    emit(EventKind::unpause, download);
    enqueueOrActivate(download);
    return true;
}

bool Downloader::removeRecord(Download& download, bool delete_files) {
    if (download.status_ == DownloadStatus::removed) {
        return false;
    }

    const DownloadPtr keep = download.shared_from_this();
    const bool settled = download.isTerminal();
    releaseTransfer(download);

    if (!settled) {
        download.download_speed_ = 0;
        download.status_ = DownloadStatus::removed;
        download.error_.emplace(download.gid_, download.url_, download.path_, ErrorCode::aborted);
    }
    if (download.position_) {
        download.position_->list->remove(download);
    }

    if (delete_files) {
        for (const std::filesystem::path file : {std::filesystem::path{download.partialPath()},
                                                 std::filesystem::path{download.path_}}) {
            if (!fs_->exists(file)) {
                continue;
            }
            if (const auto ec = fs_->deleteFile(file)) {
                spdlog::warn("[{}] cannot delete {}: {}", download.gid(), file.string(), ec.message());
            }
        }
    }

    downloads_.erase(download.gid_);
    spdlog::debug("[{}] removed", download.gid());

    emit(EventKind::remove, download);
    if (!settled) {
        emit(EventKind::done, download);
        download.settle();
    }
    return true;
}

bool Downloader::pathTracked(const Download& download) const {
    return std::any_of(downloads_.begin(), downloads_.end(), [&download](const auto& entry) {
        return entry.second.get() != &download && entry.second->path_ == download.path_;
    });
}

bool Downloader::pathBeingWritten(const Download& download) const {
    return std::any_of(active_.begin(), active_.end(), [&download](const Download* other) {
        return other != &download && other->path_ == download.path_;
    });
}

void Downloader::renameNext(Download& download) {
    ++download.rename_count_;
    download.path_ = detail::numberedPath(download.origin_path_, download.rename_count_);
}

void Downloader::emit(EventKind kind, const Download& download) const {
    download.emit(kind);
    events_.emit(kind, download);
}

bool Downloader::wantsProgress(const Download& download) const noexcept {
    return download.listenerCount(EventKind::progress) > 0 ||
           events_.listenerCount(EventKind::progress) > 0;
}

} // namespace fetcher
