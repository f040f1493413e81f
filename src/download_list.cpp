#include "fetcher/download_list.hpp"

namespace fetcher {

DownloadList::~DownloadList() {
    for (Download* download : items_) {
        download->position_.reset();
    }
}

void DownloadList::pushBack(Download& download) {
    if (download.position_) {
        download.position_->list->remove(download);
    }
    const auto node = items_.insert(items_.end(), &download);
    download.position_ = Download::QueuePosition{this, node};
    inserted_.emit(download);
}

Download* DownloadList::popFront() {
    if (items_.empty()) {
        return nullptr;
    }
    Download* download = items_.front();
    remove(*download);
    return download;
}

bool DownloadList::remove(Download& download) {
    if (!download.position_ || download.position_->list != this) {
        return false;
    }
    const auto node = download.position_->node;
    download.position_.reset();
    items_.erase(node);
    removed_.emit(download);
    return true;
}

bool DownloadList::contains(const Download& download) const noexcept {
    return download.position_ && download.position_->list == this;
}

std::vector<DownloadPtr> DownloadList::toVector() const {
    std::vector<DownloadPtr> result;
    result.reserve(items_.size());
    for (Download* download : items_) {
        result.push_back(download->shared_from_this());
    }
    return result;
}

} // namespace fetcher
