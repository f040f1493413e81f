#pragma once

#include "fetcher/download.hpp"
#include "fetcher/events.hpp"

#include <cstddef>
#include <list>
#include <vector>

namespace fetcher {

// FIFO of non-owned records. Each record remembers its own node, so removal
// from the middle is O(1) and a record sits in at most one list at a time:
// pushing it here first takes it out of whatever list held it.
class DownloadList {
public:
    using const_iterator = std::list<Download*>::const_iterator;

    DownloadList() = default;
    ~DownloadList();

    DownloadList(const DownloadList&) = delete;
    DownloadList& operator=(const DownloadList&) = delete;

    void pushBack(Download& download);
    Download* popFront();
    // No-op (returns false) when the record is not in this list.
    bool remove(Download& download);

    [[nodiscard]] bool contains(const Download& download) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] Download* front() const noexcept { return items_.empty() ? nullptr : items_.front(); }

    [[nodiscard]] const_iterator begin() const noexcept { return items_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return items_.end(); }

    [[nodiscard]] std::vector<DownloadPtr> toVector() const;

    Signal<Download&>& inserted() noexcept { return inserted_; }
    Signal<Download&>& removed() noexcept { return removed_; }

private:
    std::list<Download*> items_;
    Signal<Download&> inserted_;
    Signal<Download&> removed_;
};

} // namespace fetcher
