#pragma once

#include "fetcher/download.hpp"
#include "fetcher/downloader.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace fetcher {

// Terminal view of a Downloader, redrawn in place with ANSI cursor movement.
class ProgressPanel {
public:
    explicit ProgressPanel(const Downloader& downloader);
    ProgressPanel(const Downloader& downloader, std::ostream& out);

    void redraw();
    [[nodiscard]] std::string build() const;

    static std::string formatLine(const Download& download);
    static std::string formatSize(std::uint64_t bytes);

private:
    const Downloader& downloader_;
    std::ostream& out_;
    std::size_t previous_lines_{0};
};

} // namespace fetcher
