#include "fetcher/progress_panel.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

#include <fmt/format.h>

namespace fetcher {

ProgressPanel::ProgressPanel(const Downloader& downloader) : ProgressPanel(downloader, std::cout) {}

ProgressPanel::ProgressPanel(const Downloader& downloader, std::ostream& out)
    : downloader_(downloader), out_(out) {}

void ProgressPanel::redraw() {
    const auto panel = build();
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

std::string ProgressPanel::build() const {
    std::vector<DownloadPtr> downloads = downloader_.tellActive();
    for (auto&& group : {downloader_.tellWaiting(), downloader_.tellPaused(),
                         downloader_.tellCompleted(), downloader_.tellFailed()}) {
        downloads.insert(downloads.end(), group.begin(), group.end());
    }

    std::string panel;
    panel.reserve(downloads.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Downloads: {} active, {} waiting, {} paused, {} done, {} failed\n",
                         downloader_.countActive(), downloader_.countWaiting(),
                         downloader_.countPaused(), downloader_.countCompleted(),
                         downloader_.countFailed());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    for (const auto& download : downloads) {
        panel += formatLine(*download);
        panel.push_back('\n');
        total_all += download->totalLength();
        downloaded_all += download->completedLength();
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(ratio * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");
    return panel;
}

std::string ProgressPanel::formatLine(const Download& download) {
    std::string display_name = std::filesystem::path{download.path()}.filename().string();
    if (display_name.empty()) {
        display_name = download.path();
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    switch (download.status()) {
        case DownloadStatus::init:
        case DownloadStatus::waiting:
            return fmt::format("{:<20} [Waiting...]", display_name);
        case DownloadStatus::removed:
            return fmt::format("{:<20} [Removed]", display_name);
        case DownloadStatus::error:
            return fmt::format("{:<20}  ❌ {}", display_name,
                               download.error() ? download.error()->what() : "failed");
        default:
            break;
    }

    if (download.totalLength() == 0) {
        if (download.status() == DownloadStatus::complete) {
            return fmt::format("{:<20} ({})  ✅ Done", display_name,
                               formatSize(download.completedLength()));
        }
        return fmt::format("{:<20} [Initializing...]", display_name);
    }

    const double ratio = std::min(1.0, static_cast<double>(download.completedLength()) /
                                           static_cast<double>(download.totalLength()));
    const int percent = static_cast<int>(ratio * 100.0);
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? "█" : "░";
    }

    std::string line = fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent,
                                   formatSize(download.completedLength()),
                                   formatSize(download.totalLength()));
    switch (download.status()) {
        case DownloadStatus::active:
            line += fmt::format("  {}/s", formatSize(download.downloadSpeed()));
            break;
        case DownloadStatus::paused:
            line.append("  ⏸ Paused");
            break;
        case DownloadStatus::complete:
            line.append("  ✅ Done");
            break;
        default:
            break;
    }
    return line;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

} // namespace fetcher
