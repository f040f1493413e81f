#pragma once

#include <cstdint>
#include <string>

namespace fetcher {

struct DownloadProgress {
    std::string gid;
    std::string url;
    std::string path;
    std::uint64_t total_length{0};
    std::uint64_t completed_length{0};
    std::uint64_t download_speed{0};
    double percent{0.0};
};

} // namespace fetcher
