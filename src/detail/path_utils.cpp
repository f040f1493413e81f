#include "fetcher/detail/path_utils.hpp"

#include <filesystem>

#include <fmt/format.h>

namespace fetcher::detail {

std::string fileNameFromUrl(const std::string& url) {
    std::string rest = url;
    const auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        rest = rest.substr(scheme + 3);
        const auto slash = rest.find('/');
        rest = slash == std::string::npos ? std::string{} : rest.substr(slash);
    }

    const auto cut = rest.find_first_of("?#");
    if (cut != std::string::npos) {
        rest.resize(cut);
    }

    const auto last_slash = rest.find_last_of('/');
    std::string name = last_slash == std::string::npos ? rest : rest.substr(last_slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return "index.html";
    }
    return name;
}

std::string numberedPath(const std::string& origin_path, int n) {
    const std::filesystem::path origin{origin_path};
    const std::string name = fmt::format("{} ({}){}", origin.stem().string(), n,
                                         origin.extension().string());
    return (origin.parent_path() / name).string();
}

} // namespace fetcher::detail
