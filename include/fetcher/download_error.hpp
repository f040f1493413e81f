#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace fetcher {

enum class ErrorCode {
    ok = 0,
    unknown = 1,
    timeout = 2,
    not_found = 3,
    network = 6,
    file_exists = 13,
    rename_failed = 14,
    create_file_failed = 16,
    file_io = 17,
    mkdir_failed = 18,
    too_many_redirects = 23,
    auth_failed = 24,
    aborted = 31,
};

[[nodiscard]] const char* defaultMessage(ErrorCode code) noexcept;
[[nodiscard]] const char* toString(ErrorCode code) noexcept;

const std::error_category& download_category() noexcept;

inline std::error_code make_error_code(ErrorCode code) noexcept {
    return {static_cast<int>(code), download_category()};
}

// Terminal failure of one download. Immutable once built.
class DownloadError : public std::runtime_error {
public:
    DownloadError(std::string gid, std::string url, std::string path, ErrorCode code);
    DownloadError(std::string gid, std::string url, std::string path, ErrorCode code,
                  const std::string& message);

    [[nodiscard]] const std::string& gid() const noexcept { return gid_; }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::error_code errorCode() const noexcept { return make_error_code(code_); }

private:
    std::string gid_;
    std::string url_;
    std::string path_;
    ErrorCode code_;
};

} // namespace fetcher

namespace std {
template <>
struct is_error_code_enum<fetcher::ErrorCode> : true_type {};
} // namespace std
