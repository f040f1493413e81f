#include "fetcher/download_error.hpp"

#include <utility>

namespace fetcher {

namespace {

class DownloadCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "fetcher.download"; }

    [[nodiscard]] std::string message(int ev) const override {
        return defaultMessage(static_cast<ErrorCode>(ev));
    }
};

} // namespace

const char* defaultMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ok:                 return "";
        case ErrorCode::unknown:            return "Unknown error occurred";
        case ErrorCode::timeout:            return "Timeout occurred";
        case ErrorCode::not_found:          return "Resource was not found";
        case ErrorCode::network:            return "Network problem occurred";
        case ErrorCode::file_exists:        return "File already existed";
        case ErrorCode::rename_failed:      return "Renaming file failed";
        case ErrorCode::create_file_failed: return "Can not create new file";
        case ErrorCode::file_io:            return "File I/O error occurred";
        case ErrorCode::mkdir_failed:       return "Can not create directory";
        case ErrorCode::too_many_redirects: return "Too many redirects occurred";
        case ErrorCode::auth_failed:        return "Authorization failed";
        case ErrorCode::aborted:            return "Download aborted";
    }
    return "Unknown error";
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ok:                 return "OK";
        case ErrorCode::unknown:            return "UNKNOWN";
        case ErrorCode::timeout:            return "TIMEOUT";
        case ErrorCode::not_found:          return "NOT_FOUND";
        case ErrorCode::network:            return "NETWORK";
        case ErrorCode::file_exists:        return "FILE_EXISTS";
        case ErrorCode::rename_failed:      return "RENAME_FAILED";
        case ErrorCode::create_file_failed: return "CREATE_FILE_FAILED";
        case ErrorCode::file_io:            return "FILE_IO";
        case ErrorCode::mkdir_failed:       return "MKDIR_FAILED";
        case ErrorCode::too_many_redirects: return "TOO_MANY_REDIRECTS";
        case ErrorCode::auth_failed:        return "AUTH_FAILED";
        case ErrorCode::aborted:            return "ABORTED";
    }
    return "UNKNOWN";
}

const std::error_category& download_category() noexcept {
    static DownloadCategory category;
    return category;
}

DownloadError::DownloadError(std::string gid, std::string url, std::string path, ErrorCode code)
    : DownloadError(std::move(gid), std::move(url), std::move(path), code, defaultMessage(code)) {}

DownloadError::DownloadError(std::string gid, std::string url, std::string path, ErrorCode code,
                             const std::string& message)
    : std::runtime_error(message.empty() ? std::string{defaultMessage(code)} : message),
      gid_(std::move(gid)),
      url_(std::move(url)),
      path_(std::move(path)),
      code_(code) {}

} // namespace fetcher
