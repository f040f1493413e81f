#include "fetcher/file_system.hpp"

#include <cerrno>
#include <cstdio>
#include <memory>

namespace fetcher {

namespace {

std::error_code lastError() {
    return {errno != 0 ? errno : EIO, std::generic_category()};
}

class StdioFile final : public OutputFile {
public:
    explicit StdioFile(std::FILE* fp) : file_(fp) {}

    ~StdioFile() override = default;

    std::error_code write(const char* data, std::size_t size) override {
        if (!file_) {
            return std::make_error_code(std::errc::bad_file_descriptor);
        }
        errno = 0;
        const std::size_t written = std::fwrite(data, 1, size, file_.get());
        if (written != size) {
            return lastError();
        }
        return {};
    }

    std::error_code close() override {
        if (!file_) {
            return {};
        }
        errno = 0;
        const int flushed = std::fflush(file_.get());
        std::FILE* fp = file_.release();
        const int closed = std::fclose(fp);
        if (flushed != 0 || closed != 0) {
            return lastError();
        }
        return {};
    }

private:
    struct FileDeleter {
        void operator()(std::FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::unique_ptr<std::FILE, FileDeleter> file_;
};

} // namespace

std::error_code LocalFileSystem::mkdirRecursive(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty()) {
        return ec;
    }
    std::filesystem::create_directories(path, ec);
    if (!ec && !std::filesystem::is_directory(path, ec)) {
        return std::make_error_code(std::errc::not_a_directory);
    }
    return ec;
}

bool LocalFileSystem::exists(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::uint64_t LocalFileSystem::statSize(const std::filesystem::path& path, std::error_code& ec) const {
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return 0;
    }
    return static_cast<std::uint64_t>(size);
}

std::unique_ptr<OutputFile> LocalFileSystem::openAppend(const std::filesystem::path& path,
                                                        std::error_code& ec) {
    ec.clear();
    errno = 0;
    std::FILE* fp = std::fopen(path.string().c_str(), "ab");
    if (!fp) {
        ec = lastError();
        return nullptr;
    }
    return std::make_unique<StdioFile>(fp);
}

std::error_code LocalFileSystem::deleteFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::remove(path, ec) && !ec) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return ec;
}

std::error_code LocalFileSystem::renameAtomic(const std::filesystem::path& from,
                                              const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    return ec;
}

} // namespace fetcher
