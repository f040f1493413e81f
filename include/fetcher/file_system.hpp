#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <system_error>

namespace fetcher {

class OutputFile {
public:
    virtual ~OutputFile() = default;

    virtual std::error_code write(const char* data, std::size_t size) = 0;
    // Flushes and releases the file. Safe to call more than once.
    virtual std::error_code close() = 0;
};

// File-system primitives used by the download engine. Failures are reported
// through std::error_code, never thrown.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual std::error_code mkdirRecursive(const std::filesystem::path& path) = 0;
    [[nodiscard]] virtual bool exists(const std::filesystem::path& path) const = 0;
    virtual std::uint64_t statSize(const std::filesystem::path& path, std::error_code& ec) const = 0;
    virtual std::unique_ptr<OutputFile> openAppend(const std::filesystem::path& path,
                                                   std::error_code& ec) = 0;
    virtual std::error_code deleteFile(const std::filesystem::path& path) = 0;
    virtual std::error_code renameAtomic(const std::filesystem::path& from,
                                         const std::filesystem::path& to) = 0;
};

class LocalFileSystem final : public FileSystem {
public:
    std::error_code mkdirRecursive(const std::filesystem::path& path) override;
    [[nodiscard]] bool exists(const std::filesystem::path& path) const override;
    std::uint64_t statSize(const std::filesystem::path& path, std::error_code& ec) const override;
    std::unique_ptr<OutputFile> openAppend(const std::filesystem::path& path,
                                           std::error_code& ec) override;
    std::error_code deleteFile(const std::filesystem::path& path) override;
    std::error_code renameAtomic(const std::filesystem::path& from,
                                 const std::filesystem::path& to) override;
};

} // namespace fetcher
