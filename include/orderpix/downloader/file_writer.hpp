#pragma once

#include <orderpix/downloader/downloader.hpp>

#include <filesystem>
#include <fstream>
#include <span>

namespace orderpix::downloader {

/**
 * A file being written next to its final location.
 *
 * Bytes go to a uniquely named temporary file in the destination directory; commit() fsyncs
 * it and renames it over the final path. Destroying a PendingFile that was not committed
 * removes the temporary file, so the final name only ever refers to a complete file.
 */
class PendingFile {
public:
    PendingFile() = default;
    PendingFile(std::filesystem::path finalPath, std::filesystem::path tempPath,
                std::ofstream stream);
    ~PendingFile();

    PendingFile(const PendingFile&) = delete;
    PendingFile& operator=(const PendingFile&) = delete;
    PendingFile(PendingFile&& other) noexcept;
    PendingFile& operator=(PendingFile&& other) noexcept;

    Expected<void> append(std::span<const std::byte> data);
    Expected<std::filesystem::path> commit();
    void discard() noexcept;

    [[nodiscard]] bool active() const noexcept { return active_; }
    [[nodiscard]] const std::filesystem::path& finalPath() const noexcept { return finalPath_; }
    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return written_; }

private:
    std::filesystem::path finalPath_;
    std::filesystem::path tempPath_;
    std::ofstream stream_;
    std::uint64_t written_{0};
    bool active_{false};
};

/**
 * Atomic file persistence: temp file in the same directory, fsync, rename, fsync(dir).
 */
class FileWriter final : public IFileWriter {
public:
    // Create the temporary file for finalPath. The parent directory must already exist.
    Expected<PendingFile> open(const std::filesystem::path& finalPath) const;

    Expected<void> write(const std::filesystem::path& finalPath,
                         std::span<const std::byte> bytes) override;
};

// Name of the temporary file used for finalPath (".<name>.<unique>.part").
std::filesystem::path makeTempPath(const std::filesystem::path& finalPath);

} // namespace orderpix::downloader
