/*
 * orderpix/src/downloader/file_writer.cpp
 *
 * FileWriter implementation:
 * - Temporary file in the destination directory (same filesystem, so rename is atomic)
 * - fsync of the temporary file before rename, fsync of the directory after
 * - Temporary file removed on every failure path and when a PendingFile is abandoned
 */

#include <orderpix/downloader/file_writer.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <string>
#include <system_error>

#if defined(_WIN32)
#define NOMINMAX
#include <Windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace orderpix::downloader {

namespace fs = std::filesystem;

// ---------- Helpers (platform-specific sync) ----------

static Expected<void> fsync_file(const fs::path& p) {
#if defined(_WIN32)
    HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::FilesystemError, "CreateFile failed for fsync: " + p.string()};
    }
    if (!FlushFileBuffers(h)) {
        CloseHandle(h);
        return Error{ErrorCode::FilesystemError, "FlushFileBuffers failed for: " + p.string()};
    }
    CloseHandle(h);
    return Expected<void>{};
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::FilesystemError, "open() failed for fsync: " + p.string()};
    }
#if defined(__APPLE__)
    // On macOS, F_FULLFSYNC is stricter than fsync; do both, tolerating failures.
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::FilesystemError, "fsync() failed for: " + p.string()};
    }
#endif
    ::close(fd);
    return Expected<void>{};
#endif
}

static Expected<void> fsync_dir(const fs::path& dir) {
#if defined(_WIN32)
    // Directory entries are durable once MoveFileEx returns on NTFS.
    (void)dir;
    return Expected<void>{};
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::FilesystemError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::FilesystemError, "fsync(dir) failed for: " + dir.string()};
    }
    ::close(fd);
    return Expected<void>{};
#endif
}

fs::path makeTempPath(const fs::path& finalPath) {
    static std::atomic<std::uint64_t> counter{0};
    auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      std::chrono::steady_clock::now().time_since_epoch())
                      .count();
    std::string fn = ".";
    fn += finalPath.filename().string();
    fn += "." + std::to_string(now_ns) + "-" +
          std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
    fn += ".part";
    return finalPath.parent_path() / fn;
}

// ---------- PendingFile ----------

PendingFile::PendingFile(fs::path finalPath, fs::path tempPath, std::ofstream stream)
    : finalPath_(std::move(finalPath)), tempPath_(std::move(tempPath)),
      stream_(std::move(stream)), active_(true) {}

PendingFile::~PendingFile() {
    discard();
}

PendingFile::PendingFile(PendingFile&& other) noexcept
    : finalPath_(std::move(other.finalPath_)), tempPath_(std::move(other.tempPath_)),
      stream_(std::move(other.stream_)), written_(other.written_), active_(other.active_) {
    other.active_ = false;
    other.written_ = 0;
}

PendingFile& PendingFile::operator=(PendingFile&& other) noexcept {
    if (this != &other) {
        discard();
        finalPath_ = std::move(other.finalPath_);
        tempPath_ = std::move(other.tempPath_);
        stream_ = std::move(other.stream_);
        written_ = other.written_;
        active_ = other.active_;
        other.active_ = false;
        other.written_ = 0;
    }
    return *this;
}

Expected<void> PendingFile::append(std::span<const std::byte> data) {
    if (!active_) {
        return Error{ErrorCode::FilesystemError, "append on inactive file: " + finalPath_.string()};
    }
    if (data.empty())
        return Expected<void>{};
    stream_.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    if (!stream_.good()) {
        Error err{ErrorCode::FilesystemError, "write failed on: " + tempPath_.string()};
        discard();
        return err;
    }
    written_ += static_cast<std::uint64_t>(data.size());
    return Expected<void>{};
}

Expected<fs::path> PendingFile::commit() {
    if (!active_) {
        return Error{ErrorCode::FilesystemError, "commit on inactive file: " + finalPath_.string()};
    }

    stream_.flush();
    const bool flushed = stream_.good();
    stream_.close();
    if (!flushed || stream_.fail()) {
        Error err{ErrorCode::FilesystemError, "flush/close failed on: " + tempPath_.string()};
        discard();
        return err;
    }

    auto synced = fsync_file(tempPath_);
    if (!synced.ok()) {
        Error err = synced.error();
        discard();
        return err;
    }

    std::error_code ec;
    fs::rename(tempPath_, finalPath_, ec);
    if (ec) {
        Error err{ErrorCode::FilesystemError, "rename() failed (" + ec.message() + ") from " +
                                                  tempPath_.string() + " to " +
                                                  finalPath_.string()};
        discard();
        return err;
    }
    active_ = false;

    auto dirSynced = fsync_dir(finalPath_.parent_path());
    if (!dirSynced.ok()) {
        spdlog::debug("fsync on output dir failed (continuing): {}", dirSynced.error().message);
    }
    return finalPath_;
}

void PendingFile::discard() noexcept {
    if (!active_)
        return;
    active_ = false;
    if (stream_.is_open()) {
        stream_.close();
    }
    std::error_code ec;
    fs::remove(tempPath_, ec);
    if (ec) {
        spdlog::debug("discard: failed to remove temporary file {}: {}", tempPath_.string(),
                      ec.message());
    }
}

// ---------- FileWriter ----------

Expected<PendingFile> FileWriter::open(const fs::path& finalPath) const {
    if (finalPath.filename().empty()) {
        return Error{ErrorCode::InvalidArgument, "Target path has no file name: " +
                                                     finalPath.string()};
    }
    auto dir = finalPath.parent_path();
    std::error_code ec;
    if (!dir.empty() && !fs::is_directory(dir, ec)) {
        return Error{ErrorCode::FilesystemError, "Output directory does not exist: " +
                                                     dir.string()};
    }

    fs::path tempPath = makeTempPath(finalPath);
    std::ofstream os(tempPath, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!os.good()) {
        return Error{ErrorCode::FilesystemError,
                     "Failed to create temporary file: " + tempPath.string()};
    }
    return PendingFile(finalPath, std::move(tempPath), std::move(os));
}

Expected<void> FileWriter::write(const fs::path& finalPath, std::span<const std::byte> bytes) {
    auto opened = open(finalPath);
    if (!opened.ok()) {
        return opened.error();
    }
    PendingFile file = std::move(opened).value();
    auto appended = file.append(bytes);
    if (!appended.ok()) {
        return appended;
    }
    auto committed = file.commit();
    if (!committed.ok()) {
        return committed.error();
    }
    spdlog::debug("Wrote {} bytes to {}", bytes.size(), finalPath.string());
    return Expected<void>{};
}

} // namespace orderpix::downloader
