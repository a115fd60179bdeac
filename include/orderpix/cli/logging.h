#pragma once

#include <orderpix/downloader/downloader.hpp>

#include <filesystem>
#include <optional>

namespace orderpix::cli {

inline constexpr const char* kConsolePattern = "[%H:%M:%S] [%l] %v";
inline constexpr const char* kFilePattern = "%Y-%m-%d %H:%M:%S,%e - %l - %v";

struct LogOptions {
    bool verbose{false};
    // Append run events to this file when set.
    std::optional<std::filesystem::path> file;
};

// Console-only default logger: stderr, warn (debug with verbose).
void configureConsoleLogging(bool verbose);

/**
 * Install the default spdlog logger: a stderr console sink (warn, or debug with verbose)
 * plus, when requested, an appending file sink at info level that flushes on every info
 * message. Fails with FilesystemError when the log file cannot be opened; the console
 * logger is still installed in that case.
 */
downloader::Expected<void> configureLogging(const LogOptions& options);

} // namespace orderpix::cli
