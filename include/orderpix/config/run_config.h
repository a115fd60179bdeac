#pragma once

#include <orderpix/downloader/downloader.hpp>
#include <orderpix/downloader/url_transformer.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orderpix::config {

using downloader::Expected;

inline constexpr std::string_view kDefaultBaseUrl = "https://portal.diakrit.com";
inline constexpr std::string_view kDefaultOutputDir = "downloaded_images";
inline constexpr std::string_view kDefaultLogFile = "image_downloader.log";
// Full-size images live under this path; thumbnails and page assets do not.
inline constexpr std::string_view kDefaultPathFilter = "/orderfiles/";
inline constexpr int kDefaultParallelWorkers = 5;
inline constexpr int kMaxWorkers = 64;

/**
 * Everything one run needs, built once at the boundary (defaults, then config file, then
 * command line) and checked by validate() before any network or filesystem work.
 */
struct RunConfig {
    std::string orderId;
    std::vector<std::string> extensions{".jpg"};
    std::filesystem::path outputDir{std::string(kDefaultOutputDir)};
    std::string baseUrl{kDefaultBaseUrl};
    std::string userAgent{downloader::kDefaultUserAgent};
    downloader::TlsConfig tls{};
    downloader::TransformConfig transform{};

    bool parallel{false};
    int workers{kDefaultParallelWorkers};
    int maxAttempts{3};
    std::chrono::milliseconds timeout{10000};
    std::chrono::milliseconds initialBackoff{1000};
    std::string pathFilter{kDefaultPathFilter}; // empty keeps every path
    bool skipExisting{false};

    bool logEnabled{false};
    std::filesystem::path logFile{std::string(kDefaultLogFile)};

    bool json{false};
    bool quiet{false};
    bool verbose{false};

    // Worker count actually used: `workers` with --parallel, otherwise 1.
    [[nodiscard]] int effectiveWorkers() const noexcept { return parallel ? workers : 1; }

    // Reject unusable values (InvalidArgument) and normalize the rest in place: order id
    // trimmed, extensions lowercased with a leading dot and de-duplicated, base URL without
    // trailing '/'.
    Expected<void> validate();
};

/**
 * Values found in a config file. Unset members were absent from the file.
 */
struct FileSettings {
    std::optional<std::string> baseUrl;
    std::optional<std::string> userAgent;
    std::optional<std::string> caFile;
    std::optional<std::filesystem::path> outputDir;
    std::optional<std::vector<std::string>> extensions;
    std::optional<int> workers;
    std::optional<int> maxAttempts;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::chrono::milliseconds> initialBackoff;
    std::optional<std::string> pathFilter;
    std::optional<std::filesystem::path> logFile;
};

// Read a config file. A missing file gives empty settings; a non-numeric number is an error.
Expected<FileSettings> loadFileSettings(const std::filesystem::path& path);

/**
 * Settings keys as they relate to command-line options, so the caller can skip values the
 * user already gave on the command line.
 */
enum class Setting {
    BaseUrl,
    UserAgent,
    CaFile,
    OutputDir,
    Extensions,
    Workers,
    MaxAttempts,
    Timeout,
    InitialBackoff,
    PathFilter,
    LogFile
};

// Copy file settings into cfg, except those for which setOnCommandLine(setting) is true.
template <typename Pred>
void applyFileSettings(RunConfig& cfg, const FileSettings& file, Pred&& setOnCommandLine) {
    auto take = [&](Setting s, const auto& from, auto& to) {
        if (from && !setOnCommandLine(s))
            to = *from;
    };
    take(Setting::BaseUrl, file.baseUrl, cfg.baseUrl);
    take(Setting::UserAgent, file.userAgent, cfg.userAgent);
    take(Setting::CaFile, file.caFile, cfg.tls.caPath);
    take(Setting::OutputDir, file.outputDir, cfg.outputDir);
    take(Setting::Extensions, file.extensions, cfg.extensions);
    take(Setting::Workers, file.workers, cfg.workers);
    take(Setting::MaxAttempts, file.maxAttempts, cfg.maxAttempts);
    take(Setting::Timeout, file.timeout, cfg.timeout);
    take(Setting::InitialBackoff, file.initialBackoff, cfg.initialBackoff);
    take(Setting::PathFilter, file.pathFilter, cfg.pathFilter);
    take(Setting::LogFile, file.logFile, cfg.logFile);
}

} // namespace orderpix::config
