#pragma once

#include <orderpix/downloader/downloader.hpp>
#include <orderpix/downloader/link_extractor.hpp>
#include <orderpix/downloader/retry.hpp>
#include <orderpix/downloader/url_transformer.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace orderpix::downloader {

/**
 * Per-task lifecycle. Pending -> InFlight -> {Succeeded | Retrying | Failed};
 * Retrying -> InFlight. Succeeded and Failed are terminal. A task never started
 * because the run was cancelled ends Failed with Outcome::Cancelled.
 */
enum class TaskStatus { Pending, InFlight, Retrying, Succeeded, Failed };

enum class Outcome { Succeeded, Skipped, Failed, Cancelled };

constexpr const char* taskStatusName(TaskStatus s) {
    switch (s) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::InFlight: return "in-flight";
        case TaskStatus::Retrying: return "retrying";
        case TaskStatus::Succeeded: return "succeeded";
        case TaskStatus::Failed: return "failed";
    }
    return "unknown";
}

constexpr const char* outcomeName(Outcome o) {
    switch (o) {
        case Outcome::Succeeded: return "succeeded";
        case Outcome::Skipped: return "skipped";
        case Outcome::Failed: return "failed";
        case Outcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

struct DownloadTask {
    std::size_t index{0};           // discovery order
    std::string originalUrl;        // as extracted
    std::string sourceUrl;          // after UrlTransformer
    std::filesystem::path targetPath;
    int attempts{0};
    TaskStatus status{TaskStatus::Pending};
};

struct DownloadResult {
    DownloadTask task;
    Outcome outcome{Outcome::Failed};
    std::optional<Error> error{};
    std::uint64_t bytes{0};
    std::chrono::milliseconds elapsed{0};
};

struct SchedulerOptions {
    int workers{1};
    RetryPolicy retry{};
    std::chrono::milliseconds timeout{10000}; // per HTTP request
    std::vector<Header> headers;
    TlsConfig tls{};
    TransformConfig transform{};
    bool skipExisting{false};
};

using ProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;

/**
 * Bounded-concurrency download executor.
 *
 * A pool of `workers` threads pulls tasks from a shared queue. Each task is fetched with
 * its own retry budget and handed to the IFileWriter on success. One task's failure never
 * affects its siblings. Once shouldCancel() returns true no further task is dequeued;
 * tasks already in flight run to completion and the rest are reported as Cancelled.
 *
 * Results are returned in discovery order regardless of completion order. The progress
 * callback is invoked once per finished task with a strictly increasing completed count.
 */
class DownloadScheduler {
public:
    DownloadScheduler(std::shared_ptr<IHttpTransport> transport,
                      std::shared_ptr<IFileWriter> writer, SchedulerOptions options,
                      Sleeper sleeper = {});

    // Build the task list: transformed URL and a collision-free target path per reference.
    [[nodiscard]] std::vector<DownloadTask> plan(const std::vector<ImageReference>& refs,
                                                 const std::filesystem::path& outputDir) const;

    [[nodiscard]] std::vector<DownloadResult> run(const std::vector<ImageReference>& refs,
                                                  const std::filesystem::path& outputDir,
                                                  const ProgressCallback& onProgress = {},
                                                  const ShouldCancel& shouldCancel = {});

    [[nodiscard]] const SchedulerOptions& options() const noexcept { return options_; }

private:
    DownloadResult execute(DownloadTask task);

    std::shared_ptr<IHttpTransport> transport_;
    std::shared_ptr<IFileWriter> writer_;
    SchedulerOptions options_;
    UrlTransformer transformer_;
    Sleeper sleeper_;
};

/**
 * File name for a reference: last path segment of the URL, percent-decoded, with path
 * separators and control characters replaced by '_'. Falls back to "image<ext>" when the
 * segment is empty.
 */
[[nodiscard]] std::string targetFileName(std::string_view url, std::string_view extension = {});

/**
 * Resolves name collisions deterministically in call order: first claimant keeps the name,
 * later ones get "<stem>_1<ext>", "<stem>_2<ext>", ... skipping names already claimed.
 */
class FileNameAllocator {
public:
    std::string claim(const std::string& name);

private:
    std::unordered_set<std::string> claimed_;
};

} // namespace orderpix::downloader
