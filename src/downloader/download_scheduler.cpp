/*
 * orderpix/src/downloader/download_scheduler.cpp
 *
 * DownloadScheduler:
 * - plan(): UrlTransformer per reference + collision-free target names in discovery order
 * - run(): fixed pool of K workers (boost::asio::thread_pool) draining a shared task queue
 * - execute(): per-task retry/backoff around IHttpTransport::get, then IFileWriter::write
 * - Completion counter and progress callback are serialized; results land in their
 *   discovery-order slot so no aggregation lock is needed
 */

#include <orderpix/downloader/download_scheduler.hpp>
#include <orderpix/downloader/url_utils.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <exception>
#include <mutex>
#include <system_error>

namespace orderpix::downloader {

namespace fs = std::filesystem;

namespace {

std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

bool isUnsafeFileNameChar(unsigned char c) {
    if (c < 0x20 || c == 0x7F)
        return true;
    switch (c) {
        case '/':
        case '\\':
        case ':':
        case '*':
        case '?':
        case '"':
        case '<':
        case '>':
        case '|':
            return true;
        default:
            return false;
    }
}

// Path of a URL without relying on it being well-formed.
std::string rawPath(std::string_view url) {
    auto path = urlPath(url);
    if (!path.empty())
        return path;
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos)
        url = url.substr(0, cut);
    return std::string(url);
}

} // namespace

// ---- File naming ----

std::string targetFileName(std::string_view url, std::string_view extension) {
    std::string name = percentDecode(lastPathSegment(rawPath(url)));
    for (auto& ch : name) {
        if (isUnsafeFileNameChar(static_cast<unsigned char>(ch)))
            ch = '_';
    }
    if (name.empty() || name == "." || name == "..") {
        name = "image";
        name += normalizeExtension(extension);
    }
    return name;
}

std::string FileNameAllocator::claim(const std::string& name) {
    // Keyed case-insensitively so two names never alias on case-folding filesystems.
    if (claimed_.insert(toLower(name)).second)
        return name;

    const fs::path p(name);
    const std::string stem = p.stem().string();
    const std::string ext = p.extension().string();
    for (std::size_t n = 1;; ++n) {
        std::string candidate = stem + "_" + std::to_string(n) + ext;
        if (claimed_.insert(toLower(candidate)).second)
            return candidate;
    }
}

// ---- DownloadScheduler ----

DownloadScheduler::DownloadScheduler(std::shared_ptr<IHttpTransport> transport,
                                     std::shared_ptr<IFileWriter> writer,
                                     SchedulerOptions options, Sleeper sleeper)
    : transport_(std::move(transport)), writer_(std::move(writer)),
      options_(std::move(options)), transformer_(options_.transform),
      sleeper_(std::move(sleeper)) {}

std::vector<DownloadTask> DownloadScheduler::plan(const std::vector<ImageReference>& refs,
                                                  const fs::path& outputDir) const {
    std::vector<DownloadTask> tasks;
    tasks.reserve(refs.size());
    FileNameAllocator names;
    for (std::size_t i = 0; i < refs.size(); ++i) {
        const auto& ref = refs[i];
        DownloadTask task;
        task.index = i;
        task.originalUrl = ref.url;
        task.sourceUrl = transformer_.transform(ref.url);
        task.targetPath = outputDir / names.claim(targetFileName(ref.url, ref.extension));
        if (task.sourceUrl != task.originalUrl) {
            spdlog::debug("Rewrote {} -> {}", task.originalUrl, task.sourceUrl);
        }
        tasks.push_back(std::move(task));
    }
    return tasks;
}

DownloadResult DownloadScheduler::execute(DownloadTask task) {
    const auto started = std::chrono::steady_clock::now();
    DownloadResult result;

    auto finish = [&](Outcome outcome) {
        result.outcome = outcome;
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        result.task = std::move(task);
        return std::move(result);
    };

    if (options_.skipExisting) {
        std::error_code ec;
        if (fs::exists(task.targetPath, ec)) {
            spdlog::info("Already exists: {}", task.targetPath.string());
            task.status = TaskStatus::Succeeded;
            return finish(Outcome::Skipped);
        }
    }

    HttpRequest request;
    request.url = task.sourceUrl;
    request.headers = options_.headers;
    request.timeout = options_.timeout;
    request.tls = options_.tls;

    int attempts = 0;
    auto fetched = retryWithBackoff<HttpResponse>(
        options_.retry, sleeper_,
        [&](int attempt) {
            task.status = TaskStatus::InFlight;
            task.attempts = attempt;
            return transport_->get(request);
        },
        [&](int attempt, const Error& err, std::chrono::milliseconds delay) {
            task.status = TaskStatus::Retrying;
            spdlog::warn("Attempt {}/{} for {} failed ({}); retrying in {} ms", attempt,
                         options_.retry.maxAttempts, task.sourceUrl, err.message, delay.count());
        },
        attempts);
    task.attempts = attempts;

    if (!fetched.ok()) {
        Error err = fetched.error();
        if (isTransient(err)) {
            err.message = "Giving up after " + std::to_string(attempts) +
                          " attempts: " + err.message;
        }
        spdlog::error("Failed to download {}: {}", task.sourceUrl, err.message);
        task.status = TaskStatus::Failed;
        result.error = std::move(err);
        return finish(Outcome::Failed);
    }

    const auto response = std::move(fetched).value();
    auto written = writer_->write(task.targetPath, response.body);
    if (!written.ok()) {
        Error err = written.error();
        err.code = ErrorCode::FilesystemError;
        spdlog::error("Failed to save {}: {}", task.targetPath.string(), err.message);
        task.status = TaskStatus::Failed;
        result.error = std::move(err);
        return finish(Outcome::Failed);
    }

    result.bytes = response.body.size();
    spdlog::info("Downloaded: {} ({} bytes)", task.targetPath.string(), result.bytes);
    task.status = TaskStatus::Succeeded;
    return finish(Outcome::Succeeded);
}

std::vector<DownloadResult> DownloadScheduler::run(const std::vector<ImageReference>& refs,
                                                   const fs::path& outputDir,
                                                   const ProgressCallback& onProgress,
                                                   const ShouldCancel& shouldCancel) {
    auto tasks = plan(refs, outputDir);
    const std::size_t total = tasks.size();
    std::vector<DownloadResult> results(total);
    if (total == 0)
        return results;

    if (!transport_ || !writer_) {
        for (auto& task : tasks) {
            task.status = TaskStatus::Failed;
            results[task.index] = DownloadResult{
                task, Outcome::Failed,
                Error{ErrorCode::InvalidArgument, "Scheduler is missing a transport or writer"}};
        }
        return results;
    }

    std::deque<DownloadTask> queue(std::make_move_iterator(tasks.begin()),
                                   std::make_move_iterator(tasks.end()));
    std::mutex queueMutex;
    bool stopRequested = false;

    std::mutex progressMutex;
    std::atomic<std::size_t> completed{0};

    // A predicate that throws is treated as a stop request.
    auto cancelRequested = [&]() {
        if (!shouldCancel)
            return false;
        try {
            return shouldCancel();
        } catch (const std::exception& ex) {
            spdlog::error("Cancellation check raised: {}; stopping", ex.what());
            return true;
        }
    };

    auto worker = [&]() {
        for (;;) {
            // Evaluated outside queueMutex so a slow predicate never blocks other workers.
            const bool cancel = cancelRequested();
            DownloadTask task;
            {
                std::lock_guard<std::mutex> lk(queueMutex);
                if (queue.empty() || stopRequested)
                    return;
                if (cancel) {
                    stopRequested = true;
                    spdlog::warn("Stop requested; {} task(s) will not be started", queue.size());
                    return;
                }
                task = std::move(queue.front());
                queue.pop_front();
            }

            const std::size_t index = task.index;
            DownloadTask snapshot = task;
            try {
                results[index] = execute(std::move(task));
            } catch (const std::exception& ex) {
                snapshot.status = TaskStatus::Failed;
                results[index] = DownloadResult{
                    snapshot, Outcome::Failed,
                    Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()}};
                spdlog::error("Download of {} raised: {}", snapshot.sourceUrl, ex.what());
            }

            std::lock_guard<std::mutex> lk(progressMutex);
            const auto done = completed.fetch_add(1, std::memory_order_acq_rel) + 1;
            if (onProgress) {
                try {
                    onProgress(done, total);
                } catch (const std::exception& ex) {
                    spdlog::warn("Progress callback raised: {}", ex.what());
                }
            }
        }
    };

    const auto workers =
        static_cast<std::size_t>(std::clamp<std::size_t>(
            static_cast<std::size_t>(std::max(options_.workers, 1)), 1, total));
    spdlog::debug("Scheduling {} task(s) on {} worker(s)", total, workers);

    boost::asio::thread_pool pool(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        boost::asio::post(pool, worker);
    }
    pool.join();

    // Whatever is left in the queue was never dequeued.
    for (auto& task : queue) {
        const std::size_t index = task.index;
        task.status = TaskStatus::Failed;
        results[index] =
            DownloadResult{std::move(task), Outcome::Cancelled,
                           Error{ErrorCode::Cancelled, "Not started: run was cancelled"}};
    }
    return results;
}

} // namespace orderpix::downloader
