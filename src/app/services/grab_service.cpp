#include <orderpix/app/services/grab_service.hpp>
#include <orderpix/downloader/file_writer.hpp>
#include <orderpix/downloader/link_extractor.hpp>
#include <orderpix/downloader/page_fetcher.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace orderpix::app::services {

using namespace orderpix::downloader;

namespace {

nlohmann::json errorToJson(const Error& err) {
    nlohmann::json j;
    j["code"] = errorCodeName(err.code);
    j["message"] = err.message;
    if (err.httpStatus) {
        j["http_status"] = *err.httpStatus;
    } else {
        j["http_status"] = nullptr;
    }
    return j;
}

} // namespace

// ---- RunSummary ----

void RunSummary::tally() {
    total = results.size();
    succeeded = skipped = failed = cancelled = 0;
    for (const auto& r : results) {
        switch (r.outcome) {
            case Outcome::Succeeded:
                ++succeeded;
                break;
            case Outcome::Skipped:
                ++skipped;
                break;
            case Outcome::Failed:
                ++failed;
                break;
            case Outcome::Cancelled:
                ++cancelled;
                break;
        }
    }
}

ExitStatus RunSummary::exitStatus() const noexcept {
    if (fatal || noImagesFound)
        return ExitStatus::Fatal;
    if (cancelled > 0)
        return ExitStatus::Cancelled;
    if (failed > 0)
        return ExitStatus::Partial;
    return ExitStatus::Success;
}

nlohmann::json RunSummary::toJson() const {
    nlohmann::json j;
    j["order_id"] = orderId;
    j["listing_url"] = listingUrl;
    j["links_found"] = linksFound;
    j["total"] = total;
    j["succeeded"] = succeeded;
    j["skipped"] = skipped;
    j["failed"] = failed;
    j["cancelled"] = cancelled;
    j["elapsed_ms"] = elapsed.count();
    j["exit_code"] = exitCode();
    j["error"] = fatal ? errorToJson(*fatal) : nlohmann::json(nullptr);

    nlohmann::json items = nlohmann::json::array();
    for (const auto& r : results) {
        nlohmann::json item;
        item["index"] = r.task.index;
        item["url"] = r.task.originalUrl;
        item["source_url"] = r.task.sourceUrl;
        item["path"] = r.task.targetPath.string();
        item["outcome"] = outcomeName(r.outcome);
        item["status"] = taskStatusName(r.task.status);
        item["attempts"] = r.task.attempts;
        item["bytes"] = r.bytes;
        item["elapsed_ms"] = r.elapsed.count();
        if (r.error) {
            item["error"] = errorToJson(*r.error);
        }
        items.push_back(std::move(item));
    }
    j["results"] = std::move(items);
    return j;
}

// ---- GrabService ----

class GrabServiceImpl final : public IGrabService {
public:
    explicit GrabServiceImpl(GrabServiceDeps deps)
        : transport_(std::move(deps.transport)), writer_(std::move(deps.writer)),
          extractor_(std::move(deps.scanner)), sleeper_(std::move(deps.sleeper)) {
        if (!transport_) {
            transport_ = makeCurlHttpTransport();
        }
        if (!writer_) {
            writer_ = std::make_shared<FileWriter>();
        }
    }

    RunSummary run(const GrabRequest& req) override {
        const auto started = std::chrono::steady_clock::now();
        RunSummary summary;
        summary.orderId = req.config.orderId;
        try {
            execute(req, summary);
        } catch (const std::exception& e) {
            spdlog::error("GrabService: unexpected error: {}", e.what());
            summary.fatal = Error{ErrorCode::Unknown, e.what()};
        }
        summary.tally();
        summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (!summary.fatal && !summary.noImagesFound) {
            spdlog::info("Summary: {} succeeded, {} skipped, {} failed, {} cancelled of {} "
                         "({} ms)",
                         summary.succeeded, summary.skipped, summary.failed, summary.cancelled,
                         summary.total, summary.elapsed.count());
        }
        return summary;
    }

private:
    void execute(const GrabRequest& req, RunSummary& summary) {
        config::RunConfig cfg = req.config;
        if (auto valid = cfg.validate(); !valid.ok()) {
            spdlog::error("Invalid configuration: {}", valid.error().message);
            summary.fatal = valid.error();
            return;
        }
        summary.orderId = cfg.orderId;
        spdlog::info("Starting run for order {}", cfg.orderId);

        std::error_code ec;
        fs::create_directories(cfg.outputDir, ec);
        std::error_code dirEc;
        if (ec || !fs::is_directory(cfg.outputDir, dirEc)) {
            std::string why = ec ? ec.message() : std::string("not a directory");
            spdlog::error("Cannot create output directory {}: {}", cfg.outputDir.string(), why);
            summary.fatal = Error{ErrorCode::FilesystemError,
                                  "Cannot create output directory " + cfg.outputDir.string() +
                                      ": " + why};
            return;
        }

        std::vector<Header> headers{{"User-Agent", cfg.userAgent}};

        PageFetchOptions pageOpts;
        pageOpts.timeout = cfg.timeout;
        pageOpts.headers = headers;
        pageOpts.tls = cfg.tls;
        pageOpts.retry.maxAttempts = cfg.maxAttempts;
        pageOpts.retry.initialBackoff = cfg.initialBackoff;

        PageFetcher fetcher(transport_, pageOpts, sleeper_);
        summary.listingUrl = PageFetcher::listingUrl(cfg.orderId, cfg.baseUrl);
        auto page = fetcher.fetch(cfg.orderId, cfg.baseUrl);
        if (!page.ok()) {
            summary.fatal = page.error();
            return;
        }

        auto refs = extractor_.extract(page.value().html, page.value().effectiveUrl,
                                       cfg.extensions, cfg.pathFilter);
        if (!refs.ok()) {
            spdlog::error("Failed to parse listing page: {}", refs.error().message);
            summary.fatal = refs.error();
            return;
        }
        summary.linksFound = refs.value().size();
        if (refs.value().empty()) {
            spdlog::warn("No images found for order {}", cfg.orderId);
            summary.noImagesFound = true;
            return;
        }
        spdlog::info("Found {} image link(s)", summary.linksFound);

        SchedulerOptions schedOpts;
        schedOpts.workers = cfg.effectiveWorkers();
        schedOpts.retry.maxAttempts = cfg.maxAttempts;
        schedOpts.retry.initialBackoff = cfg.initialBackoff;
        schedOpts.timeout = cfg.timeout;
        schedOpts.headers = std::move(headers);
        schedOpts.tls = cfg.tls;
        schedOpts.transform = cfg.transform;
        schedOpts.skipExisting = cfg.skipExisting;

        DownloadScheduler scheduler(transport_, writer_, std::move(schedOpts), sleeper_);
        summary.results =
            scheduler.run(refs.value(), cfg.outputDir, req.onProgress, req.shouldCancel);
    }

    std::shared_ptr<IHttpTransport> transport_;
    std::shared_ptr<IFileWriter> writer_;
    LinkExtractor extractor_;
    Sleeper sleeper_;
};

std::shared_ptr<IGrabService> makeGrabService(GrabServiceDeps deps) {
    return std::make_shared<GrabServiceImpl>(std::move(deps));
}

} // namespace orderpix::app::services
