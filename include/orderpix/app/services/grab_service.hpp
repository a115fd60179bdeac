#pragma once

#include <orderpix/config/run_config.h>
#include <orderpix/downloader/download_scheduler.hpp>
#include <orderpix/downloader/downloader.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace orderpix::app::services {

/**
 * Process exit status of a run.
 */
enum class ExitStatus : int { Success = 0, Fatal = 1, Partial = 2, Cancelled = 3 };

/**
 * Outcome of one run: listing page, extraction, and the per-image results in discovery
 * order. `fatal` is set when the run stopped before scheduling (invalid configuration,
 * listing page unavailable or unparsable, output directory not creatable).
 */
struct RunSummary {
    std::string orderId;
    std::string listingUrl;
    std::size_t linksFound{0};

    std::size_t total{0};
    std::size_t succeeded{0};
    std::size_t skipped{0};
    std::size_t failed{0};
    std::size_t cancelled{0};

    std::vector<downloader::DownloadResult> results;
    std::optional<downloader::Error> fatal;
    bool noImagesFound{false};
    std::chrono::milliseconds elapsed{0};

    // Fold per-task outcomes into the counters.
    void tally();

    [[nodiscard]] ExitStatus exitStatus() const noexcept;
    [[nodiscard]] int exitCode() const noexcept { return static_cast<int>(exitStatus()); }

    [[nodiscard]] nlohmann::json toJson() const;
};

struct GrabRequest {
    config::RunConfig config;
    downloader::ProgressCallback onProgress{};
    downloader::ShouldCancel shouldCancel{};
};

/**
 * Collaborators for the pipeline. Empty members fall back to the production
 * implementations (libcurl transport, atomic file writer, Gumbo scanner, real sleep).
 */
struct GrabServiceDeps {
    std::shared_ptr<downloader::IHttpTransport> transport;
    std::shared_ptr<downloader::IFileWriter> writer;
    std::unique_ptr<downloader::ITagScanner> scanner;
    downloader::Sleeper sleeper;
};

/**
 * Fetch the listing page for an order, extract image references, and download them.
 */
class IGrabService {
public:
    virtual ~IGrabService() = default;
    virtual RunSummary run(const GrabRequest& request) = 0;
};

[[nodiscard]] std::shared_ptr<IGrabService> makeGrabService(GrabServiceDeps deps = {});

} // namespace orderpix::app::services
