/*
 * orderpix/src/cli/cmd_grab.cpp
 *
 * Command-line front end for a grab run.
 * - Options bound to RunConfig; config file values fill whatever the command line left unset
 * - Progress bar on stderr so --json output on stdout stays machine readable
 * - SIGINT/SIGTERM stop the scheduler from starting new downloads
 */

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <orderpix/cli/grab_command.h>
#include <orderpix/cli/logging.h>
#include <orderpix/cli/progress_indicator.h>
#include <orderpix/config/config_helpers.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <set>
#include <system_error>

namespace orderpix::cli {

using app::services::GrabRequest;
using app::services::RunSummary;
using config::Setting;
using downloader::Expected;

namespace {

std::atomic<bool> g_stopRequested{false};

void stopSignalHandler(int) {
    g_stopRequested.store(true);
}

const char* optionFor(Setting s) {
    switch (s) {
        case Setting::BaseUrl: return "--base-url";
        case Setting::OutputDir: return "--output";
        case Setting::Extensions: return "--extensions";
        case Setting::Workers: return "--workers";
        case Setting::MaxAttempts: return "--max-attempts";
        case Setting::Timeout: return "--timeout-ms";
        case Setting::PathFilter: return "--path-filter";
        case Setting::LogFile: return "--log-file";
        case Setting::CaFile: return "--ca-file";
        case Setting::UserAgent:
        case Setting::InitialBackoff:
            return nullptr;
    }
    return nullptr;
}

void printHuman(const RunSummary& summary, const config::RunConfig& cfg) {
    using config::sanitize_for_terminal;

    if (summary.fatal) {
        fmt::print(stderr, "Error: {}\n", sanitize_for_terminal(summary.fatal->message));
        return;
    }
    if (summary.noImagesFound) {
        fmt::print(stderr, "No images found for order {}\n", sanitize_for_terminal(summary.orderId));
        return;
    }

    fmt::print("Order {}: {} image(s) found\n", sanitize_for_terminal(summary.orderId),
               summary.linksFound);
    fmt::print("  Downloaded: {}\n", summary.succeeded);
    if (summary.skipped > 0)
        fmt::print("  Skipped:    {}\n", summary.skipped);
    fmt::print("  Failed:     {}\n", summary.failed);
    if (summary.cancelled > 0)
        fmt::print("  Cancelled:  {}\n", summary.cancelled);
    fmt::print("  Total:      {} in {:.1f}s\n", summary.total,
               static_cast<double>(summary.elapsed.count()) / 1000.0);
    fmt::print("  Output:     {}\n", sanitize_for_terminal(cfg.outputDir.string()));

    for (const auto& r : summary.results) {
        if (r.outcome != downloader::Outcome::Failed || !r.error)
            continue;
        fmt::print("  FAILED {} ({} attempt(s)): {}\n", sanitize_for_terminal(r.task.sourceUrl),
                   r.task.attempts, sanitize_for_terminal(r.error->message));
    }
    if (summary.cancelled > 0) {
        fmt::print("Stopped early: {} download(s) were not started\n", summary.cancelled);
    }
}

} // namespace

void installStopHandlers() {
    std::signal(SIGINT, stopSignalHandler);
    std::signal(SIGTERM, stopSignalHandler);
}

bool stopRequested() noexcept {
    return g_stopRequested.load();
}

void registerGrabOptions(CLI::App& cmd, GrabOptions& opts) {
    auto& cfg = opts.config;

    cmd.add_option("order_id", cfg.orderId, "Order id whose images should be downloaded.")
        ->required()
        ->check(CLI::NonEmpty);

    cmd.add_option("-e,--extensions", cfg.extensions,
                   "File extensions to match, e.g. -e .jpg .png (default .jpg).");
    cmd.add_option("-o,--output", cfg.outputDir,
                   "Destination directory (default downloaded_images).");
    cmd.add_option("-b,--base-url", cfg.baseUrl,
                   "Portal base URL (default https://portal.diakrit.com).");

    cmd.add_flag("--raw-image", opts.rawImage, "Remove width and height query parameters.");
    cmd.add_flag("--no-watermark", opts.noWatermark, "Remove the watermark query parameter.");
    cmd.add_option("-r,--remove-params", opts.removeParams,
                   "Additional query parameters to remove (repeatable).");

    cmd.add_flag("--insecure", cfg.tls.insecure, "Do not verify TLS certificates.");
    cmd.add_option("--ca-file", cfg.tls.caPath, "CA bundle used to verify the portal.");

    cmd.add_flag("-p,--parallel", cfg.parallel, "Download with several workers.");
    cmd.add_option("-w,--workers", cfg.workers, "Worker count with --parallel (default 5).")
        ->check(CLI::Range(1, config::kMaxWorkers));
    cmd.add_option("--max-attempts", cfg.maxAttempts, "Attempts per request (default 3).")
        ->check(CLI::Range(1, 20));
    cmd.add_option("--timeout-ms", opts.timeoutMs, "Per-request timeout in ms (default 10000).")
        ->check(CLI::Range(100, 3600 * 1000));
    cmd.add_option("--path-filter", cfg.pathFilter,
                   "Only keep links whose path contains this text (default /orderfiles/; "
                   "\"\" keeps all).");
    cmd.add_flag("--skip-existing", cfg.skipExisting,
                 "Do not download files that already exist in the output directory.");

    cmd.add_flag("-l,--log", cfg.logEnabled, "Append run events to a log file.");
    cmd.add_option("--log-file", cfg.logFile, "Log file path (default image_downloader.log).");
    cmd.add_option("--config", opts.configPath,
                   "Config file (default $XDG_CONFIG_HOME/orderpix/config.toml).");

    cmd.add_flag("--json", cfg.json, "Print the final summary as JSON on stdout.");
    cmd.add_flag("-q,--quiet", cfg.quiet, "Do not show the progress bar.");
    cmd.add_flag("-v,--verbose", cfg.verbose, "Debug-level console logging.");

    cmd.footer(R"(Exit status:
  0  every image downloaded (or skipped)
  1  fatal: invalid options, listing page unavailable, or no images found
  2  some downloads failed
  3  stopped by SIGINT/SIGTERM before all downloads started)");
}

Expected<void> finalizeGrabOptions(const CLI::App& cmd, GrabOptions& opts) {
    auto& cfg = opts.config;
    cfg.timeout = std::chrono::milliseconds{opts.timeoutMs};

    const auto configPath = config::get_config_path(opts.configPath);
    std::error_code ec;
    if (!opts.configPath.empty() && !std::filesystem::exists(configPath, ec)) {
        return downloader::Error{downloader::ErrorCode::InvalidArgument,
                                 "Config file not found: " + configPath.string()};
    }
    auto settings = config::loadFileSettings(configPath);
    if (!settings.ok()) {
        return settings.error();
    }
    config::applyFileSettings(cfg, settings.value(), [&cmd](Setting s) {
        const char* name = optionFor(s);
        return name != nullptr && cmd.count(name) > 0;
    });

    cfg.transform.removeWidthHeight = opts.rawImage;
    cfg.transform.removeWatermark = opts.noWatermark;
    cfg.transform.extraParamsToRemove =
        std::set<std::string>(opts.removeParams.begin(), opts.removeParams.end());

    if (cmd.count("--log-file") > 0) {
        cfg.logEnabled = true;
    }
    return Expected<void>{};
}

int runGrab(const CLI::App& cmd, GrabOptions& opts, app::services::GrabServiceDeps deps,
            downloader::ShouldCancel shouldCancel) {
    auto& cfg = opts.config;

    auto finalized = finalizeGrabOptions(cmd, opts);
    if (!finalized.ok()) {
        configureConsoleLogging(cfg.verbose);
        fmt::print(stderr, "Error: {}\n", finalized.error().message);
        return static_cast<int>(app::services::ExitStatus::Fatal);
    }

    LogOptions logOpts;
    logOpts.verbose = cfg.verbose;
    if (cfg.logEnabled) {
        logOpts.file = cfg.logFile;
    }
    if (auto logged = configureLogging(logOpts); !logged.ok()) {
        fmt::print(stderr, "Error: {}\n", logged.error().message);
        return static_cast<int>(app::services::ExitStatus::Fatal);
    }

    std::unique_ptr<ProgressIndicator> progress;
    if (!cfg.quiet) {
        progress = std::make_unique<ProgressIndicator>(ProgressIndicator::Style::Bar);
    }

    GrabRequest request;
    request.config = cfg;
    request.onProgress = [&progress](std::size_t completed, std::size_t total) {
        if (!progress)
            return;
        if (!progress->isActive())
            progress->start("Downloading", total);
        progress->update(completed, total);
    };
    if (shouldCancel) {
        request.shouldCancel = std::move(shouldCancel);
    } else {
        request.shouldCancel = [] { return stopRequested(); };
    }

    auto service = app::services::makeGrabService(std::move(deps));
    RunSummary summary = service->run(request);
    if (progress) {
        progress->stop();
    }

    if (cfg.json) {
        fmt::print("{}\n", summary.toJson().dump(2));
    } else {
        printHuman(summary, cfg);
    }
    return summary.exitCode();
}

} // namespace orderpix::cli
