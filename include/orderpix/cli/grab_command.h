#pragma once

#include <orderpix/app/services/grab_service.hpp>
#include <orderpix/config/run_config.h>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace orderpix::cli {

/**
 * Command-line state bound to CLI11 options. `config` receives the directly mapped values;
 * the remaining members are folded into it by finalize().
 */
struct GrabOptions {
    config::RunConfig config;
    std::string configPath;
    bool rawImage{false};
    bool noWatermark{false};
    std::vector<std::string> removeParams;
    int timeoutMs{10000};
};

// Register the positional order id and all flags on cmd.
void registerGrabOptions(CLI::App& cmd, GrabOptions& opts);

/**
 * Merge the config file (values not given on the command line) and the flag-only members
 * into opts.config. Fails when the config file holds a malformed value.
 */
downloader::Expected<void> finalizeGrabOptions(const CLI::App& cmd, GrabOptions& opts);

/**
 * Run the pipeline for parsed options: logging setup, progress display, summary output.
 * Returns the process exit code (0 success, 1 fatal, 2 partial, 3 cancelled).
 */
int runGrab(const CLI::App& cmd, GrabOptions& opts, app::services::GrabServiceDeps deps = {},
            downloader::ShouldCancel shouldCancel = {});

// SIGINT/SIGTERM set a flag that stopRequested() reports.
void installStopHandlers();
bool stopRequested() noexcept;

} // namespace orderpix::cli
