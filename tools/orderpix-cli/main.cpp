#include <cstdio>
#include <exception>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <orderpix/cli/grab_command.h>
#include <orderpix/version.hpp>

int main(int argc, char* argv[]) {
    try {
        // Conservative default until runGrab() installs the configured logger
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"Download every image listed on a portal order page", "orderpix"};
        app.set_version_flag("--version", ORDERPIX_VERSION_STRING);

        orderpix::cli::GrabOptions opts;
        orderpix::cli::registerGrabOptions(app, opts);
        CLI11_PARSE(app, argc, argv);

        orderpix::cli::installStopHandlers();
        return orderpix::cli::runGrab(app, opts);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
