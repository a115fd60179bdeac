#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <orderpix/cli/logging.h>

#include <algorithm>
#include <memory>
#include <system_error>
#include <vector>

namespace orderpix::cli {

using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;

void configureConsoleLogging(bool verbose) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);
    auto logger = std::make_shared<spdlog::logger>("orderpix", console_sink);
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

Expected<void> configureLogging(const LogOptions& options) {
    const auto consoleLevel = options.verbose ? spdlog::level::debug : spdlog::level::warn;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);
    console_sink->set_level(consoleLevel);

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    std::optional<Error> fileError;

    if (options.file) {
        const auto& path = *options.file;
        try {
            if (path.has_parent_path()) {
                std::error_code ec;
                std::filesystem::create_directories(path.parent_path(), ec);
            }
            auto file_sink =
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
            file_sink->set_pattern(kFilePattern);
            file_sink->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
            sinks.push_back(std::move(file_sink));
        } catch (const spdlog::spdlog_ex& e) {
            fileError = Error{ErrorCode::FilesystemError,
                              "Cannot open log file " + path.string() + ": " + e.what()};
        }
    }

    const bool withFile = sinks.size() > 1;
    auto logger = std::make_shared<spdlog::logger>("orderpix", sinks.begin(), sinks.end());
    logger->set_level(withFile ? std::min(consoleLevel, spdlog::level::info) : consoleLevel);
    spdlog::set_default_logger(logger);
    if (withFile) {
        spdlog::flush_on(spdlog::level::info);
    }

    if (fileError) {
        spdlog::error("{}", fileError->message);
        return *fileError;
    }
    return Expected<void>{};
}

} // namespace orderpix::cli
