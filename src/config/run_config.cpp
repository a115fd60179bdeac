#include <orderpix/config/config_helpers.h>
#include <orderpix/config/run_config.h>
#include <orderpix/downloader/url_utils.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <set>
#include <system_error>

namespace orderpix::config {

using downloader::Error;
using downloader::ErrorCode;

namespace {

Error invalid(std::string message) {
    return Error{ErrorCode::InvalidArgument, std::move(message)};
}

Expected<int> parseInt(const std::string& key, const std::string& raw) {
    int value = 0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return invalid("Config value for '" + key + "' is not an integer: " + raw);
    }
    return value;
}

bool startsWithHttp(std::string_view url) {
    auto lower = [](std::string_view s, std::string_view prefix) {
        if (s.size() < prefix.size())
            return false;
        for (size_t i = 0; i < prefix.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i])
                return false;
        }
        return true;
    };
    return lower(url, "http://") || lower(url, "https://");
}

} // namespace

Expected<void> RunConfig::validate() {
    trim(orderId);
    if (orderId.empty()) {
        return invalid("Order id must not be empty");
    }

    std::vector<std::string> normalized;
    for (const auto& ext : extensions) {
        std::string e = ext;
        trim(e);
        e = downloader::normalizeExtension(e);
        if (e.size() < 2) {
            return invalid("Invalid extension: '" + ext + "'");
        }
        if (std::find(normalized.begin(), normalized.end(), e) == normalized.end()) {
            normalized.push_back(std::move(e));
        }
    }
    if (normalized.empty()) {
        return invalid("At least one file extension is required");
    }
    extensions = std::move(normalized);

    if (workers < 1 || workers > kMaxWorkers) {
        return invalid("Worker count must be between 1 and " + std::to_string(kMaxWorkers) +
                       " (got " + std::to_string(workers) + ")");
    }
    if (maxAttempts < 1) {
        return invalid("Max attempts must be at least 1");
    }
    if (timeout.count() <= 0) {
        return invalid("Timeout must be positive");
    }
    if (initialBackoff.count() < 0) {
        return invalid("Initial backoff must not be negative");
    }

    trim(baseUrl);
    while (!baseUrl.empty() && baseUrl.back() == '/')
        baseUrl.pop_back();
    if (!startsWithHttp(baseUrl)) {
        return invalid("Base URL must start with http:// or https://: '" + baseUrl + "'");
    }

    trim(tls.caPath);
    if (!tls.caPath.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(tls.caPath, ec)) {
            return invalid("CA bundle not found: '" + tls.caPath + "'");
        }
    }
    if (tls.insecure) {
        spdlog::warn("TLS certificate verification is disabled");
    }

    if (outputDir.empty()) {
        return invalid("Output directory must not be empty");
    }
    if (logEnabled && logFile.empty()) {
        return invalid("Log file path must not be empty when logging is enabled");
    }

    std::set<std::string> extra;
    for (auto name : transform.extraParamsToRemove) {
        trim(name);
        if (!name.empty())
            extra.insert(std::move(name));
    }
    transform.extraParamsToRemove = std::move(extra);

    return Expected<void>{};
}

Expected<FileSettings> loadFileSettings(const std::filesystem::path& path) {
    FileSettings settings;
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return settings;
    }

    const auto values = parse_config_file(path);
    spdlog::debug("Loaded {} value(s) from {}", values.size(), path.string());

    auto get = [&](const std::string& key) -> const std::string* {
        auto it = values.find(key);
        return (it == values.end() || it->second.empty()) ? nullptr : &it->second;
    };

    if (auto* v = get("portal.base_url"))
        settings.baseUrl = *v;
    if (auto* v = get("portal.user_agent"))
        settings.userAgent = *v;
    if (auto* v = get("portal.ca_file"))
        settings.caFile = expand_tilde(*v).string();
    if (auto* v = get("download.output_dir"))
        settings.outputDir = expand_tilde(*v);
    if (auto* v = get("download.extensions"))
        settings.extensions = parse_list(*v);
    // An explicitly empty filter is meaningful: it disables path filtering.
    if (auto it = values.find("download.path_filter"); it != values.end())
        settings.pathFilter = it->second;
    if (auto* v = get("log.file"))
        settings.logFile = expand_tilde(*v);

    if (auto* v = get("download.workers")) {
        auto n = parseInt("download.workers", *v);
        if (!n.ok())
            return n.error();
        settings.workers = n.value();
    }
    if (auto* v = get("download.max_attempts")) {
        auto n = parseInt("download.max_attempts", *v);
        if (!n.ok())
            return n.error();
        settings.maxAttempts = n.value();
    }
    if (auto* v = get("download.timeout_ms")) {
        auto n = parseInt("download.timeout_ms", *v);
        if (!n.ok())
            return n.error();
        settings.timeout = std::chrono::milliseconds{n.value()};
    }
    if (auto* v = get("download.initial_backoff_ms")) {
        auto n = parseInt("download.initial_backoff_ms", *v);
        if (!n.ok())
            return n.error();
        settings.initialBackoff = std::chrono::milliseconds{n.value()};
    }

    return settings;
}

} // namespace orderpix::config
