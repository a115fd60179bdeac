#pragma once

/*
 * orderpix Downloader - Public Types and Service Interfaces (C++20)
 *
 * This header defines the data types and abstract seams shared by the listing
 * page fetcher, the link extractor and the download scheduler. Concrete
 * implementations live in src/downloader and are obtained through the factory
 * functions declared at the bottom of this file.
 *
 * Design principles:
 * - No exceptions across component boundaries; every fallible call returns Expected<T>
 * - Transport, markup scanning and file persistence sit behind interfaces so tests can
 *   script them
 * - Final files only ever appear through an atomic rename
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orderpix::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Canonical error codes for downloader operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    HttpClientError, // 4xx other than 429
    HttpServerError, // 5xx
    RateLimited,     // 429
    ParseError,
    FilesystemError,
    Cancelled,
    Unknown
};

constexpr const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::TlsVerificationFailed: return "TlsVerificationFailed";
        case ErrorCode::HttpClientError: return "HttpClientError";
        case ErrorCode::HttpServerError: return "HttpServerError";
        case ErrorCode::RateLimited: return "RateLimited";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::FilesystemError: return "FilesystemError";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

inline constexpr std::string_view kDefaultUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/117.0.0.0 Safari/537.36";

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Canonical error object. httpStatus is set when the failure came from a response status.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<int> httpStatus{};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// HTTP transport
// ===================

struct HttpRequest {
    std::string url;
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{10000};
    bool followRedirects{true};
    TlsConfig tls{};
};

struct HttpResponse {
    int status{0};
    std::vector<std::byte> body;
    std::string effectiveUrl; // after redirects
};

/**
 * Single-request HTTP GET abstraction (libcurl-based implementation satisfies this).
 *
 * Contract: transport failures and any response status >= 400 are reported as Error
 * (see makeHttpStatusError); a returned HttpResponse always carries a 2xx/3xx status.
 * Implementations must be safe to call concurrently from several worker threads.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual Expected<HttpResponse> get(const HttpRequest& request) = 0;
};

/**
 * Map an HTTP status >= 400 to the error taxonomy (429 -> RateLimited, 5xx ->
 * HttpServerError, other 4xx -> HttpClientError).
 */
[[nodiscard]] Error makeHttpStatusError(int status, std::string_view url);

/**
 * True for failures expected to resolve on retry: network errors, timeouts, 5xx and 429.
 */
[[nodiscard]] bool isTransient(const Error& error) noexcept;

// ===================
// Markup scanning
// ===================

/**
 * One resource-location attribute found in markup. Tag and attribute names are lowercase;
 * the value has character references already decoded.
 */
struct TagAttribute {
    std::string tag;
    std::string attribute;
    std::string value;
};

using TagAttributeVisitor = std::function<void(const TagAttribute&)>;

/**
 * Tag scanner abstraction: walks a document in order and reports every attribute that can
 * carry a resource location (href, src, data-src). Fails with ParseError only when the input
 * cannot be treated as markup at all.
 */
class ITagScanner {
public:
    virtual ~ITagScanner() = default;
    virtual Expected<void> scan(std::string_view html, const TagAttributeVisitor& visit) const = 0;
};

// ===================
// File persistence
// ===================

/**
 * Persists a payload under finalPath. Implementations must never expose a partially written
 * file under finalPath.
 */
class IFileWriter {
public:
    virtual ~IFileWriter() = default;
    virtual Expected<void> write(const std::filesystem::path& finalPath,
                                 std::span<const std::byte> bytes) = 0;
};

// ===================
// Callback signatures
// ===================

using ShouldCancel = std::function<bool()>; // return true to stop dequeuing new work
using Sleeper = std::function<void(std::chrono::milliseconds)>;

// ==========================
// Factories (src/downloader)
// ==========================

std::shared_ptr<IHttpTransport> makeCurlHttpTransport();
std::unique_ptr<ITagScanner> makeGumboTagScanner();

} // namespace orderpix::downloader
