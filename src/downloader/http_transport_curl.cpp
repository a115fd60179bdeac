/*
 * http_transport_curl.cpp
 *
 * Notes
 * - IHttpTransport over the libcurl easy API: one easy handle per request, so the transport is
 *   safe to share between scheduler workers.
 * - Honors per-request timeout (fresh window per call), TLS verify/CA, headers and redirects.
 * - Maps CURLcode and HTTP status >= 400 onto the downloader error taxonomy.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <orderpix/downloader/downloader.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <string_view>

namespace orderpix::downloader {

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view url) {
    Error err;
    err.message = std::string(curl_easy_strerror(code)) + " (" + std::string(url) + ")";
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// CURL write callback: append to the response body
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* body = static_cast<std::vector<std::byte>*>(userdata);
    const auto* bytes = reinterpret_cast<const std::byte*>(ptr);
    body->insert(body->end(), bytes, bytes + total);
    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, std::chrono::milliseconds timeout, const TlsConfig& tls,
                             bool followRedirects) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, tls.insecure ? 0L : 2L);
    if (!tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, tls.caPath.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

class CurlHttpTransport final : public IHttpTransport {
public:
    CurlHttpTransport() = default;
    ~CurlHttpTransport() override = default;

    Expected<HttpResponse> get(const HttpRequest& request) override {
        if (request.url.empty()) {
            return Error{ErrorCode::InvalidArgument, "Empty URL"};
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        curl_slist* list = build_header_list(request.headers);
        HttpResponse response;

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

        configure_common(curl, request.timeout, request.tls, request.followRedirects);

        CURLcode rc = curl_easy_perform(curl);

        long http_status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
        char* effective = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
            response.effectiveUrl = effective;
        } else {
            response.effectiveUrl = request.url;
        }

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (rc != CURLE_OK) {
            return makeCurlError(rc, request.url);
        }
        if (http_status >= 400) {
            return makeHttpStatusError(static_cast<int>(http_status), request.url);
        }

        response.status = static_cast<int>(http_status);
        spdlog::debug("GET {} -> {} ({} bytes)", request.url, response.status,
                      response.body.size());
        return response;
    }
};

std::shared_ptr<IHttpTransport> makeCurlHttpTransport() {
    // curl_global_init is not thread-safe on every libcurl build; run it once before any
    // worker can create an easy handle.
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::warn("curl_global_init failed; relying on lazy initialization");
        }
    });
    return std::make_shared<CurlHttpTransport>();
}

} // namespace orderpix::downloader
