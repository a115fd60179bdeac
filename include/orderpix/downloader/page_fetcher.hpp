#pragma once

#include <orderpix/downloader/downloader.hpp>
#include <orderpix/downloader/retry.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace orderpix::downloader {

struct PageFetchOptions {
    std::chrono::milliseconds timeout{10000};
    RetryPolicy retry{3, std::chrono::milliseconds{1000}, 2.0, std::chrono::milliseconds{8000}};
    std::vector<Header> headers;
    TlsConfig tls{};
};

/**
 * The fetched listing page. effectiveUrl is the URL after redirects and is the base for
 * resolving relative links.
 */
struct ListingPage {
    std::string url;
    std::string effectiveUrl;
    std::string html;
    int attempts{0};
};

/**
 * Retrieves the listing page for an order. Transient failures are retried per
 * PageFetchOptions::retry; anything else (4xx, TLS, malformed URL) fails immediately. An
 * error from fetch() is fatal for the run.
 */
class PageFetcher {
public:
    PageFetcher(std::shared_ptr<IHttpTransport> transport, PageFetchOptions options,
                Sleeper sleeper = {});

    [[nodiscard]] Expected<ListingPage> fetch(std::string_view orderId,
                                              std::string_view baseUrl) const;

    // <baseUrl>/backend/general/photos/seller?orderid=<orderId>
    [[nodiscard]] static std::string listingUrl(std::string_view orderId,
                                                std::string_view baseUrl);

private:
    std::shared_ptr<IHttpTransport> transport_;
    PageFetchOptions options_;
    Sleeper sleeper_;
};

} // namespace orderpix::downloader
