#include <orderpix/downloader/page_fetcher.hpp>
#include <orderpix/downloader/url_utils.hpp>

#include <spdlog/spdlog.h>

namespace orderpix::downloader {

namespace {
constexpr std::string_view kListingPath = "/backend/general/photos/seller?orderid=";
}

PageFetcher::PageFetcher(std::shared_ptr<IHttpTransport> transport, PageFetchOptions options,
                         Sleeper sleeper)
    : transport_(std::move(transport)), options_(std::move(options)),
      sleeper_(std::move(sleeper)) {}

std::string PageFetcher::listingUrl(std::string_view orderId, std::string_view baseUrl) {
    while (!baseUrl.empty() && baseUrl.back() == '/')
        baseUrl.remove_suffix(1);
    std::string url(baseUrl);
    url.append(kListingPath);
    url.append(percentEncode(orderId));
    return url;
}

Expected<ListingPage> PageFetcher::fetch(std::string_view orderId,
                                         std::string_view baseUrl) const {
    if (!transport_) {
        return Error{ErrorCode::InvalidArgument, "PageFetcher has no transport"};
    }
    if (orderId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Order id is empty"};
    }

    ListingPage page;
    page.url = listingUrl(orderId, baseUrl);

    HttpRequest request;
    request.url = page.url;
    request.headers = options_.headers;
    request.timeout = options_.timeout;
    request.tls = options_.tls;

    spdlog::info("Fetching listing page: {}", page.url);

    int attempts = 0;
    auto result = retryWithBackoff<HttpResponse>(
        options_.retry, sleeper_,
        [&](int attempt) {
            spdlog::debug("Listing page attempt {}/{}", attempt, options_.retry.maxAttempts);
            return transport_->get(request);
        },
        [&](int attempt, const Error& err, std::chrono::milliseconds delay) {
            spdlog::warn("Listing page attempt {} failed ({}); retrying in {} ms", attempt,
                         err.message, delay.count());
        },
        attempts);
    page.attempts = attempts;

    if (!result.ok()) {
        Error err = result.error();
        if (isTransient(err)) {
            err.message = "Giving up after " + std::to_string(attempts) +
                          " attempts: " + err.message;
        }
        spdlog::error("Failed to fetch listing page: {}", err.message);
        return err;
    }

    auto response = std::move(result).value();
    page.effectiveUrl = response.effectiveUrl.empty() ? page.url : response.effectiveUrl;
    page.html.assign(reinterpret_cast<const char*>(response.body.data()), response.body.size());
    spdlog::info("Listing page fetched ({} bytes, {} attempt(s))", page.html.size(), attempts);
    return page;
}

} // namespace orderpix::downloader
