#pragma once

#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orderpix::downloader {

/**
 * Query-parameter removal rules. Key matching is case-sensitive.
 */
struct TransformConfig {
    bool removeWidthHeight{false};
    bool removeWatermark{false};
    std::set<std::string> extraParamsToRemove;

    [[nodiscard]] bool empty() const noexcept {
        return !removeWidthHeight && !removeWatermark && extraParamsToRemove.empty();
    }
};

/**
 * Rewrites a URL's query string according to a TransformConfig.
 *
 * Surviving parameters keep their relative order and their original spelling; only the
 * removed ones disappear. The result is a fixed point: transform(transform(u)) == transform(u).
 * Never fails; a URL without a query, or with none of the configured keys, is returned as is.
 */
class UrlTransformer {
public:
    UrlTransformer() = default;
    explicit UrlTransformer(TransformConfig config) : config_(std::move(config)) {}

    [[nodiscard]] std::string transform(std::string_view url) const;

    // True if a (decoded) query key is removed by this transformer's config.
    [[nodiscard]] bool removes(std::string_view key) const;

    [[nodiscard]] const TransformConfig& config() const noexcept { return config_; }

private:
    TransformConfig config_;
};

[[nodiscard]] std::string transformUrl(std::string_view url, const TransformConfig& config);

/**
 * Ordered key/value view of a query string (without the leading '?'). Keys and values are
 * returned raw (not percent-decoded); empty segments are skipped.
 */
[[nodiscard]] std::vector<std::pair<std::string, std::string>>
parseQuery(std::string_view query);

} // namespace orderpix::downloader
