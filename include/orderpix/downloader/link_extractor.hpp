#pragma once

#include <orderpix/downloader/downloader.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace orderpix::downloader {

/**
 * An absolute image URL discovered on the listing page plus its lowercase extension
 * (".jpg"). Immutable once created.
 */
struct ImageReference {
    std::string url;
    std::string extension;

    bool operator==(const ImageReference&) const = default;
};

/**
 * Turns a listing page into the ordered, de-duplicated set of image references.
 *
 * Looks at a[href], img[src], img[data-src], source[src] and link[href]; resolves each
 * value against baseUrl; keeps those whose path extension is in allowedExtensions
 * (case-insensitive) and, when pathMustContain is non-empty, whose path contains it.
 * First occurrence wins when the same absolute URL appears more than once.
 */
class LinkExtractor {
public:
    explicit LinkExtractor(std::unique_ptr<ITagScanner> scanner = nullptr);

    [[nodiscard]] Expected<std::vector<ImageReference>>
    extract(std::string_view html, std::string_view baseUrl,
            const std::vector<std::string>& allowedExtensions,
            std::string_view pathMustContain = {}) const;

private:
    std::unique_ptr<ITagScanner> scanner_;
};

} // namespace orderpix::downloader
