#include <orderpix/downloader/link_extractor.hpp>
#include <orderpix/downloader/url_utils.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace orderpix::downloader {

namespace {

bool isCandidate(const TagAttribute& attr) {
    if (attr.tag == "a" || attr.tag == "link")
        return attr.attribute == "href";
    if (attr.tag == "img")
        return attr.attribute == "src" || attr.attribute == "data-src";
    if (attr.tag == "source")
        return attr.attribute == "src";
    return false;
}

} // namespace

LinkExtractor::LinkExtractor(std::unique_ptr<ITagScanner> scanner) : scanner_(std::move(scanner)) {
    if (!scanner_)
        scanner_ = makeGumboTagScanner();
}

Expected<std::vector<ImageReference>>
LinkExtractor::extract(std::string_view html, std::string_view baseUrl,
                       const std::vector<std::string>& allowedExtensions,
                       std::string_view pathMustContain) const {
    std::vector<std::string> extensions;
    extensions.reserve(allowedExtensions.size());
    for (const auto& ext : allowedExtensions) {
        auto normalized = normalizeExtension(ext);
        if (!normalized.empty())
            extensions.push_back(std::move(normalized));
    }

    std::vector<ImageReference> refs;
    std::unordered_set<std::string> seen;
    std::size_t candidates = 0;
    std::size_t unresolved = 0;

    auto scanned = scanner_->scan(html, [&](const TagAttribute& attr) {
        if (!isCandidate(attr))
            return;
        ++candidates;

        auto absolute = resolveUrl(baseUrl, attr.value);
        if (!absolute) {
            ++unresolved;
            spdlog::debug("Skipping unresolvable reference '{}'", attr.value);
            return;
        }

        const std::string path = urlPath(*absolute);
        if (!pathMustContain.empty() && path.find(pathMustContain) == std::string::npos)
            return;

        std::string ext = pathExtension(path);
        if (ext.empty() || std::find(extensions.begin(), extensions.end(), ext) == extensions.end())
            return;

        if (!seen.insert(*absolute).second)
            return;
        refs.push_back(ImageReference{std::move(*absolute), std::move(ext)});
    });
    if (!scanned.ok()) {
        return scanned.error();
    }

    spdlog::debug("Link extraction: {} candidates, {} unresolved, {} kept", candidates,
                  unresolved, refs.size());
    return refs;
}

} // namespace orderpix::downloader
