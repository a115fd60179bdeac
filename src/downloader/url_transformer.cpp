#include <orderpix/downloader/url_transformer.hpp>
#include <orderpix/downloader/url_utils.hpp>

namespace orderpix::downloader {

namespace {

constexpr std::string_view kWidth = "width";
constexpr std::string_view kHeight = "height";
constexpr std::string_view kWatermark = "watermark";

struct UrlParts {
    std::string_view head;     // everything before '?'
    std::string_view query;    // without '?'
    std::string_view fragment; // including '#', may be empty
    bool hasQuery{false};
};

UrlParts splitUrl(std::string_view url) {
    UrlParts parts;
    auto hash = url.find('#');
    std::string_view rest = url;
    if (hash != std::string_view::npos) {
        parts.fragment = url.substr(hash);
        rest = url.substr(0, hash);
    }
    auto q = rest.find('?');
    if (q == std::string_view::npos) {
        parts.head = rest;
        return parts;
    }
    parts.head = rest.substr(0, q);
    parts.query = rest.substr(q + 1);
    parts.hasQuery = true;
    return parts;
}

template <typename Fn> void forEachSegment(std::string_view query, Fn&& fn) {
    size_t start = 0;
    while (start <= query.size()) {
        auto amp = query.find('&', start);
        auto end = amp == std::string_view::npos ? query.size() : amp;
        if (end > start)
            fn(query.substr(start, end - start));
        if (amp == std::string_view::npos)
            break;
        start = amp + 1;
    }
}

std::string_view segmentKey(std::string_view segment) {
    auto eq = segment.find('=');
    return eq == std::string_view::npos ? segment : segment.substr(0, eq);
}

} // namespace

bool UrlTransformer::removes(std::string_view key) const {
    if (config_.removeWidthHeight && (key == kWidth || key == kHeight))
        return true;
    if (config_.removeWatermark && key == kWatermark)
        return true;
    return config_.extraParamsToRemove.find(std::string(key)) != config_.extraParamsToRemove.end();
}

std::string UrlTransformer::transform(std::string_view url) const {
    if (config_.empty())
        return std::string(url);

    const auto parts = splitUrl(url);
    if (!parts.hasQuery)
        return std::string(url);

    std::vector<std::string_view> kept;
    bool removedAny = false;
    forEachSegment(parts.query, [&](std::string_view segment) {
        if (removes(percentDecode(segmentKey(segment), /*plusAsSpace=*/true))) {
            removedAny = true;
        } else {
            kept.push_back(segment);
        }
    });

    // Leave untouched URLs byte-identical.
    if (!removedAny)
        return std::string(url);

    std::string out(parts.head);
    for (size_t i = 0; i < kept.size(); ++i) {
        out.push_back(i == 0 ? '?' : '&');
        out.append(kept[i]);
    }
    out.append(parts.fragment);
    return out;
}

std::string transformUrl(std::string_view url, const TransformConfig& config) {
    return UrlTransformer(config).transform(url);
}

std::vector<std::pair<std::string, std::string>> parseQuery(std::string_view query) {
    std::vector<std::pair<std::string, std::string>> out;
    forEachSegment(query, [&](std::string_view segment) {
        auto eq = segment.find('=');
        if (eq == std::string_view::npos) {
            out.emplace_back(std::string(segment), std::string{});
        } else {
            out.emplace_back(std::string(segment.substr(0, eq)),
                             std::string(segment.substr(eq + 1)));
        }
    });
    return out;
}

} // namespace orderpix::downloader
