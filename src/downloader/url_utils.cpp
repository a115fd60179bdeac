/*
 * url_utils.cpp
 *
 * URL helpers built on the libcurl URL API (curl_url_*):
 * - reference resolution against a base URL
 * - component access (path, origin)
 * - percent encoding/decoding and extension helpers used by the extractor and scheduler
 */

#include <orderpix/downloader/url_utils.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace orderpix::downloader {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* h) const noexcept { curl_url_cleanup(h); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

struct CurlStringDeleter {
    void operator()(char* p) const noexcept { curl_free(p); }
};

std::optional<std::string> getPart(CURLU* h, CURLUPart part) {
    char* out = nullptr;
    if (curl_url_get(h, part, &out, 0) != CURLUE_OK || out == nullptr)
        return std::nullopt;
    std::unique_ptr<char, CurlStringDeleter> guard(out);
    return std::string(out);
}

CurlUrlPtr parseAbsolute(std::string_view url) {
    CurlUrlPtr h(curl_url());
    if (!h)
        return nullptr;
    if (curl_url_set(h.get(), CURLUPART_URL, std::string(url).c_str(), 0) != CURLUE_OK)
        return nullptr;
    return h;
}

bool isHttpScheme(CURLU* h) {
    auto scheme = getPart(h, CURLUPART_SCHEME);
    if (!scheme)
        return false;
    std::string s = *scheme;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s == "http" || s == "https";
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Strip surrounding whitespace and escape embedded spaces so curl accepts the reference.
std::string cleanReference(std::string_view ref) {
    size_t b = 0;
    size_t e = ref.size();
    while (b < e && std::isspace(static_cast<unsigned char>(ref[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(ref[e - 1])))
        --e;
    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; ++i) {
        const char c = ref[i];
        if (c == ' ') {
            out += "%20";
        } else if (c == '\n' || c == '\r' || c == '\t') {
            continue;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Scheme of an absolute reference ("mailto:x" -> "mailto"), lowercased; empty when the
// reference is relative.
std::string referenceScheme(std::string_view ref) {
    if (ref.empty() || !std::isalpha(static_cast<unsigned char>(ref[0])))
        return {};
    for (size_t i = 1; i < ref.size(); ++i) {
        const auto c = static_cast<unsigned char>(ref[i]);
        if (c == ':') {
            std::string scheme(ref.substr(0, i));
            std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
            return scheme;
        }
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
            return {};
    }
    return {};
}

} // namespace

std::string percentDecode(std::string_view in, bool plusAsSpace) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '%' && i + 2 < in.size()) {
            const int hi = hexValue(in[i + 1]);
            const int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string percentEncode(std::string_view in) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::optional<std::string> resolveUrl(std::string_view base, std::string_view reference) {
    const std::string ref = cleanReference(reference);
    if (ref.empty())
        return std::nullopt;
    if (auto scheme = referenceScheme(ref); !scheme.empty() && scheme != "http" && scheme != "https")
        return std::nullopt;

    auto h = parseAbsolute(base);
    if (!h)
        return std::nullopt;

    // With a base already set, curl_url_set(CURLUPART_URL) treats a relative value as a
    // reference and resolves it.
    if (curl_url_set(h.get(), CURLUPART_URL, ref.c_str(), 0) != CURLUE_OK)
        return std::nullopt;
    if (!isHttpScheme(h.get()))
        return std::nullopt;
    return getPart(h.get(), CURLUPART_URL);
}

std::string urlPath(std::string_view url) {
    auto h = parseAbsolute(url);
    if (!h)
        return {};
    return getPart(h.get(), CURLUPART_PATH).value_or(std::string{});
}

std::string lastPathSegment(std::string_view path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string_view::npos)
        return std::string(path);
    return std::string(path.substr(slash + 1));
}

std::string pathExtension(std::string_view path) {
    const std::string segment = lastPathSegment(path);
    auto dot = segment.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == segment.size())
        return {};
    return normalizeExtension(std::string_view(segment).substr(dot));
}

std::string normalizeExtension(std::string_view ext) {
    std::string out;
    out.reserve(ext.size() + 1);
    for (unsigned char c : ext) {
        if (std::isspace(c))
            continue;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    if (!out.empty() && out.front() != '.')
        out.insert(out.begin(), '.');
    return out;
}

} // namespace orderpix::downloader
