#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace orderpix::downloader {

// Decode %XX escapes; '+' becomes a space when plusAsSpace is set. Malformed escapes are
// kept verbatim.
std::string percentDecode(std::string_view in, bool plusAsSpace = false);

// Encode everything outside the RFC 3986 unreserved set.
std::string percentEncode(std::string_view in);

// Resolve reference against base (RFC 3986 section 5). Returns nullopt when either side
// cannot be parsed or the result is not an http(s) URL.
std::optional<std::string> resolveUrl(std::string_view base, std::string_view reference);

// Path component of an absolute URL (no query, no fragment); empty when unparsable.
std::string urlPath(std::string_view url);

// Lowercase extension of the last path segment including the dot (".jpg"), or empty.
std::string pathExtension(std::string_view path);

// Last segment of a path ("/a/b/c.jpg" -> "c.jpg", "/a/" -> "").
std::string lastPathSegment(std::string_view path);

// Lowercase and ensure a leading dot: "JPG" -> ".jpg". Empty input stays empty.
std::string normalizeExtension(std::string_view ext);

} // namespace orderpix::downloader
