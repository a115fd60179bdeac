/*
 * Version macros for orderpix
 *
 * The build passes ORDERPIX_VERSION_MAJOR/MINOR/PATCH and ORDERPIX_VERSION_STRING as
 * compile definitions taken from the CMake project version. The defaults below keep
 * the sources buildable without them.
 */

#pragma once

#ifndef ORDERPIX_VERSION_MAJOR
#define ORDERPIX_VERSION_MAJOR 0
#endif

#ifndef ORDERPIX_VERSION_MINOR
#define ORDERPIX_VERSION_MINOR 0
#endif

#ifndef ORDERPIX_VERSION_PATCH
#define ORDERPIX_VERSION_PATCH 0
#endif

#ifndef ORDERPIX_VERSION_STRING
#define ORDERPIX_VERSION_STRING "0.0.0+dev"
#endif

#ifndef ORDERPIX_BUILD_DATE
#define ORDERPIX_BUILD_DATE __DATE__ " " __TIME__
#endif

#ifndef ORDERPIX_VERSION_LONG_STRING
#define ORDERPIX_VERSION_LONG_STRING ORDERPIX_VERSION_STRING " (built: " ORDERPIX_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace orderpix {
namespace version {
constexpr int major_v = ORDERPIX_VERSION_MAJOR;
constexpr int minor_v = ORDERPIX_VERSION_MINOR;
constexpr int patch_v = ORDERPIX_VERSION_PATCH;
constexpr const char* string_v = ORDERPIX_VERSION_STRING;
constexpr const char* long_string_v = ORDERPIX_VERSION_LONG_STRING;
} // namespace version
} // namespace orderpix
#endif
