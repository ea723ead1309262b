/*
 * Fallback version header for clawdesk
 *
 * The build system passes CLAWDESK_VERSION_* definitions on the command line;
 * these defaults keep the tree compiling when it does not.
 */

#pragma once

#ifndef CLAWDESK_VERSION_MAJOR
#define CLAWDESK_VERSION_MAJOR 0
#endif

#ifndef CLAWDESK_VERSION_MINOR
#define CLAWDESK_VERSION_MINOR 0
#endif

#ifndef CLAWDESK_VERSION_PATCH
#define CLAWDESK_VERSION_PATCH 0
#endif

#ifndef CLAWDESK_VERSION_STRING
#define CLAWDESK_VERSION_STRING "0.0.0+dev"
#endif

#ifndef CLAWDESK_BUILD_DATE
#define CLAWDESK_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z+qual (built: YYYY-MM-DD HH:MM:SS)"
#ifndef CLAWDESK_VERSION_LONG_STRING
#define CLAWDESK_VERSION_LONG_STRING CLAWDESK_VERSION_STRING " (built: " CLAWDESK_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace clawdesk {
namespace version {
constexpr int major_v = CLAWDESK_VERSION_MAJOR;
constexpr int minor_v = CLAWDESK_VERSION_MINOR;
constexpr int patch_v = CLAWDESK_VERSION_PATCH;
constexpr const char* string_v = CLAWDESK_VERSION_STRING;
constexpr const char* build_date_v = CLAWDESK_BUILD_DATE;
constexpr const char* long_string_v = CLAWDESK_VERSION_LONG_STRING;
} // namespace version
} // namespace clawdesk
#endif
