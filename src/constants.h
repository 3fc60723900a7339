#pragma once
#include <cstdint>
#include <cstddef>

// =============================================================================
// MBKIT CONSTANTS
// Compile-time defaults, overridable with -D or at runtime through Config
// =============================================================================

// === ARCHIVE LAYOUT ===
#ifndef MBK_DEFAULT_BUNDLE_SIZE
#define MBK_DEFAULT_BUNDLE_SIZE 100  // Blocks per merged-blocks bundle
#endif
#ifndef MBK_BUNDLE_KEY_DIGITS
#define MBK_BUNDLE_KEY_DIGITS 10  // Zero padded base number width
#endif

// === STREAMING ===
#ifndef MBK_RETRY_DELAY_MS
#define MBK_RETRY_DELAY_MS 4000  // Fixed backoff before reconnecting a broken stream
#endif
#ifndef MBK_CONNECT_TIMEOUT_MS
#define MBK_CONNECT_TIMEOUT_MS 5000
#endif
#ifndef MBK_PRINT_QUEUE_DEPTH
#define MBK_PRINT_QUEUE_DEPTH 10  // Responses decoded concurrently in print mode
#endif

namespace mbk {

// Bundle file header: "dbin" + version + 3 byte content type
static constexpr char     BUNDLE_MAGIC[4]        = {'d', 'b', 'i', 'n'};
static constexpr uint8_t  BUNDLE_VERSION         = 1;
static constexpr char     BUNDLE_CONTENT_TYPE[3] = {'m', 'b', 'k'};
static constexpr size_t   BUNDLE_HEADER_SIZE     = 8;

// Upper bound on a single encoded record (block or stream frame)
static constexpr uint32_t MAX_RECORD_SIZE = 32 * 1024 * 1024;

static constexpr const char* TMP_SUFFIX     = ".tmp";
static constexpr const char* BROKEN_SUFFIX  = ".broken";
static constexpr const char* MISSING_SUFFIX = ".missing";

// Cursor wire format version tag
static constexpr const char* CURSOR_PREFIX = "c1";

static constexpr int MBK_VERSION_MAJOR = 1;
static constexpr int MBK_VERSION_MINOR = 0;
static constexpr int MBK_VERSION_PATCH = 0;

} // namespace mbk
