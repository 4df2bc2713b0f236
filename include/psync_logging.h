#ifndef PSYNC_LOGGING_H
#define PSYNC_LOGGING_H

#include "psync_types.h"
#include "psync_errors.h"
#include "psync_version.h"

PSYNC_BEGIN_CDECLS

typedef enum PSYNC_LogSeverity {
    PSYNC_LOG_TRACE                 = 0,
    PSYNC_LOG_DEBUG                 = 1,
    PSYNC_LOG_INFO                  = 2,
    PSYNC_LOG_WARN                  = 3,
    PSYNC_LOG_ERROR                 = 4,
    PSYNC_LOG_FATAL                 = 5,
    _PSYNC_LOG_SEVERITY_FORCE_32BIT = 0x7FFFFFFF /**< Force 32-bit enum */
} PSYNC_LogSeverity;

/* ========================================================================
 * Sink Override
 * ======================================================================== */

/**
 * @brief Message descriptor passed to a sink override
 */
typedef struct PSYNC_LogMessageInfo {
    size_t struct_size;         /**< sizeof(PSYNC_LogMessageInfo), must be first */
    PSYNC_Version api_version;  /**< API version */
    PSYNC_LogSeverity severity; /**< Log severity level */
    const char *tag;            /**< Log tag (may be NULL) */
    const char *message;        /**< Log message body */
    const char *formatted_line; /**< Fully formatted log line */
} PSYNC_LogMessageInfo;

/**
 * @brief Called for every message that passes the severity filter
 */
typedef void (*PSYNC_LogSinkDispatchFn)(const PSYNC_LogMessageInfo *info, void *user_data);

/**
 * @brief Called once when the override is cleared
 */
typedef void (*PSYNC_LogSinkShutdownFn)(void *user_data);

typedef enum PSYNC_LogSinkOverrideFlags {
    PSYNC_LOG_SINK_OVERRIDE_SUPPRESS_DEFAULT   = 1u << 0, /**< Don't write to default sink after dispatch */
    _PSYNC_LOG_SINK_OVERRIDE_FLAGS_FORCE_32BIT = 0x7FFFFFFF
} PSYNC_LogSinkOverrideFlags;

typedef struct PSYNC_LogSinkOverrideDesc {
    size_t struct_size;                  /**< sizeof(PSYNC_LogSinkOverrideDesc), must be first */
    PSYNC_LogSinkDispatchFn dispatch;    /**< Required: called for each log message */
    PSYNC_LogSinkShutdownFn on_shutdown; /**< Optional: called when sink is cleared */
    void *user_data;                     /**< User context passed to callbacks */
    uint32_t flags;                      /**< Bitmask of PSYNC_LogSinkOverrideFlags */
} PSYNC_LogSinkOverrideDesc;

#define PSYNC_LOG_SINK_OVERRIDE_DESC_INIT { sizeof(PSYNC_LogSinkOverrideDesc), NULL, NULL, NULL, 0 }

/* ========================================================================
 * Capabilities
 * ======================================================================== */

typedef enum PSYNC_LogCapabilityFlags {
    PSYNC_LOG_CAP_STRUCTURED_TAGS = 1u << 0,
    PSYNC_LOG_CAP_VARIADIC        = 1u << 1,
    PSYNC_LOG_CAP_FILTER_OVERRIDE = 1u << 2,
    PSYNC_LOG_CAP_FILE_SINK       = 1u << 3,
    _PSYNC_LOG_CAP_FORCE_32BIT    = 0x7FFFFFFF /**< Force 32-bit enum */
} PSYNC_LogCapabilityFlags;

#define PSYNC_LOG_SEVERITY_MASK(level) (1u << (level))

typedef struct PSYNC_LogCaps {
    size_t struct_size;                    /**< sizeof(PSYNC_LogCaps), must be first */
    PSYNC_Version api_version;             /**< API version */
    uint32_t capability_flags;             /**< PSYNC_LogCapabilityFlags */
    uint32_t supported_severities_mask;    /**< Bitmask of PSYNC_LOG_SEVERITY_MASK */
    PSYNC_LogSeverity default_min_severity; /**< Current global minimum severity */
} PSYNC_LogCaps;

PSYNC_END_CDECLS

#endif /* PSYNC_LOGGING_H */
