#ifndef PSYNC_TYPES_H
#define PSYNC_TYPES_H

#include <stddef.h>
#include <stdint.h>

#ifndef PSYNC_BEGIN_CDECLS
#ifdef __cplusplus
#define PSYNC_BEGIN_CDECLS extern "C" {
#else
#define PSYNC_BEGIN_CDECLS
#endif
#endif // !PSYNC_BEGIN_CDECLS

#ifndef PSYNC_END_CDECLS
#ifdef __cplusplus
#define PSYNC_END_CDECLS }
#else
#define PSYNC_END_CDECLS
#endif
#endif // !PSYNC_END_CDECLS

PSYNC_BEGIN_CDECLS

/* ========================================================================
 * Basic Types
 * ======================================================================== */

/**
 * @brief Semantic version triple used for log and config schema reporting
 */
typedef struct PSYNC_Version {
    uint16_t major;
    uint16_t minor;
    uint16_t patch;
    uint16_t reserved;
} PSYNC_Version;

static inline PSYNC_Version psyncMakeVersion(uint16_t major, uint16_t minor, uint16_t patch) {
    PSYNC_Version v;
    v.major = major;
    v.minor = minor;
    v.patch = patch;
    v.reserved = 0;
    return v;
}

PSYNC_END_CDECLS

#endif /* PSYNC_TYPES_H */
