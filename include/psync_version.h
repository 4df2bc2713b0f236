#ifndef PSYNC_VERSION_H
#define PSYNC_VERSION_H

#include "psync_types.h"

PSYNC_BEGIN_CDECLS

#define PSYNC_VERSION_MAJOR 1u
#define PSYNC_VERSION_MINOR 2u
#define PSYNC_VERSION_PATCH 0u

#define PSYNC_VERSION_STR "1.2.0"

static inline PSYNC_Version psyncGetVersion(void) {
    return psyncMakeVersion(PSYNC_VERSION_MAJOR,
                            PSYNC_VERSION_MINOR,
                            PSYNC_VERSION_PATCH);
}

PSYNC_END_CDECLS

#endif /* PSYNC_VERSION_H */
