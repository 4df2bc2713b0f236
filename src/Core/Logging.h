#ifndef PSYNC_CORE_LOGGING_H
#define PSYNC_CORE_LOGGING_H

#include <cstdarg>
#include <string>

#include "psync_logging.h"

namespace PSYNC::Core {
    void CoreLog(PSYNC_LogSeverity level, const char *tag, const char *fmt, ...);
    void CoreLogVa(PSYNC_LogSeverity level, const char *tag, const char *fmt, va_list args);

    void SetLogFilter(PSYNC_LogSeverity minimum_level);
    PSYNC_LogSeverity GetLogFilter();

    // Redirect the default sink to an appended file. Empty path restores stderr.
    PSYNC_Result SetLogFile(const std::string &path);

    PSYNC_Result GetLoggingCaps(PSYNC_LogCaps *out_caps);
    PSYNC_Result RegisterLogSinkOverride(const PSYNC_LogSinkOverrideDesc *desc);
    PSYNC_Result ClearLogSinkOverride();
} // namespace PSYNC::Core

#endif // PSYNC_CORE_LOGGING_H
