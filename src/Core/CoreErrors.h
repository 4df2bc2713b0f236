#ifndef PSYNC_CORE_ERRORS_H
#define PSYNC_CORE_ERRORS_H

#include <string>
#include <string_view>
#include <utility>

#include "psync_errors.h"

namespace PSYNC::Core {

struct CoreResult {
    PSYNC_Result code{PSYNC_RESULT_OK};
    std::string message;
};

/**
 * @brief Map the exception in flight to a result code and log it under @p subsystem
 *
 * Filesystem errors carry their paths and TOML parse errors their source
 * position in the returned message. Must be called from inside a catch block.
 */
CoreResult TranslateException(std::string_view subsystem);

/**
 * @brief Record the calling thread's last error
 *
 * @param code Result code; PSYNC_RESULT_OK clears the record
 * @param message Error message (copied)
 * @param api_name Name of the operation that failed (optional)
 */
void SetLastError(PSYNC_Result code, const std::string &message, const char *api_name = nullptr);

// Logs "<api>: <message>" at ERROR under tag, records it and returns code.
PSYNC_Result SetLastErrorAndReturn(PSYNC_Result code,
                                   const char *tag,
                                   const char *api_name,
                                   const std::string &message);

/**
 * @brief Copy out the calling thread's last error
 *
 * @return PSYNC_RESULT_OK when an error is recorded, PSYNC_RESULT_NOT_FOUND otherwise.
 *         The strings stay valid until the next error is set on this thread.
 */
PSYNC_Result GetLastErrorInfo(PSYNC_ErrorInfo *out_info);

void ClearLastErrorInfo();

const char *GetErrorString(PSYNC_Result result);

/**
 * @brief Run fn and turn any escaping exception into a recorded result code
 */
template <typename Fn>
PSYNC_Result GuardResult(std::string_view subsystem, Fn &&fn) noexcept {
    try {
        return static_cast<PSYNC_Result>(std::forward<Fn>(fn)());
    } catch (...) {
        CoreResult result;
        try {
            result = TranslateException(subsystem);
            SetLastError(result.code, result.message);
        } catch (...) {
            // Translation itself ran out of memory
            return PSYNC_RESULT_OUT_OF_MEMORY;
        }
        return result.code;
    }
}

} // namespace PSYNC::Core

#endif // PSYNC_CORE_ERRORS_H
