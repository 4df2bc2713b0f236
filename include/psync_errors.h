#ifndef PSYNC_ERRORS_H
#define PSYNC_ERRORS_H

/**
 * @file psync_errors.h
 * @brief Result codes and error checking macros for PaletteSync
 *
 * This file consolidates all error-related definitions:
 * - Error code definitions (PSYNC_Result values)
 * - Error checking macros (PSYNC_SUCCEEDED, PSYNC_FAILED, PSYNC_CHECK)
 * - Last-error information structure
 */

#include "psync_types.h"

PSYNC_BEGIN_CDECLS

/* ========================================================================
 * Result Type
 * ======================================================================== */

typedef int32_t PSYNC_Result;

/**
 * @defgroup ErrorCodes Error Codes
 *
 * Error code ranges:
 *   -    0        : Success
 *   -   -1 to  -99: Generic errors
 *   - -100 to -199: Config errors
 *   - -200 to -299: Theme source and document errors
 *
 * @{
 */

/* ========================================================================
 * Result Checking Macros
 * ======================================================================== */

/**
 * @def PSYNC_SUCCEEDED
 * @brief Check if a PSYNC_Result indicates success (>= 0)
 */
#define PSYNC_SUCCEEDED(result) ((result) >= 0)

/**
 * @def PSYNC_FAILED
 * @brief Check if a PSYNC_Result indicates failure (< 0)
 */
#define PSYNC_FAILED(result) ((result) < 0)

/**
 * @def PSYNC_CHECK
 * @brief Check result and return immediately on failure
 *
 * @code
 * PSYNC_Result Job() {
 *     PSYNC_CHECK(LoadTemplate());
 *     PSYNC_CHECK(WriteOutput());
 *     return PSYNC_RESULT_OK;
 * }
 * @endcode
 */
#define PSYNC_CHECK(expr) do { \
    PSYNC_Result _psync_check_result_ = (expr); \
    if (PSYNC_FAILED(_psync_check_result_)) return _psync_check_result_; \
} while(0)

/* ========================================================================
 * Error Code Definitions
 * ======================================================================== */

enum {
    PSYNC_RESULT_OK = 0,                      /**< Success */
    PSYNC_RESULT_FAIL = -1,                   /**< Generic failure */
    PSYNC_RESULT_INVALID_ARGUMENT = -2,       /**< Invalid function argument */
    PSYNC_RESULT_NOT_FOUND = -5,              /**< Requested item not found */
    PSYNC_RESULT_OUT_OF_MEMORY = -6,          /**< Memory allocation failed */
    PSYNC_RESULT_ALREADY_EXISTS = -10,        /**< Item already exists */
    PSYNC_RESULT_IO_ERROR = -13,              /**< I/O operation failed */
    PSYNC_RESULT_INVALID_SIZE = -16,          /**< Invalid struct_size field */

    /* ========== Config Errors (-100 to -199) ========== */
    PSYNC_RESULT_CONFIG_PARSE_ERROR = -100,       /**< Config file is not valid TOML */
    PSYNC_RESULT_CONFIG_TYPE_MISMATCH = -101,     /**< Config value has the wrong type */
    PSYNC_RESULT_CONFIG_VALUE_OUT_OF_RANGE = -105, /**< Config value out of valid range */

    /* ========== Theme Source / Document Errors (-200 to -299) ========== */
    PSYNC_RESULT_THEME_UNAVAILABLE = -200,        /**< Theme source process failed */
    PSYNC_RESULT_DOCUMENT_INVALID_UTF8 = -201,    /**< Document text is not valid UTF-8 */
    PSYNC_RESULT_DOCUMENT_INVALID_NAME = -202     /**< Palette or key name not representable */
};

/** @} */ /* end of ErrorCodes group */

/* ========================================================================
 * Last Error Information
 * ======================================================================== */

/**
 * @brief Detailed information about the last failure on the calling thread
 */
typedef struct PSYNC_ErrorInfo {
    size_t struct_size;          /**< sizeof(PSYNC_ErrorInfo), must be first */
    PSYNC_Result result_code;    /**< The error code */
    const char *message;         /**< Human-readable message (may be NULL) */
    const char *api_name;        /**< Operation that failed (may be NULL) */
} PSYNC_ErrorInfo;

#define PSYNC_ERROR_INFO_INIT { sizeof(PSYNC_ErrorInfo), PSYNC_RESULT_OK, NULL, NULL }

PSYNC_END_CDECLS

#endif /* PSYNC_ERRORS_H */
