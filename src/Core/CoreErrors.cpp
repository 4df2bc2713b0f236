#include "CoreErrors.h"

#include <exception>
#include <filesystem>
#include <new>
#include <sstream>
#include <stdexcept>
#include <string>

#include <toml++/toml.hpp>

#include "Logging.h"

namespace PSYNC::Core {
    namespace {
        struct LastError {
            PSYNC_Result code = PSYNC_RESULT_OK;
            std::string message;
            std::string api_name;
        };

        thread_local LastError g_LastError;

        std::string DescribeFilesystemError(const std::filesystem::filesystem_error &ex) {
            std::ostringstream oss;
            oss << ex.what();
            if (!ex.path1().empty())
                oss << " [" << ex.path1().string() << ']';
            if (!ex.path2().empty())
                oss << " [" << ex.path2().string() << ']';
            return oss.str();
        }

        std::string DescribeParseError(const toml::parse_error &ex) {
            std::ostringstream oss;
            oss << ex.description();
            const auto &source = ex.source();
            if (source.path)
                oss << " [" << *source.path << ']';
            oss << " (line " << source.begin.line << ", column " << source.begin.column << ')';
            return oss.str();
        }
    } // namespace

    void SetLastError(PSYNC_Result code, const std::string &message, const char *api_name) {
        g_LastError.code = code;
        g_LastError.message = message;
        g_LastError.api_name = api_name ? api_name : "";
    }

    PSYNC_Result SetLastErrorAndReturn(PSYNC_Result code,
                                       const char *tag,
                                       const char *api_name,
                                       const std::string &message) {
        CoreLog(PSYNC_LOG_ERROR, tag, "%s: %s", api_name ? api_name : "operation", message.c_str());
        SetLastError(code, message, api_name);
        return code;
    }

    PSYNC_Result GetLastErrorInfo(PSYNC_ErrorInfo *out_info) {
        if (!out_info)
            return PSYNC_RESULT_INVALID_ARGUMENT;
        if (out_info->struct_size < sizeof(PSYNC_ErrorInfo))
            return PSYNC_RESULT_INVALID_SIZE;
        if (g_LastError.code == PSYNC_RESULT_OK)
            return PSYNC_RESULT_NOT_FOUND;

        out_info->result_code = g_LastError.code;
        out_info->message = g_LastError.message.empty() ? nullptr : g_LastError.message.c_str();
        out_info->api_name = g_LastError.api_name.empty() ? nullptr : g_LastError.api_name.c_str();
        return PSYNC_RESULT_OK;
    }

    void ClearLastErrorInfo() {
        g_LastError = LastError{};
    }

    const char *GetErrorString(PSYNC_Result result) {
        switch (result) {
        case PSYNC_RESULT_OK: return "OK";
        case PSYNC_RESULT_FAIL: return "Generic failure";
        case PSYNC_RESULT_INVALID_ARGUMENT: return "Invalid argument";
        case PSYNC_RESULT_NOT_FOUND: return "Not found";
        case PSYNC_RESULT_OUT_OF_MEMORY: return "Out of memory";
        case PSYNC_RESULT_ALREADY_EXISTS: return "Already exists";
        case PSYNC_RESULT_IO_ERROR: return "I/O error";
        case PSYNC_RESULT_INVALID_SIZE: return "Invalid struct_size";

        case PSYNC_RESULT_CONFIG_PARSE_ERROR: return "Config parse error";
        case PSYNC_RESULT_CONFIG_TYPE_MISMATCH: return "Config type mismatch";
        case PSYNC_RESULT_CONFIG_VALUE_OUT_OF_RANGE: return "Config value out of range";

        case PSYNC_RESULT_THEME_UNAVAILABLE: return "Theme unavailable";
        case PSYNC_RESULT_DOCUMENT_INVALID_UTF8: return "Document is not valid UTF-8";
        case PSYNC_RESULT_DOCUMENT_INVALID_NAME: return "Invalid document name";

        default:
            return "Unknown error code";
        }
    }

    CoreResult TranslateException(std::string_view subsystem) {
        CoreResult result{PSYNC_RESULT_FAIL, "Unknown exception"};

        if (auto current = std::current_exception()) {
            try {
                std::rethrow_exception(current);
            } catch (const std::bad_alloc &) {
                result = {PSYNC_RESULT_OUT_OF_MEMORY, "Out of memory"};
            } catch (const toml::parse_error &ex) {
                result = {PSYNC_RESULT_CONFIG_PARSE_ERROR, DescribeParseError(ex)};
            } catch (const std::filesystem::filesystem_error &ex) {
                result = {PSYNC_RESULT_IO_ERROR, DescribeFilesystemError(ex)};
            } catch (const std::logic_error &ex) {
                result = {PSYNC_RESULT_INVALID_ARGUMENT, ex.what()};
            } catch (const std::exception &ex) {
                result.message = ex.what();
            } catch (...) {
                // Non-standard exception types keep the generic failure
            }
        }

        const std::string tag = subsystem.empty() ? std::string("core") : std::string(subsystem);
        CoreLog(PSYNC_LOG_ERROR, tag.c_str(), "%s (code=%d)", result.message.c_str(), static_cast<int>(result.code));
        return result;
    }
} // namespace PSYNC::Core
