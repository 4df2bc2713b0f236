#include "Logging.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <vector>

namespace PSYNC::Core {
    namespace {
        struct FileCloser {
            void operator()(FILE *file) const {
                if (file)
                    std::fclose(file);
            }
        };

        std::mutex g_LogMutex;
        std::unique_ptr<FILE, FileCloser> g_LogFile;
        std::atomic<int> g_GlobalMinimumSeverity{PSYNC_LOG_INFO};
        constexpr uint32_t kAllSeverityMask =
            PSYNC_LOG_SEVERITY_MASK(PSYNC_LOG_TRACE) |
            PSYNC_LOG_SEVERITY_MASK(PSYNC_LOG_DEBUG) |
            PSYNC_LOG_SEVERITY_MASK(PSYNC_LOG_INFO) |
            PSYNC_LOG_SEVERITY_MASK(PSYNC_LOG_WARN) |
            PSYNC_LOG_SEVERITY_MASK(PSYNC_LOG_ERROR) |
            PSYNC_LOG_SEVERITY_MASK(PSYNC_LOG_FATAL);

        std::shared_mutex g_LogSinkMutex;
        PSYNC_LogSinkOverrideDesc g_LogSinkOverride{};
        bool g_LogSinkOverrideActive{false};

        const char *SeverityToString(PSYNC_LogSeverity level) {
            switch (level) {
            case PSYNC_LOG_TRACE:
                return "TRACE";
            case PSYNC_LOG_DEBUG:
                return "DEBUG";
            case PSYNC_LOG_INFO:
                return "INFO";
            case PSYNC_LOG_WARN:
                return "WARN";
            case PSYNC_LOG_ERROR:
                return "ERROR";
            case PSYNC_LOG_FATAL:
                return "FATAL";
            default:
                return "UNK";
            }
        }

        int ClampSeverity(int value) {
            return std::clamp(value,
                              static_cast<int>(PSYNC_LOG_TRACE),
                              static_cast<int>(PSYNC_LOG_FATAL));
        }

        std::string FormatBody(const char *fmt, va_list args) {
            if (!fmt)
                return {};

            va_list argsCopy;
            va_copy(argsCopy, args);
            int required = vsnprintf(nullptr, 0, fmt, argsCopy);
            va_end(argsCopy);
            if (required <= 0)
                return {};

            std::vector<char> buffer(static_cast<size_t>(required) + 1);
            va_copy(argsCopy, args);
            vsnprintf(buffer.data(), buffer.size(), fmt, argsCopy);
            va_end(argsCopy);
            return std::string(buffer.data(), static_cast<size_t>(required));
        }

        std::string BuildTimestamp() {
            const auto now = std::chrono::system_clock::now();
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()).count() % 1000;
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);

            std::tm local{};
            localtime_r(&seconds, &local);

            char timestamp[64];
            int written = snprintf(timestamp,
                                   sizeof(timestamp),
                                   "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                                   local.tm_year + 1900,
                                   local.tm_mon + 1,
                                   local.tm_mday,
                                   local.tm_hour,
                                   local.tm_min,
                                   local.tm_sec,
                                   static_cast<int>(millis));
            if (written < 0) {
                timestamp[0] = '\0';
            }
            return timestamp;
        }

        std::string BuildLine(PSYNC_LogSeverity level,
                              const char *tag,
                              const std::string &message) {
            std::ostringstream oss;
            oss << "[" << BuildTimestamp() << "]";
            oss << "[palette-sync]";
            oss << "[" << SeverityToString(level) << "]";
            if (tag && *tag) {
                oss << "[" << tag << "]";
            }
            if (!message.empty()) {
                oss << ' ' << message;
            }
            return oss.str();
        }

        void WriteLineLocked(const std::string &line) {
            std::scoped_lock lock(g_LogMutex);
            FILE *target = g_LogFile ? g_LogFile.get() : stderr;
            std::fprintf(target, "%s\n", line.c_str());
            std::fflush(target);
        }

        bool TryDispatchOverride(PSYNC_LogSeverity level,
                                 const char *tag,
                                 const std::string &body,
                                 const std::string &formatted) {
            PSYNC_LogSinkOverrideDesc desc{};
            {
                std::shared_lock lock(g_LogSinkMutex);
                if (!g_LogSinkOverrideActive)
                    return false;
                desc = g_LogSinkOverride;
            }

            PSYNC_LogMessageInfo info{};
            info.struct_size = sizeof(PSYNC_LogMessageInfo);
            info.api_version = psyncGetVersion();
            info.severity = level;
            info.tag = tag;
            info.message = body.c_str();
            info.formatted_line = formatted.c_str();

            // A failing override must not take the logger down with it
            try {
                desc.dispatch(&info, desc.user_data);
            } catch (const std::exception &ex) {
                std::fprintf(stderr, "[palette-sync] log override dispatch exception: %s\n", ex.what());
                return false;
            } catch (...) {
                std::fprintf(stderr, "[palette-sync] log override dispatch threw unknown exception\n");
                return false;
            }
            return (desc.flags & PSYNC_LOG_SINK_OVERRIDE_SUPPRESS_DEFAULT) != 0;
        }

        bool ShouldLog(PSYNC_LogSeverity level) {
            int threshold = g_GlobalMinimumSeverity.load(std::memory_order_relaxed);
            return static_cast<int>(level) >= ClampSeverity(threshold);
        }

        void LogMessageInternal(PSYNC_LogSeverity level,
                                const char *tag,
                                const char *fmt,
                                va_list args) {
            if (!ShouldLog(level))
                return;

            std::string body = FormatBody(fmt, args);
            std::string line = BuildLine(level, tag, body);
            if (TryDispatchOverride(level, tag, body, line))
                return;
            WriteLineLocked(line);
        }
    } // namespace

    void CoreLog(PSYNC_LogSeverity level, const char *tag, const char *fmt, ...) {
        if (!fmt)
            return;
        va_list args;
        va_start(args, fmt);
        CoreLogVa(level, tag, fmt, args);
        va_end(args);
    }

    void CoreLogVa(PSYNC_LogSeverity level, const char *tag, const char *fmt, va_list args) {
        if (!fmt)
            return;
        va_list argsCopy;
        va_copy(argsCopy, args);
        LogMessageInternal(level, tag, fmt, argsCopy);
        va_end(argsCopy);
    }

    void SetLogFilter(PSYNC_LogSeverity minimum_level) {
        g_GlobalMinimumSeverity.store(ClampSeverity(static_cast<int>(minimum_level)),
                                      std::memory_order_relaxed);
    }

    PSYNC_LogSeverity GetLogFilter() {
        return static_cast<PSYNC_LogSeverity>(g_GlobalMinimumSeverity.load(std::memory_order_relaxed));
    }

    PSYNC_Result SetLogFile(const std::string &path) {
        std::unique_ptr<FILE, FileCloser> file;
        if (!path.empty()) {
            file.reset(std::fopen(path.c_str(), "a"));
            if (!file)
                return PSYNC_RESULT_IO_ERROR;
        }

        std::scoped_lock lock(g_LogMutex);
        g_LogFile = std::move(file);
        return PSYNC_RESULT_OK;
    }

    PSYNC_Result GetLoggingCaps(PSYNC_LogCaps *out_caps) {
        if (!out_caps)
            return PSYNC_RESULT_INVALID_ARGUMENT;
        PSYNC_LogCaps caps{};
        caps.struct_size = sizeof(PSYNC_LogCaps);
        caps.api_version = psyncGetVersion();
        caps.capability_flags = PSYNC_LOG_CAP_STRUCTURED_TAGS |
            PSYNC_LOG_CAP_VARIADIC |
            PSYNC_LOG_CAP_FILTER_OVERRIDE |
            PSYNC_LOG_CAP_FILE_SINK;
        caps.supported_severities_mask = kAllSeverityMask;
        caps.default_min_severity = GetLogFilter();
        *out_caps = caps;
        return PSYNC_RESULT_OK;
    }

    PSYNC_Result RegisterLogSinkOverride(const PSYNC_LogSinkOverrideDesc *desc) {
        if (!desc || desc->struct_size < sizeof(PSYNC_LogSinkOverrideDesc) || !desc->dispatch) {
            return PSYNC_RESULT_INVALID_ARGUMENT;
        }

        PSYNC_LogSinkOverrideDesc copy = *desc;
        copy.struct_size = sizeof(PSYNC_LogSinkOverrideDesc);

        std::unique_lock lock(g_LogSinkMutex);
        if (g_LogSinkOverrideActive) {
            return PSYNC_RESULT_ALREADY_EXISTS;
        }
        g_LogSinkOverride = copy;
        g_LogSinkOverrideActive = true;
        return PSYNC_RESULT_OK;
    }

    PSYNC_Result ClearLogSinkOverride() {
        std::unique_lock lock(g_LogSinkMutex);
        if (!g_LogSinkOverrideActive) {
            return PSYNC_RESULT_NOT_FOUND;
        }
        auto shutdown = g_LogSinkOverride.on_shutdown;
        void *user_data = g_LogSinkOverride.user_data;
        g_LogSinkOverride = {};
        g_LogSinkOverrideActive = false;
        lock.unlock();

        // Shutdown callback runs outside the lock
        if (shutdown) {
            try {
                shutdown(user_data);
            } catch (const std::exception &ex) {
                std::fprintf(stderr, "[palette-sync] log shutdown callback exception: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "[palette-sync] log shutdown callback threw unknown exception\n");
            }
        }
        return PSYNC_RESULT_OK;
    }
} // namespace PSYNC::Core
