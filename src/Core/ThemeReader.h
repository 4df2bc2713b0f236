#ifndef PSYNC_CORE_THEMEREADER_H
#define PSYNC_CORE_THEMEREADER_H

#include <optional>
#include <string>

#include "psync_errors.h"

#include "PaletteDeriver.h"

namespace PSYNC::Core {
    // Wraps an argument in single quotes for /bin/sh.
    std::string ShellQuote(const std::string &arg);

    /**
     * @brief Run "<cmd> +show-config" and capture its stdout
     *
     * @return PSYNC_RESULT_OK on exit status 0, PSYNC_RESULT_THEME_UNAVAILABLE
     *         when the process cannot start or exits non-zero
     */
    PSYNC_Result RunShowConfig(const std::string &cmd, std::string &out_text);

    // Never fails; unrecognized or malformed lines are skipped.
    Color::ThemeColors ParseShowConfig(const std::string &text);

    // std::nullopt only when the process failed. A run that parsed nothing still yields a value.
    std::optional<Color::ThemeColors> ReadTheme(const std::string &cmd);
} // namespace PSYNC::Core

#endif // PSYNC_CORE_THEMEREADER_H
