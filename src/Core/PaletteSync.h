#ifndef PSYNC_CORE_PALETTESYNC_H
#define PSYNC_CORE_PALETTESYNC_H

#include <string>

#include "psync_errors.h"

#include "SyncConfig.h"

namespace PSYNC::Core {
    struct SyncOptions {
        std::string template_path;
        std::string output_path;
        std::string ghostty_cmd{"ghostty"};
    };

    struct SyncReport {
        bool theme_available{false};
        bool written{false};
        size_t entry_count{0};
    };

    /**
     * @brief Write content unless the file already holds exactly that content
     *
     * Parent directories are created as needed.
     *
     * @param out_written Set to true when the file was (re)written
     */
    PSYNC_Result WriteIfChanged(const std::string &path, const std::string &content, bool *out_written = nullptr);

    /**
     * @brief Render the template with the palette derived from the running terminal theme
     *
     * When the theme cannot be read the template is written back unchanged.
     * Template read and output write failures are reported through the
     * returned code and the thread's last error.
     */
    PSYNC_Result RunPaletteSync(const SyncOptions &options, const SyncConfig &config, SyncReport *out_report = nullptr);
} // namespace PSYNC::Core

#endif // PSYNC_CORE_PALETTESYNC_H
