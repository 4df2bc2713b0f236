#ifndef PSYNC_CORE_SYNCCONFIG_H
#define PSYNC_CORE_SYNCCONFIG_H

#include <optional>
#include <string>
#include <string_view>

#include "psync_errors.h"

#include "PaletteDeriver.h"

namespace PSYNC::Core {
    constexpr const char *kDefaultPaletteName = "ghostty_dynamic";

    struct SyncConfig {
        Color::ThresholdConfig thresholds;
        Color::FallbackColors fallback;
        std::string palette_name{kDefaultPaletteName};
    };

    struct ConfigLoadError {
        PSYNC_Result code{PSYNC_RESULT_OK};
        std::string message;
        std::optional<std::string> file;
        std::optional<int> line;
        std::optional<int> column;
    };

    // Non-empty and limited to [A-Za-z0-9_-]
    bool IsValidPaletteName(std::string_view name);

    class SyncConfigLoader {
    public:
        SyncConfigLoader() = default;

        // A missing file leaves the defaults in place and succeeds.
        PSYNC_Result LoadFile(const std::string &path, SyncConfig &out_config, ConfigLoadError &out_error) const;

        PSYNC_Result LoadString(std::string_view text,
                                std::string_view source_path,
                                SyncConfig &out_config,
                                ConfigLoadError &out_error) const;
    };
} // namespace PSYNC::Core

#endif // PSYNC_CORE_SYNCCONFIG_H
