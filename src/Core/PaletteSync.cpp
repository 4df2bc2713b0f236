#include "PaletteSync.h"

#include "CoreErrors.h"
#include "Logging.h"
#include "PaletteDeriver.h"
#include "PaletteDocument.h"
#include "PathUtils.h"
#include "ThemeReader.h"

namespace PSYNC::Core {
    namespace {
        constexpr const char *kLogCategory = "sync";
    } // namespace

    PSYNC_Result WriteIfChanged(const std::string &path, const std::string &content, bool *out_written) {
        if (out_written)
            *out_written = false;
        if (path.empty())
            return SetLastErrorAndReturn(PSYNC_RESULT_INVALID_ARGUMENT, kLogCategory, "WriteIfChanged",
                                         "Output path is empty");

        if (utils::FileExistsUtf8(path)) {
            std::string existing;
            if (utils::ReadTextFileUtf8(path, existing) && existing == content) {
                CoreLog(PSYNC_LOG_DEBUG, kLogCategory, "'%s' is up to date", path.c_str());
                return PSYNC_RESULT_OK;
            }
        }

        if (!utils::WriteTextFileUtf8(path, content))
            return SetLastErrorAndReturn(PSYNC_RESULT_IO_ERROR, kLogCategory, "WriteIfChanged",
                                         "Failed to write '" + path + "'");

        if (out_written)
            *out_written = true;
        CoreLog(PSYNC_LOG_INFO, kLogCategory, "Wrote '%s' (%zu bytes)", path.c_str(), content.size());
        return PSYNC_RESULT_OK;
    }

    PSYNC_Result RunPaletteSync(const SyncOptions &options, const SyncConfig &config, SyncReport *out_report) {
        SyncReport report;

        PaletteDocument document;
        if (!document.ParseFromFile(options.template_path)) {
            return SetLastErrorAndReturn(document.GetLastErrorCode(), kLogCategory, "RunPaletteSync",
                                         document.GetLastError());
        }

        auto theme = ReadTheme(options.ghostty_cmd);
        report.theme_available = theme.has_value();

        std::string rendered;
        if (!theme) {
            CoreLog(PSYNC_LOG_WARN, kLogCategory,
                    "Theme unavailable from '%s'; leaving template contents unchanged",
                    options.ghostty_cmd.c_str());
            // Reread verbatim so line endings and a missing final newline survive
            if (!utils::ReadTextFileUtf8(options.template_path, rendered)) {
                return SetLastErrorAndReturn(PSYNC_RESULT_IO_ERROR, kLogCategory, "RunPaletteSync",
                                             "Failed to read '" + options.template_path + "'");
            }
        } else {
            const Color::Palette palette = Color::DerivePalette(*theme, config.thresholds, config.fallback);
            const auto entries = Color::ToNamedEntries(palette);
            report.entry_count = entries.size();

            if (!document.EnsurePaletteSelection(config.palette_name) ||
                !document.UpdatePaletteSection(config.palette_name, entries)) {
                return SetLastErrorAndReturn(document.GetLastErrorCode(), kLogCategory, "RunPaletteSync",
                                             document.GetLastError());
            }
            rendered = document.Render();
            CoreLog(PSYNC_LOG_DEBUG, kLogCategory, "Rendered %zu palette entries into [palettes.%s]",
                    entries.size(), config.palette_name.c_str());
        }

        bool written = false;
        PSYNC_CHECK(WriteIfChanged(options.output_path, rendered, &written));
        report.written = written;

        if (out_report)
            *out_report = report;
        return PSYNC_RESULT_OK;
    }
} // namespace PSYNC::Core
