#ifndef PSYNC_CORE_PALETTEDOCUMENT_H
#define PSYNC_CORE_PALETTEDOCUMENT_H

#include <string>
#include <utility>
#include <vector>

#include "psync_errors.h"

namespace PSYNC::Core {
    /**
     * A line-preserving editor for TOML-like prompt configuration files.
     * Only the palette selection line and the named palette table are touched;
     * every other line is rendered back exactly as it was read.
     */
    class PaletteDocument {
    public:
        using Entries = std::vector<std::pair<std::string, std::string>>;

        // Half-open line range [header, end) of one occurrence of a palette table
        struct SectionSpan {
            size_t header = 0;
            size_t end = 0;
        };

        PaletteDocument() = default;

        // Parsing operations
        bool ParseFromString(const std::string &content);
        bool ParseFromFile(const std::string &filePath);

        // Lines joined with '\n' plus a final '\n'
        std::string Render() const;

        /**
         * Points the top-level `palette = '...'` line at the given name.
         * The first existing selection is rewritten in place; otherwise the
         * line and a blank separator go in front of the first table header.
         */
        bool EnsurePaletteSelection(const std::string &paletteName);

        /**
         * Rewrites quoted values of known keys inside every [palettes.<name>]
         * table, appends missing keys at the end of the table, and creates the
         * table at the end of the document when it does not exist yet.
         */
        bool UpdatePaletteSection(const std::string &paletteName, const Entries &entries);

        std::vector<SectionSpan> FindSection(const std::string &paletteName) const;

        const std::vector<std::string> &GetLines() const { return m_Lines; }
        size_t GetLineCount() const { return m_Lines.size(); }
        bool IsEmpty() const { return m_Lines.empty(); }
        void Clear();

        // UTF-8 specific settings
        void SetStrictUtf8Validation(bool strict) { m_StrictUtf8 = strict; }
        bool IsStrictUtf8Validation() const { return m_StrictUtf8; }

        // Error reporting
        const std::string &GetLastError() const { return m_LastError; }
        PSYNC_Result GetLastErrorCode() const { return m_LastErrorCode; }
        void ClearError();

        static std::string MakeSectionHeader(const std::string &paletteName);
        static std::string FormatEntry(const std::string &indent, const std::string &key, const std::string &value);

    private:
        // Line classification
        static bool IsSectionHeader(const std::string &line);
        static bool IsPaletteSelectionLine(const std::string &line);
        static bool MatchQuotedEntry(const std::string &line, std::string &indent, std::string &key);

        // Validation
        bool ValidatePaletteName(const std::string &paletteName);
        bool ValidateEntries(const Entries &entries);

        bool SetError(PSYNC_Result code, const std::string &error);

        std::vector<std::string> m_Lines;
        bool m_StrictUtf8 = true;
        std::string m_LastError;
        PSYNC_Result m_LastErrorCode = PSYNC_RESULT_OK;
    };
} // namespace PSYNC::Core

#endif // PSYNC_CORE_PALETTEDOCUMENT_H
