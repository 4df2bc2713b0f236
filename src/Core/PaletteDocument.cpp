#include "PaletteDocument.h"

#include <algorithm>
#include <unordered_set>

#include "Logging.h"
#include "PathUtils.h"
#include "StringUtils.h"
#include "SyncConfig.h"

namespace PSYNC::Core {
    namespace {
        constexpr const char *kLogCategory = "document";

        bool IsEntryKeyChar(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
        }

        bool IsQuote(char c) {
            return c == '\'' || c == '"';
        }

        size_t SkipSpaces(const std::string &line, size_t pos) {
            while (pos < line.size() && utils::IsSpace(line[pos]))
                ++pos;
            return pos;
        }

        // `=` then a quoted value with no inner quotes and only whitespace after it.
        bool MatchQuotedAssignment(const std::string &line, size_t pos, bool allowEmptyValue) {
            pos = SkipSpaces(line, pos);
            if (pos >= line.size() || line[pos] != '=')
                return false;
            pos = SkipSpaces(line, pos + 1);
            if (pos >= line.size() || !IsQuote(line[pos]))
                return false;
            ++pos;

            const size_t valueStart = pos;
            while (pos < line.size() && !IsQuote(line[pos]))
                ++pos;
            if (pos >= line.size())
                return false;
            if (!allowEmptyValue && pos == valueStart)
                return false;
            ++pos;

            return SkipSpaces(line, pos) == line.size();
        }
    } // namespace

    bool PaletteDocument::ParseFromString(const std::string &content) {
        Clear();

        std::string text = content;
        if (utils::StripUtf8Bom(text))
            CoreLog(PSYNC_LOG_DEBUG, kLogCategory, "Dropped UTF-8 byte order mark");

        if (m_StrictUtf8 && !utils::IsValidUtf8(text))
            return SetError(PSYNC_RESULT_DOCUMENT_INVALID_UTF8, "Document contains invalid UTF-8");

        m_Lines = utils::SplitLines(text);
        return true;
    }

    bool PaletteDocument::ParseFromFile(const std::string &filePath) {
        std::string content;
        if (!utils::ReadTextFileUtf8(filePath, content)) {
            Clear();
            return SetError(PSYNC_RESULT_IO_ERROR, "Failed to read '" + filePath + "'");
        }
        return ParseFromString(content);
    }

    std::string PaletteDocument::Render() const {
        std::string out;
        for (const auto &line : m_Lines) {
            out += line;
            out += '\n';
        }
        if (m_Lines.empty())
            out = "\n";
        return out;
    }

    bool PaletteDocument::EnsurePaletteSelection(const std::string &paletteName) {
        if (!ValidatePaletteName(paletteName))
            return false;

        const std::string selection = "palette = '" + paletteName + "'";

        for (auto &line : m_Lines) {
            if (IsPaletteSelectionLine(line)) {
                line = selection;
                return true;
            }
        }

        size_t insertAt = m_Lines.size();
        for (size_t i = 0; i < m_Lines.size(); ++i) {
            if (utils::StartsWith(utils::TrimStringCopy(m_Lines[i]), "[")) {
                insertAt = i;
                break;
            }
        }

        m_Lines.insert(m_Lines.begin() + static_cast<std::ptrdiff_t>(insertAt), {selection, std::string()});
        return true;
    }

    bool PaletteDocument::UpdatePaletteSection(const std::string &paletteName, const Entries &entries) {
        if (!ValidatePaletteName(paletteName) || !ValidateEntries(entries))
            return false;

        const std::string header = MakeSectionHeader(paletteName);
        std::vector<std::string> output;
        output.reserve(m_Lines.size() + entries.size() + 2);

        bool inSection = false;
        bool foundSection = false;
        // Shared by every occurrence of the table; appended keys are not recorded
        std::unordered_set<std::string> seen;

        auto appendMissing = [&]() {
            for (const auto &[key, value] : entries) {
                if (seen.find(key) == seen.end())
                    output.push_back(FormatEntry("", key, value));
            }
        };

        for (const auto &line : m_Lines) {
            if (IsSectionHeader(line)) {
                if (inSection) {
                    appendMissing();
                    inSection = false;
                }
                if (utils::TrimStringCopy(line) == header) {
                    foundSection = true;
                    inSection = true;
                    output.push_back(line);
                    continue;
                }
            }

            if (inSection) {
                std::string indent;
                std::string key;
                if (MatchQuotedEntry(line, indent, key)) {
                    auto it = std::find_if(entries.begin(), entries.end(),
                                           [&key](const auto &entry) { return entry.first == key; });
                    if (it != entries.end()) {
                        output.push_back(FormatEntry(indent, key, it->second));
                        seen.insert(key);
                        continue;
                    }
                }
            }

            output.push_back(line);
        }

        if (inSection)
            appendMissing();

        if (!foundSection) {
            if (!output.empty() && !utils::TrimStringCopy(output.back()).empty())
                output.emplace_back();
            output.push_back(header);
            for (const auto &[key, value] : entries)
                output.push_back(FormatEntry("", key, value));
            CoreLog(PSYNC_LOG_DEBUG, kLogCategory, "Created %s with %zu entries", header.c_str(), entries.size());
        }

        m_Lines = std::move(output);
        return true;
    }

    std::vector<PaletteDocument::SectionSpan> PaletteDocument::FindSection(const std::string &paletteName) const {
        std::vector<SectionSpan> spans;
        const std::string header = MakeSectionHeader(paletteName);

        for (size_t i = 0; i < m_Lines.size(); ++i) {
            if (!IsSectionHeader(m_Lines[i]))
                continue;
            if (!spans.empty() && spans.back().end == 0)
                spans.back().end = i;
            if (utils::TrimStringCopy(m_Lines[i]) == header)
                spans.push_back({i, 0});
        }
        if (!spans.empty() && spans.back().end == 0)
            spans.back().end = m_Lines.size();
        return spans;
    }

    void PaletteDocument::Clear() {
        m_Lines.clear();
        ClearError();
    }

    void PaletteDocument::ClearError() {
        m_LastError.clear();
        m_LastErrorCode = PSYNC_RESULT_OK;
    }

    std::string PaletteDocument::MakeSectionHeader(const std::string &paletteName) {
        return "[palettes." + paletteName + "]";
    }

    std::string PaletteDocument::FormatEntry(const std::string &indent, const std::string &key, const std::string &value) {
        return indent + key + " = '" + value + "'";
    }

    bool PaletteDocument::IsSectionHeader(const std::string &line) {
        const std::string trimmed = utils::TrimStringCopy(line);
        return utils::StartsWith(trimmed, "[") && utils::EndsWith(trimmed, "]");
    }

    bool PaletteDocument::IsPaletteSelectionLine(const std::string &line) {
        static const std::string kKey = "palette";
        if (!utils::StartsWith(line, kKey))
            return false;
        return MatchQuotedAssignment(line, kKey.size(), false);
    }

    bool PaletteDocument::MatchQuotedEntry(const std::string &line, std::string &indent, std::string &key) {
        const size_t keyStart = SkipSpaces(line, 0);
        size_t keyEnd = keyStart;
        while (keyEnd < line.size() && IsEntryKeyChar(line[keyEnd]))
            ++keyEnd;
        if (keyEnd == keyStart)
            return false;
        if (!MatchQuotedAssignment(line, keyEnd, true))
            return false;

        indent = line.substr(0, keyStart);
        key = line.substr(keyStart, keyEnd - keyStart);
        return true;
    }

    bool PaletteDocument::ValidatePaletteName(const std::string &paletteName) {
        if (!IsValidPaletteName(paletteName))
            return SetError(PSYNC_RESULT_DOCUMENT_INVALID_NAME, "Invalid palette name: '" + paletteName + "'");
        return true;
    }

    bool PaletteDocument::ValidateEntries(const Entries &entries) {
        for (const auto &[key, value] : entries) {
            if (key.empty() || !std::all_of(key.begin(), key.end(), IsEntryKeyChar))
                return SetError(PSYNC_RESULT_DOCUMENT_INVALID_NAME, "Invalid palette key: '" + key + "'");
            if (value.find_first_of("'\"\r\n") != std::string::npos)
                return SetError(PSYNC_RESULT_INVALID_ARGUMENT, "Invalid value for '" + key + "'");
        }
        return true;
    }

    bool PaletteDocument::SetError(PSYNC_Result code, const std::string &error) {
        m_LastErrorCode = code;
        m_LastError = error;
        CoreLog(PSYNC_LOG_DEBUG, kLogCategory, "%s", error.c_str());
        return false;
    }
} // namespace PSYNC::Core
