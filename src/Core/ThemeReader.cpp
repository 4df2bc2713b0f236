#include "ThemeReader.h"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string_view>

#include <sys/wait.h>

#include "Logging.h"
#include "StringUtils.h"

namespace PSYNC::Core {
    namespace {
        constexpr const char *kLogCategory = "theme";

        struct PipeCloser {
            void operator()(FILE *pipe) const {
                if (pipe)
                    pclose(pipe);
            }
        };

        bool IsKeyChar(char c) {
            return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
        }

        bool IsDigit(char c) {
            return c >= '0' && c <= '9';
        }

        void SkipSpaces(std::string_view &text) {
            while (!text.empty() && utils::IsSpace(text.front()))
                text.remove_prefix(1);
        }

        // "<key> = <value>" with a lowercase key; value is returned trimmed.
        bool SplitKeyValue(std::string_view line, std::string_view &key, std::string_view &value) {
            size_t keyLen = 0;
            while (keyLen < line.size() && IsKeyChar(line[keyLen]))
                ++keyLen;
            if (keyLen == 0)
                return false;

            key = line.substr(0, keyLen);
            std::string_view rest = line.substr(keyLen);
            SkipSpaces(rest);
            if (rest.empty() || rest.front() != '=')
                return false;
            rest.remove_prefix(1);
            SkipSpaces(rest);
            while (!rest.empty() && utils::IsSpace(rest.back()))
                rest.remove_suffix(1);
            if (rest.empty())
                return false;

            value = rest;
            return true;
        }

        // "<index> = #rrggbb"
        bool ParsePaletteEntry(std::string_view value, int &out_index, Color::Color &out_color) {
            size_t digits = 0;
            while (digits < value.size() && IsDigit(value[digits]))
                ++digits;
            if (digits == 0)
                return false;

            long long index = 0;
            for (size_t i = 0; i < digits; ++i) {
                index = index * 10 + (value[i] - '0');
                if (index > INT_MAX)
                    return false;
            }

            std::string_view rest = value.substr(digits);
            SkipSpaces(rest);
            if (rest.empty() || rest.front() != '=')
                return false;
            rest.remove_prefix(1);
            SkipSpaces(rest);

            // No surrounding whitespace is allowed around the color itself
            if (rest.size() != 7)
                return false;
            auto color = Color::ParseHexColor(rest);
            if (!color)
                return false;

            out_index = static_cast<int>(index);
            out_color = *color;
            return true;
        }
    } // namespace

    std::string ShellQuote(const std::string &arg) {
        std::string quoted = "'";
        for (char c : arg) {
            if (c == '\'')
                quoted += "'\\''";
            else
                quoted += c;
        }
        quoted += '\'';
        return quoted;
    }

    PSYNC_Result RunShowConfig(const std::string &cmd, std::string &out_text) {
        out_text.clear();
        if (cmd.empty())
            return PSYNC_RESULT_THEME_UNAVAILABLE;

        const std::string command = ShellQuote(cmd) + " +show-config 2>/dev/null";
        CoreLog(PSYNC_LOG_DEBUG, kLogCategory, "Running: %s", command.c_str());

        std::unique_ptr<FILE, PipeCloser> pipe(popen(command.c_str(), "r"));
        if (!pipe) {
            CoreLog(PSYNC_LOG_DEBUG, kLogCategory, "popen failed: %s", std::strerror(errno));
            return PSYNC_RESULT_THEME_UNAVAILABLE;
        }

        char buffer[4096];
        size_t read = 0;
        while ((read = std::fread(buffer, 1, sizeof(buffer), pipe.get())) > 0)
            out_text.append(buffer, read);

        const int status = pclose(pipe.release());
        if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            CoreLog(PSYNC_LOG_DEBUG, kLogCategory, "'%s' exited abnormally (status=%d)", cmd.c_str(), status);
            out_text.clear();
            return PSYNC_RESULT_THEME_UNAVAILABLE;
        }
        return PSYNC_RESULT_OK;
    }

    Color::ThemeColors ParseShowConfig(const std::string &text) {
        Color::ThemeColors theme;

        for (const auto &raw : utils::SplitLines(text)) {
            const std::string line = utils::TrimStringCopy(raw);
            if (line.empty() || line[0] == '#')
                continue;

            std::string_view key;
            std::string_view value;
            if (!SplitKeyValue(line, key, value))
                continue;

            if (key == "palette") {
                int index = 0;
                Color::Color color;
                if (ParsePaletteEntry(value, index, color))
                    theme.palette[index] = color;
                continue;
            }

            std::optional<Color::Color> *target = nullptr;
            if (key == "foreground")
                target = &theme.foreground;
            else if (key == "background")
                target = &theme.background;
            else if (key == "selection-background")
                target = &theme.selection_background;

            if (!target)
                continue;
            if (auto color = Color::ParseHexColor(value))
                *target = *color;
        }

        return theme;
    }

    std::optional<Color::ThemeColors> ReadTheme(const std::string &cmd) {
        std::string output;
        if (PSYNC_FAILED(RunShowConfig(cmd, output)))
            return std::nullopt;

        auto theme = ParseShowConfig(output);
        CoreLog(PSYNC_LOG_DEBUG, kLogCategory,
                "Parsed theme: foreground=%s background=%s selection=%s palette_slots=%zu",
                theme.foreground ? Color::FormatHexColor(*theme.foreground).c_str() : "-",
                theme.background ? Color::FormatHexColor(*theme.background).c_str() : "-",
                theme.selection_background ? Color::FormatHexColor(*theme.selection_background).c_str() : "-",
                theme.palette.size());
        return theme;
    }
} // namespace PSYNC::Core
