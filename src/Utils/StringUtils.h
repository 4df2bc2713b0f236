#ifndef PSYNC_STRINGUTILS_H
#define PSYNC_STRINGUTILS_H

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

namespace utils {
    // ASCII whitespace only; the files handled here are UTF-8
    inline bool IsSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    inline void TrimString(std::string &s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](char c) { return !IsSpace(c); }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](char c) { return !IsSpace(c); }).base(), s.end());
    }

    inline std::string TrimStringCopy(std::string s) {
        TrimString(s);
        return s;
    }

    inline bool StartsWith(const std::string &str, const std::string &prefix) {
        if (str.size() < prefix.size()) return false;
        return str.compare(0, prefix.size(), prefix) == 0;
    }

    inline bool EndsWith(const std::string &str, const std::string &suffix) {
        if (str.size() < suffix.size()) return false;
        return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // Splits on '\n', '\r\n' and lone '\r'. A trailing terminator does not
    // produce an extra empty line.
    std::vector<std::string> SplitLines(const std::string &text);

    // Returns true when the whole buffer (embedded NULs included) is UTF-8.
    bool IsValidUtf8(const std::string &text);

    // Strips a leading UTF-8 byte order mark in place; returns true if one was removed.
    bool StripUtf8Bom(std::string &text);
} // namespace utils

#endif // PSYNC_STRINGUTILS_H
