#include "StringUtils.h"

#include <utility>

#include <utf8.h>

namespace utils {
    std::vector<std::string> SplitLines(const std::string &text) {
        std::vector<std::string> lines;
        std::string current;
        for (size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];
            if (c == '\r') {
                lines.push_back(std::move(current));
                current.clear();
                if (i + 1 < text.size() && text[i + 1] == '\n')
                    ++i;
            } else if (c == '\n') {
                lines.push_back(std::move(current));
                current.clear();
            } else {
                current.push_back(c);
            }
        }
        if (!current.empty())
            lines.push_back(std::move(current));
        return lines;
    }

    bool IsValidUtf8(const std::string &text) {
        // utf8nvalid stops at a terminator, so check each NUL-separated run.
        size_t pos = 0;
        while (pos < text.size()) {
            size_t nul = text.find('\0', pos);
            if (nul == std::string::npos)
                nul = text.size();
            if (nul > pos &&
                utf8nvalid(reinterpret_cast<const utf8_int8_t *>(text.data() + pos), nul - pos) != nullptr)
                return false;
            pos = nul + 1;
        }
        return true;
    }

    bool StripUtf8Bom(std::string &text) {
        static const char kBom[] = "\xEF\xBB\xBF";
        if (text.size() >= 3 && text.compare(0, 3, kBom) == 0) {
            text.erase(0, 3);
            return true;
        }
        return false;
    }
} // namespace utils
