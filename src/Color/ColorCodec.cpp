#include "ColorCodec.h"

#include <cctype>

namespace PSYNC::Color {
    namespace {
        int HexVal(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
            if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        bool IsTrimmable(char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }
    } // namespace

    std::optional<Color> ParseHexColor(std::string_view text) {
        while (!text.empty() && IsTrimmable(text.front()))
            text.remove_prefix(1);
        while (!text.empty() && IsTrimmable(text.back()))
            text.remove_suffix(1);

        if (text.size() != 7 || text[0] != '#')
            return std::nullopt;

        uint8_t channels[3];
        for (int i = 0; i < 3; ++i) {
            const int hi = HexVal(text[1 + i * 2]);
            const int lo = HexVal(text[2 + i * 2]);
            if (hi < 0 || lo < 0)
                return std::nullopt;
            channels[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return Color{channels[0], channels[1], channels[2]};
    }

    std::string FormatHexColor(const Color &color) {
        static const char kDigits[] = "0123456789abcdef";
        std::string out(7, '#');
        const uint8_t channels[3] = {color.r, color.g, color.b};
        for (int i = 0; i < 3; ++i) {
            out[1 + i * 2] = kDigits[channels[i] >> 4];
            out[2 + i * 2] = kDigits[channels[i] & 0x0F];
        }
        return out;
    }
} // namespace PSYNC::Color
