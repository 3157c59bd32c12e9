#include <trainlog/util/unicode.hpp>

namespace trainlog {

namespace {

const unsigned FOLD_BEGIN = 0xC0;
const unsigned FOLD_END = 0x180;

// Indexed by code point - FOLD_BEGIN. Empty entries are not letters.
const char* const g_latin_fold[FOLD_END - FOLD_BEGIN] = {
    "a", "a", "a", "a", "a", "a", "ae", "c",     // U+00C0
    "e", "e", "e", "e", "i", "i", "i", "i",      // U+00C8
    "d", "n", "o", "o", "o", "o", "o", "",       // U+00D0
    "o", "u", "u", "u", "u", "y", "th", "ss",    // U+00D8
    "a", "a", "a", "a", "a", "a", "ae", "c",     // U+00E0
    "e", "e", "e", "e", "i", "i", "i", "i",      // U+00E8
    "d", "n", "o", "o", "o", "o", "o", "",       // U+00F0
    "o", "u", "u", "u", "u", "y", "th", "y",     // U+00F8
    "a", "a", "a", "a", "a", "a", "c", "c",      // U+0100
    "c", "c", "c", "c", "c", "c", "d", "d",      // U+0108
    "d", "d", "e", "e", "e", "e", "e", "e",      // U+0110
    "e", "e", "e", "e", "g", "g", "g", "g",      // U+0118
    "g", "g", "g", "g", "h", "h", "h", "h",      // U+0120
    "i", "i", "i", "i", "i", "i", "i", "i",      // U+0128
    "i", "i", "ij", "ij", "j", "j", "k", "k",    // U+0130
    "k", "l", "l", "l", "l", "l", "l", "l",      // U+0138
    "l", "l", "l", "n", "n", "n", "n", "n",      // U+0140
    "n", "n", "n", "n", "o", "o", "o", "o",      // U+0148
    "o", "o", "oe", "oe", "r", "r", "r", "r",    // U+0150
    "r", "r", "s", "s", "s", "s", "s", "s",      // U+0158
    "s", "s", "t", "t", "t", "t", "t", "t",      // U+0160
    "u", "u", "u", "u", "u", "u", "u", "u",      // U+0168
    "u", "u", "u", "u", "w", "w", "y", "y",      // U+0170
    "y", "z", "z", "z", "z", "z", "z", "s",      // U+0178
};

inline bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

}  // namespace

std::string fold_case_and_accents(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0, size = text.size(); i < size; ++i) {
        const unsigned char lead = text[i];
        if (lead < 0x80) {
            const char c = static_cast<char>(lead);
            result.push_back((c >= 'A' and c <= 'Z') ? c - 'A' + 'a' : c);
            continue;
        }

        // Only two-byte sequences can reach the folded range.
        if ((lead & 0xE0) == 0xC0 and i + 1 < size and
            is_continuation(text[i + 1])) {
            const unsigned code_point =
                ((lead & 0x1Fu) << 6) | (text[i + 1] & 0x3Fu);
            if (FOLD_BEGIN <= code_point and code_point < FOLD_END) {
                const char* folded = g_latin_fold[code_point - FOLD_BEGIN];
                if (*folded) {
                    result.append(folded);
                    ++i;
                    continue;
                }
            }
        }
        result.push_back(text[i]);
    }
    return result;
}

}  // namespace trainlog
