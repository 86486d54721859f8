#include "classnote/utf8.h"

namespace classnote {

static bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

size_t utf8_length(const std::string & s) {
    size_t n = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_continuation((unsigned char) s[i])) {
            ++n;
        }
    }
    return n;
}

size_t utf8_offset(const std::string & s, size_t n) {
    size_t i = 0;
    while (i < s.size() && n > 0) {
        ++i;
        while (i < s.size() && is_continuation((unsigned char) s[i])) {
            ++i;
        }
        --n;
    }
    return i;
}

std::string utf8_substr(const std::string & s, size_t first, size_t count) {
    const size_t b0 = utf8_offset(s, first);
    if (count == std::string::npos) {
        return s.substr(b0);
    }
    const std::string tail = s.substr(b0);
    return tail.substr(0, utf8_offset(tail, count));
}

// ASCII whitespace and U+3000 (ideographic space)
std::string trim(const std::string & s) {
    static const std::string ideographic_space = "\xE3\x80\x80";
    const char * ws = " \t\n\r\f\v";

    size_t b = 0;
    size_t e = s.size();
    while (b < e) {
        if (std::char_traits<char>::find(ws, 6, s[b])) {
            b += 1;
        } else if (s.compare(b, 3, ideographic_space) == 0) {
            b += 3;
        } else {
            break;
        }
    }
    while (e > b) {
        if (std::char_traits<char>::find(ws, 6, s[e - 1])) {
            e -= 1;
        } else if (e - b >= 3 && s.compare(e - 3, 3, ideographic_space) == 0) {
            e -= 3;
        } else {
            break;
        }
    }
    return s.substr(b, e - b);
}

} // namespace classnote
