// strata/cpp/common/text_common.cpp
#include "text_common.h"

namespace {

static inline bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

} // namespace

size_t utf8_char_len(std::string_view s, size_t i) {
    if (i >= s.size()) return 0;

    const unsigned char c0 = (unsigned char)s[i];
    if (c0 < 0x80) return 1;

    size_t len = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) len = 2;
    else if (c0 >= 0xE0 && c0 <= 0xEF) len = 3;
    else if (c0 >= 0xF0 && c0 <= 0xF4) len = 4;
    else return 1;

    if (i + len > s.size()) return 1;

    const unsigned char c1 = (unsigned char)s[i + 1];
    if (!is_cont(c1)) return 1;
    if (len == 2) return 2;

    // overlong / surrogate checks
    if (len == 3) {
        if (c0 == 0xE0 && c1 < 0xA0) return 1;
        if (c0 == 0xED && c1 >= 0xA0) return 1;
    } else {
        if (c0 == 0xF0 && c1 < 0x90) return 1;
        if (c0 == 0xF4 && c1 > 0x8F) return 1;
    }

    for (size_t j = 2; j < len; ++j) {
        if (!is_cont((unsigned char)s[i + j])) return 1;
    }
    return len;
}

void split_ws_spans(std::string_view s, std::vector<TokenSpan>& out) {
    out.clear();
    const size_t n = s.size();
    size_t i = 0;

    while (i < n) {
        while (i < n && is_ascii_space((unsigned char)s[i])) ++i;
        if (i >= n) break;

        const size_t start = i;
        while (i < n && !is_ascii_space((unsigned char)s[i])) ++i;

        TokenSpan ts;
        ts.start = (uint32_t)start;
        ts.len = (uint32_t)(i - start);
        out.push_back(ts);
    }
}

std::vector<std::string> split_ws(std::string_view s) {
    std::vector<TokenSpan> spans;
    split_ws_spans(s, spans);

    std::vector<std::string> out;
    out.reserve(spans.size());
    for (const auto& sp : spans) out.emplace_back(s.substr(sp.start, sp.len));
    return out;
}

std::string collapse_ws(std::string_view s, std::string_view sep) {
    std::vector<TokenSpan> spans;
    split_ws_spans(s, spans);

    std::string out;
    out.reserve(s.size());
    for (size_t k = 0; k < spans.size(); ++k) {
        if (k > 0) out.append(sep.data(), sep.size());
        out.append(s.data() + spans[k].start, spans[k].len);
    }
    return out;
}

std::string_view trim_ws(std::string_view s) {
    size_t a = 0;
    size_t b = s.size();
    while (a < b && is_ascii_space((unsigned char)s[a])) ++a;
    while (b > a && is_ascii_space((unsigned char)s[b - 1])) --b;
    return s.substr(a, b - a);
}
