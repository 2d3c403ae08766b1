// strata/cpp/src/tokenizer.cpp
#include "strata/tokenizer.h"

#include "text_common.h"

namespace strata {

namespace {

static inline bool starts_with_at(std::string_view s, size_t i, std::string_view pat) {
    if (pat.empty() || i + pat.size() > s.size()) return false;
    return s.compare(i, pat.size(), pat) == 0;
}

// Length in bytes of the phonetic token starting at s[i].
static size_t phonetic_token_len(std::string_view s, size_t i, const TokenizerOptions& opt) {
    for (const auto& c : opt.clusters) {
        if (starts_with_at(s, i, c)) return c.size();
    }

    const size_t n = utf8_char_len(s, i);
    if (starts_with_at(s, i + n, opt.length_mark)) return n + opt.length_mark.size();
    return n;
}

} // namespace

TokenizerOptions plain_tokenizer_options() {
    return TokenizerOptions{};
}

TokenizerOptions phonetic_tokenizer_options() {
    TokenizerOptions opt;
    opt.mode = TokenizeMode::Phonetic;
    return opt;
}

std::vector<std::string> tokenize(std::string_view text, const TokenizerOptions& opt) {
    // "cat  dog" -> "cat_dog"
    const std::string joined = collapse_ws(text, opt.word_marker);
    const std::string_view s(joined);

    std::vector<std::string> out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const size_t len = (opt.mode == TokenizeMode::Phonetic)
                               ? phonetic_token_len(s, i, opt)
                               : utf8_char_len(s, i);
        out.emplace_back(s.substr(i, len));
        i += len;
    }
    return out;
}

std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (size_t k = 0; k < tokens.size(); ++k) {
        if (k > 0) out.push_back(' ');
        out += tokens[k];
    }
    return out;
}

std::string tokenize_trn_line(std::string_view line, const TokenizerOptions& opt) {
    const std::string_view t = trim_ws(line);
    if (t.empty()) return std::string();

    size_t cut = t.size();
    while (cut > 0 && !is_ascii_space((unsigned char)t[cut - 1])) --cut;

    const std::string_view id_field = t.substr(cut);
    const std::string_view text = t.substr(0, cut);

    std::string out = join_tokens(tokenize(text, opt));
    if (!out.empty()) out.push_back(' ');
    out.append(id_field.data(), id_field.size());
    return out;
}

} // namespace strata
