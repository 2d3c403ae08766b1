// strata/cpp/include/strata/tokenizer.h
#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class TokenizeMode {
    Plain,    // one token per code point
    Phonetic, // IPA clusters first, then one token per code point
};

struct TokenizerOptions {
    TokenizeMode mode{TokenizeMode::Plain};

    // joins words before splitting, so the word boundary survives as a token
    std::string word_marker{"_"};

    // Phonetic only. Tried in order at every position, first match wins.
    std::vector<std::string> clusters{
        "[fp]",                 // filler
        "dz\xCB\x90",           // dzː
        "d\xCA\x92\xCB\x90",    // dʒː
        "t\xCA\x83\xCB\x90",    // tʃː
        "dz",
        "d\xCA\x92",            // dʒ
        "t\xCA\x83",            // tʃ
    };

    // Phonetic only: "<any code point><length_mark>" is one token
    std::string length_mark{"\xCB\x90"}; // ː
};

TokenizerOptions plain_tokenizer_options();
TokenizerOptions phonetic_tokenizer_options();

// Текст без идентификатора.
std::vector<std::string> tokenize(std::string_view text, const TokenizerOptions& opt);

inline std::vector<std::string> tokenize(std::string_view text) {
    return tokenize(text, plain_tokenizer_options());
}

inline std::vector<std::string> tokenize_phonetic(std::string_view text) {
    return tokenize(text, phonetic_tokenizer_options());
}

// trn line: "<text> <id-field>". The last whitespace-delimited field is
// re-appended verbatim after the space-joined tokens of the rest.
// "cat dog (utt01)" -> "c a t _ d o g (utt01)"
std::string tokenize_trn_line(std::string_view line, const TokenizerOptions& opt);

std::string join_tokens(const std::vector<std::string>& tokens);

} // namespace strata
