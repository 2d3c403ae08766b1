// strata/cpp/include/strata/records.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

struct PerplexityRecord {
    double perplexity{0.0};
    std::string text; // as in the file (usually already tokenized)
    std::string id;   // without parentheses
};

struct HypothesisRecord {
    std::string text;   // everything before the id field, whitespace collapsed
    std::string id;     // without parentheses
    std::string raw;    // original line
    uint32_t line_no{0}; // 1-based index among non-empty lines
};

struct AlignedRecord {
    PerplexityRecord rec;
    uint32_t position{0}; // 1-based rank in the filtered, unsorted stream
};

// "(utt01)" -> "utt01"; без скобок возвращаем как есть
std::string strip_id_parens(std::string_view field);

// "<text> (<id>)"
std::string format_trn_line(std::string_view text, std::string_view id);

// "12.5\tc a t\t(utt01)"
bool parse_perplexity_line(std::string_view line, PerplexityRecord& out, std::string* err);

// "c a t (utt01)"
bool parse_trn_line(std::string_view line, HypothesisRecord& out, std::string* err);

// Empty lines are skipped. Errors name file and line number.
bool load_perplexity_file(const std::filesystem::path& p,
                          std::vector<PerplexityRecord>& out,
                          std::string* err);

bool load_trn_file(const std::filesystem::path& p,
                   std::vector<HypothesisRecord>& out,
                   std::string* err);

} // namespace strata
