// strata/cpp/include/strata/corpus.h
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace strata {

// One "<text> (<stem>)" line per *.wav in data_dir, sorted by file name;
// text is the sibling <stem>.txt with whitespace collapsed.
// Throws StrataException (IoError if data_dir is unreadable, ParseError on a
// missing .txt).
std::vector<std::string> build_corpus_trn(const std::filesystem::path& data_dir);

// Returns the number of lines written.
size_t write_corpus_trn(const std::filesystem::path& data_dir,
                        const std::filesystem::path& out_trn);

} // namespace strata
