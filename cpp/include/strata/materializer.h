// strata/cpp/include/strata/materializer.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <vector>

#include "strata/partitioner.h"
#include "strata/records.h"
#include "strata/tokenizer.h"

namespace strata {

struct BinOutput {
    int bin{0};
    std::filesystem::path dir; // out_dir/<bin>
    uint64_t ref_lines{0};
    uint64_t hyp_lines{0};
};

// Writes out_dir/<i>/ref.trn and out_dir/<i>/hyp.trn for i in 1..bin_count.
//
// ref.trn: "<text> (<id>)" of every aligned record in bin i.
// hyp.trn: the hypothesis with the same id, re-tokenized with hyp_tokenizer.
// Hypotheses are matched by id; a (bin, id) slot is filled at most once,
// first hypothesis wins. Both files are ordered by AlignedRecord::position.
//
// Throws StrataException(IoError). Bins written before a failure stay on disk.
std::vector<BinOutput> materialize(const Partition& part,
                                   const std::vector<AlignedRecord>& aligned_records,
                                   const std::vector<HypothesisRecord>& hypotheses,
                                   const std::filesystem::path& out_dir,
                                   const TokenizerOptions& hyp_tokenizer);

} // namespace strata
