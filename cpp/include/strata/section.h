// strata/cpp/include/strata/section.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "strata/materializer.h"
#include "strata/partitioner.h"
#include "strata/tokenizer.h"

namespace strata {

struct SectionOptions {
    int bin_count{3};
    double cut{kDefaultTrimCut};

    // hyp.trn re-tokenization
    TokenizerOptions hyp_tokenizer{};

    // ignore an existing completion marker (env STRATA_FORCE=1)
    bool force{false};

    // hypothesis file order must equal the filtered perplexity order
    // (env STRATA_STRICT_ORDER=1)
    bool strict_order{false};
};

struct SectionStats {
    std::filesystem::path out_dir;
    bool skipped{false}; // marker present, nothing written
    uint64_t hypotheses{0};
    uint64_t aligned{0};
    uint64_t trimmed_low{0};
    uint64_t trimmed_high{0};
    std::vector<BinOutput> bins;
    std::string built_at_utc;
};

// Validates options and inputs, aligns, partitions and writes
// out_dir/<1..bin_count>/{ref,hyp}.trn followed by out_dir/.done_split.
// Nothing is created under out_dir before alignment has succeeded.
//
// Throws StrataException (InvalidArgs, ParseError, IoError) or AlignmentError.
SectionStats section_corpus(const std::filesystem::path& perplexity_file,
                            const std::filesystem::path& hypothesis_file,
                            const std::filesystem::path& out_dir,
                            const SectionOptions& opt);

} // namespace strata
