// strata/cpp/include/strata/aligner.h
#pragma once
#include <string>
#include <vector>

#include "strata/records.h"

namespace strata {

// Ids of hypothesis_ids that no perplexity record carries, in hypothesis
// order, without duplicates.
std::vector<std::string> find_missing_ids(const std::vector<PerplexityRecord>& perplexity_records,
                                          const std::vector<std::string>& hypothesis_ids);

// Perplexity records (file order) whose id occurs in hypothesis_ids,
// numbered 1.. over emitted records.
// Throws AlignmentError if any hypothesis id has no perplexity record.
std::vector<AlignedRecord> align(const std::vector<PerplexityRecord>& perplexity_records,
                                 const std::vector<std::string>& hypothesis_ids);

std::vector<std::string> hypothesis_ids(const std::vector<HypothesisRecord>& hyps);

} // namespace strata
