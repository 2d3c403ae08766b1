// strata/cpp/src/aligner.cpp
#include "strata/aligner.h"
#include "strata/errors.h"

#include <sstream>
#include <unordered_set>

namespace strata {

std::vector<std::string> find_missing_ids(const std::vector<PerplexityRecord>& perplexity_records,
                                          const std::vector<std::string>& hypothesis_ids) {
    std::unordered_set<std::string> known;
    known.reserve(perplexity_records.size());
    for (const auto& r : perplexity_records) known.insert(r.id);

    std::vector<std::string> missing;
    std::unordered_set<std::string> seen;
    for (const auto& id : hypothesis_ids) {
        if (known.count(id)) continue;
        if (seen.insert(id).second) missing.push_back(id);
    }
    return missing;
}

std::vector<AlignedRecord> align(const std::vector<PerplexityRecord>& perplexity_records,
                                 const std::vector<std::string>& hypothesis_ids) {
    auto missing = find_missing_ids(perplexity_records, hypothesis_ids);
    if (!missing.empty()) {
        std::ostringstream oss;
        oss << missing.size() << " hypothesis utterance(s) have no perplexity record:";
        for (const auto& id : missing) oss << " " << id;
        throw AlignmentError(oss.str(), std::move(missing));
    }

    const std::unordered_set<std::string> wanted(hypothesis_ids.begin(), hypothesis_ids.end());

    std::vector<AlignedRecord> out;
    out.reserve(wanted.size());
    uint32_t pos = 0;
    for (const auto& r : perplexity_records) {
        if (!wanted.count(r.id)) continue;
        AlignedRecord a;
        a.rec = r;
        a.position = ++pos;
        out.push_back(std::move(a));
    }
    return out;
}

std::vector<std::string> hypothesis_ids(const std::vector<HypothesisRecord>& hyps) {
    std::vector<std::string> ids;
    ids.reserve(hyps.size());
    for (const auto& h : hyps) ids.push_back(h.id);
    return ids;
}

} // namespace strata
