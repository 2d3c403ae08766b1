// strata/cpp/src/materializer.cpp
#include "strata/materializer.h"
#include "strata/errors.h"
#include "strata/format.h"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <utility>

namespace fs = std::filesystem;

namespace strata {

namespace {

struct Slot {
    int bin{0};
    uint32_t position{0};
    bool consumed{false};
};

// (position, line)
using PosLine = std::pair<uint32_t, std::string>;

static std::vector<std::string> sorted_lines(std::vector<PosLine>& v) {
    std::stable_sort(v.begin(), v.end(),
                     [](const PosLine& a, const PosLine& b) { return a.first < b.first; });
    std::vector<std::string> out;
    out.reserve(v.size());
    for (auto& pl : v) out.push_back(std::move(pl.second));
    return out;
}

} // namespace

std::vector<BinOutput> materialize(const Partition& part,
                                   const std::vector<AlignedRecord>& aligned_records,
                                   const std::vector<HypothesisRecord>& hypotheses,
                                   const fs::path& out_dir,
                                   const TokenizerOptions& hyp_tokenizer) {
    if (part.bin_of.size() != aligned_records.size()) {
        throw StrataException(ErrorCode::InvalidArgs,
                              "partition does not match aligned records: " +
                                  std::to_string(part.bin_of.size()) + " vs " +
                                  std::to_string(aligned_records.size()));
    }

    const size_t nb = (size_t)std::max(part.bin_count, 0);

    // reference side + id slots
    std::vector<std::vector<PosLine>> refs(nb);
    std::unordered_map<std::string, Slot> slots;
    slots.reserve(aligned_records.size());

    for (size_t k = 0; k < aligned_records.size(); ++k) {
        const int b = part.bin_of[k];
        if (b <= 0) continue;
        const auto& a = aligned_records[k];
        refs[(size_t)(b - 1)].emplace_back(a.position, format_trn_line(a.rec.text, a.rec.id));
        slots.emplace(a.rec.id, Slot{b, a.position, false});
    }

    // hypothesis side, file order
    std::vector<std::vector<PosLine>> hyps(nb);
    for (const auto& h : hypotheses) {
        auto it = slots.find(h.id);
        if (it == slots.end() || it->second.consumed) continue;
        it->second.consumed = true;
        hyps[(size_t)(it->second.bin - 1)].emplace_back(it->second.position,
                                                        tokenize_trn_line(h.raw, hyp_tokenizer));
    }

    std::vector<BinOutput> out;
    out.reserve(nb);
    for (size_t b = 0; b < nb; ++b) {
        BinOutput bo;
        bo.bin = (int)b + 1;
        bo.dir = out_dir / std::to_string(bo.bin);

        std::error_code ec;
        fs::create_directories(bo.dir, ec);
        if (ec || !fs::is_directory(bo.dir)) {
            throw StrataException(ErrorCode::IoError,
                                  "cannot create bin dir: " + bo.dir.string() +
                                      (ec ? " err=" + ec.message() : std::string()));
        }

        const auto ref_lines = sorted_lines(refs[b]);
        const auto hyp_lines = sorted_lines(hyps[b]);

        std::string err;
        if (!write_lines_atomic(bo.dir / kRefFileName, ref_lines, &err)) {
            throw StrataException(ErrorCode::IoError, err);
        }
        if (!write_lines_atomic(bo.dir / kHypFileName, hyp_lines, &err)) {
            throw StrataException(ErrorCode::IoError, err);
        }

        bo.ref_lines = ref_lines.size();
        bo.hyp_lines = hyp_lines.size();
        out.push_back(std::move(bo));
    }
    return out;
}

} // namespace strata
