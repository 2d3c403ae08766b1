// strata/cpp/src/section.cpp
#include "strata/section.h"
#include "strata/aligner.h"
#include "strata/errors.h"
#include "strata/format.h"
#include "strata/marker.h"
#include "strata/records.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace strata {

namespace {

static bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

static void require_file(const fs::path& p, const char* what) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        throw StrataException(ErrorCode::InvalidArgs,
                              std::string(what) + " '" + p.string() + "' is not a file");
    }
}

template <class T, class GetId>
static std::vector<std::string> duplicate_ids(const std::vector<T>& v, GetId get_id) {
    std::unordered_set<std::string> seen;
    std::unordered_set<std::string> reported;
    std::vector<std::string> dups;
    for (const auto& x : v) {
        const std::string& id = get_id(x);
        if (!seen.insert(id).second && reported.insert(id).second) dups.push_back(id);
    }
    return dups;
}

// aligned and hyps have the same size here
static void check_same_order(const std::vector<AlignedRecord>& aligned,
                             const std::vector<HypothesisRecord>& hyps) {
    for (size_t k = 0; k < aligned.size(); ++k) {
        if (aligned[k].rec.id == hyps[k].id) continue;
        std::ostringstream oss;
        oss << "hypothesis order differs from perplexity order at line " << hyps[k].line_no
            << ": hypothesis '" << hyps[k].id << "' vs perplexity '" << aligned[k].rec.id << "'";
        throw AlignmentError(oss.str(), {hyps[k].id});
    }
}

// out_dir/<k> for k > bin_count, left by an earlier split with more bins
static void remove_stale_bins(const fs::path& out_dir, int bin_count) {
    std::error_code ec;
    std::vector<fs::path> stale;
    for (fs::directory_iterator it(out_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.empty() || name.size() > 9) continue;
        if (!std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) continue;
        if (std::stoi(name) <= bin_count || !it->is_directory(ec)) continue;
        stale.push_back(it->path());
    }
    if (ec) {
        throw StrataException(ErrorCode::IoError,
                              "cannot list out_dir: " + out_dir.string() + " err=" + ec.message());
    }
    for (const auto& p : stale) {
        fs::remove_all(p, ec);
        if (ec) {
            throw StrataException(ErrorCode::IoError,
                                  "cannot remove stale bin dir: " + p.string() + " err=" + ec.message());
        }
        std::cerr << "[strata] removed stale bin dir " << p.string() << "\n";
    }
}

} // namespace

SectionStats section_corpus(const fs::path& perplexity_file,
                            const fs::path& hypothesis_file,
                            const fs::path& out_dir,
                            const SectionOptions& opt) {
    const bool force = opt.force || env_bool("STRATA_FORCE", false);
    const bool strict_order = opt.strict_order || env_bool("STRATA_STRICT_ORDER", false);

    // 1) configuration
    if (opt.bin_count < 1) {
        throw StrataException(ErrorCode::InvalidArgs,
                              "bin count must be >= 1, got " + std::to_string(opt.bin_count));
    }
    if (!(opt.cut >= 0.0 && opt.cut < 0.5)) {
        throw StrataException(ErrorCode::InvalidArgs,
                              "trim cut must be in [0, 0.5), got " + std::to_string(opt.cut));
    }

    // 2) files
    require_file(perplexity_file, "perplexity file");
    require_file(hypothesis_file, "hypothesis file");

    SectionStats st;
    st.out_dir = out_dir;

    if (!force) {
        SplitMarker m;
        std::string merr;
        if (load_split_marker(out_dir, m, &merr)) {
            if (marker_matches(m, perplexity_file, hypothesis_file, opt.bin_count, opt.cut)) {
                std::cerr << "[strata] " << out_dir.string() << " already split using "
                          << m.perplexity_file << ", skipping\n";
                st.skipped = true;
                st.hypotheses = m.stats.hypotheses;
                st.aligned = m.stats.aligned;
                st.trimmed_low = m.stats.trimmed_low;
                st.trimmed_high = m.stats.trimmed_high;
                st.built_at_utc = m.built_at_utc;
                for (size_t b = 0; b < m.stats.bin_sizes.size(); ++b) {
                    BinOutput bo;
                    bo.bin = (int)b + 1;
                    bo.dir = out_dir / std::to_string(bo.bin);
                    bo.ref_lines = m.stats.bin_sizes[b];
                    bo.hyp_lines = m.stats.bin_sizes[b];
                    st.bins.push_back(std::move(bo));
                }
                return st;
            }
            std::cerr << "[strata] stale marker in " << out_dir.string() << " (split using "
                      << m.perplexity_file << "), re-sectioning\n";
        }
    }

    // 3) parse
    std::vector<PerplexityRecord> perps;
    std::vector<HypothesisRecord> hyps;
    std::string err;
    if (!load_perplexity_file(perplexity_file, perps, &err)) {
        throw StrataException(ErrorCode::ParseError, err);
    }
    if (!load_trn_file(hypothesis_file, hyps, &err)) {
        throw StrataException(ErrorCode::ParseError, err);
    }

    // 4) alignment
    auto aligned = align(perps, hypothesis_ids(hyps));
    // без повторов в обоих файлах align() даёт ровно hyps.size() записей
    {
        auto dups = duplicate_ids(hyps, [](const HypothesisRecord& h) -> const std::string& { return h.id; });
        const auto pdups = duplicate_ids(aligned, [](const AlignedRecord& a) -> const std::string& { return a.rec.id; });
        for (const auto& id : pdups) {
            if (std::find(dups.begin(), dups.end(), id) == dups.end()) dups.push_back(id);
        }
        if (!dups.empty()) {
            std::ostringstream oss;
            oss << "duplicate utterance ids (" << aligned.size() << " perplexity records for "
                << hyps.size() << " hypotheses):";
            for (const auto& id : dups) oss << " " << id;
            throw AlignmentError(ErrorCode::DuplicateUtterances, oss.str(), std::move(dups));
        }
    }
    if (strict_order) check_same_order(aligned, hyps);

    // 5) partition
    const Partition part = partition(aligned, opt.bin_count, opt.cut);

    // 6) materialize
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec || !fs::is_directory(out_dir)) {
        throw StrataException(ErrorCode::IoError,
                              "cannot create out_dir: " + out_dir.string() +
                                  (ec ? " err=" + ec.message() : std::string()));
    }
    // маркер от прошлого прогона больше не описывает содержимое
    fs::remove(out_dir / kMarkerFileName, ec);
    remove_stale_bins(out_dir, opt.bin_count);

    st.bins = materialize(part, aligned, hyps, out_dir, opt.hyp_tokenizer);
    st.hypotheses = hyps.size();
    st.aligned = aligned.size();
    st.trimmed_low = part.trimmed_low;
    st.trimmed_high = part.trimmed_high;
    st.built_at_utc = utc_now_compact();

    // 7) marker
    SplitMarker m;
    m.perplexity_file = marker_path_key(perplexity_file);
    m.hypothesis_file = marker_path_key(hypothesis_file);
    m.bin_count = opt.bin_count;
    m.cut = opt.cut;
    m.built_at_utc = st.built_at_utc;
    m.stats.hypotheses = st.hypotheses;
    m.stats.aligned = st.aligned;
    m.stats.trimmed_low = st.trimmed_low;
    m.stats.trimmed_high = st.trimmed_high;
    for (const auto& b : st.bins) m.stats.bin_sizes.push_back(b.ref_lines);

    if (!write_split_marker(out_dir, m)) {
        throw StrataException(ErrorCode::IoError,
                              "cannot write marker: " + (out_dir / kMarkerFileName).string());
    }
    return st;
}

} // namespace strata
