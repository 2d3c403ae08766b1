#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace strata {

struct SplitStats {
    uint64_t hypotheses{0};
    uint64_t aligned{0};
    uint64_t trimmed_low{0};
    uint64_t trimmed_high{0};
    std::vector<uint64_t> bin_sizes;
};

// out_dir/.done_split
struct SplitMarker {
    std::string perplexity_file;
    std::string hypothesis_file;
    int bin_count{0};
    double cut{0.0};
    std::string built_at_utc; // compact
    SplitStats stats;
};

// false if missing or unparsable
bool load_split_marker(const std::filesystem::path& out_dir, SplitMarker& out, std::string* err);

bool write_split_marker(const std::filesystem::path& out_dir, const SplitMarker& m);

// Absolute, weakly_canonical form stored in the marker; "a/../b" and "b" give the same key.
std::string marker_path_key(const std::filesystem::path& p);

// Same perplexity file, hypothesis file, bin count and cut.
bool marker_matches(const SplitMarker& m,
                    const std::filesystem::path& perplexity_file,
                    const std::filesystem::path& hypothesis_file,
                    int bin_count,
                    double cut);

} // namespace strata
