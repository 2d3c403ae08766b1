// strata/cpp/include/strata/partitioner.h
#pragma once
#include <cstdint>
#include <vector>

#include "strata/records.h"

namespace strata {

constexpr double kDefaultTrimCut = 0.05;

struct Partition {
    int bin_count{0};
    double cut{kDefaultTrimCut};

    // indices into aligned_records, stable-sorted by perplexity ascending;
    // sorted_order[r - 1] has 1-based rank r
    std::vector<uint32_t> sorted_order;

    // bin of aligned_records[k]: 1..bin_count, or 0 if excluded
    std::vector<int> bin_of;

    std::vector<uint32_t> bin_sizes; // [bin_count]
    uint32_t trimmed_low{0};
    uint32_t trimmed_high{0};
};

// Rank bounds of bin i (1-based) for L records:
//   lo(i) = (L * (1 - 2*cut)) * ((i - 1) / N) + L * cut
//   hi(i) = (L * (1 - 2*cut)) * (i / N) + L * cut
// rank r belongs to bin i iff lo(i) < r <= hi(i), and only ranks with
// L*cut <= r <= L*(1-cut) are considered. Bounds are not rounded.
double bin_lower_bound(uint32_t L, int i, int bin_count, double cut);
double bin_upper_bound(uint32_t L, int i, int bin_count, double cut);

// Bin for 1-based sorted rank r, 0 if excluded.
int bin_for_rank(uint32_t r, uint32_t L, int bin_count, double cut);

// Throws StrataException(InvalidArgs) if bin_count < 1 or cut outside [0, 0.5).
Partition partition(const std::vector<AlignedRecord>& aligned_records,
                    int bin_count,
                    double cut = kDefaultTrimCut);

} // namespace strata
