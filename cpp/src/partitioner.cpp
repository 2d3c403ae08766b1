// strata/cpp/src/partitioner.cpp
#include "strata/partitioner.h"
#include "strata/errors.h"

#include <algorithm>
#include <numeric>
#include <string>

namespace strata {

double bin_lower_bound(uint32_t L, int i, int bin_count, double cut) {
    const double lines = (double)L;
    return (lines * (1.0 - 2.0 * cut)) * ((double)(i - 1) / (double)bin_count) + lines * cut;
}

double bin_upper_bound(uint32_t L, int i, int bin_count, double cut) {
    const double lines = (double)L;
    return (lines * (1.0 - 2.0 * cut)) * ((double)i / (double)bin_count) + lines * cut;
}

int bin_for_rank(uint32_t r, uint32_t L, int bin_count, double cut) {
    const double lines = (double)L;
    const double rank = (double)r;

    // trim: bottom and top `cut` by rank
    if (!(rank >= lines * cut && rank <= lines * (1.0 - cut))) return 0;

    // (lo, hi]: a boundary rank goes to the lower bin
    for (int i = 1; i <= bin_count; ++i) {
        if (rank > bin_lower_bound(L, i, bin_count, cut) &&
            rank <= bin_upper_bound(L, i, bin_count, cut)) {
            return i;
        }
    }
    // only r == L*cut lands here
    return 0;
}

Partition partition(const std::vector<AlignedRecord>& aligned_records,
                    int bin_count,
                    double cut) {
    if (bin_count < 1) {
        throw StrataException(ErrorCode::InvalidArgs,
                              "bin count must be >= 1, got " + std::to_string(bin_count));
    }
    if (!(cut >= 0.0 && cut < 0.5)) {
        throw StrataException(ErrorCode::InvalidArgs,
                              "trim cut must be in [0, 0.5), got " + std::to_string(cut));
    }

    const uint32_t L = (uint32_t)aligned_records.size();

    Partition p;
    p.bin_count = bin_count;
    p.cut = cut;
    p.bin_sizes.assign((size_t)bin_count, 0);
    p.bin_of.assign(L, 0);

    p.sorted_order.resize(L);
    std::iota(p.sorted_order.begin(), p.sorted_order.end(), 0u);
    // stable: равные perplexity сохраняют порядок файла
    std::stable_sort(p.sorted_order.begin(), p.sorted_order.end(),
                     [&](uint32_t a, uint32_t b) {
                         return aligned_records[a].rec.perplexity < aligned_records[b].rec.perplexity;
                     });

    const double low_edge = (double)L * cut;
    for (uint32_t k = 0; k < L; ++k) {
        const uint32_t r = k + 1;
        const int b = bin_for_rank(r, L, bin_count, cut);
        p.bin_of[p.sorted_order[k]] = b;
        if (b > 0) {
            ++p.bin_sizes[(size_t)(b - 1)];
        } else if ((double)r <= low_edge) {
            ++p.trimmed_low;
        } else {
            ++p.trimmed_high;
        }
    }
    return p;
}

} // namespace strata
