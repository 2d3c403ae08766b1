// strata/cpp/src/validator.cpp
#include "strata/validator.h"
#include "strata/format.h"
#include "strata/marker.h"
#include "strata/records.h"

#include <algorithm>
#include <sstream>
#include <unordered_map>

namespace strata {

ValidationResult validate_bin_dir(const std::filesystem::path& bin_dir) {
    ValidationResult vr;
    std::vector<HypothesisRecord> ref;
    std::vector<HypothesisRecord> hyp;
    std::string err;

    if (!load_trn_file(bin_dir / kRefFileName, ref, &err)) vr.errors.push_back(err);
    if (!load_trn_file(bin_dir / kHypFileName, hyp, &err)) vr.errors.push_back(err);
    if (!vr.errors.empty()) {
        vr.ok = false;
        return vr;
    }

    if (ref.size() != hyp.size()) {
        std::ostringstream oss;
        oss << "line count mismatch: ref=" << ref.size() << " hyp=" << hyp.size();
        vr.errors.push_back(oss.str());
    }

    const size_t n = std::min(ref.size(), hyp.size());
    for (size_t i = 0; i < n; ++i) {
        if (ref[i].id != hyp[i].id) {
            std::ostringstream oss;
            oss << "id order mismatch at line " << (i + 1) << ": ref=" << ref[i].id
                << " hyp=" << hyp[i].id;
            vr.errors.push_back(oss.str());
            break;
        }
    }

    vr.ids.reserve(ref.size());
    for (const auto& r : ref) vr.ids.push_back(r.id);

    vr.ok = vr.errors.empty();
    return vr;
}

ValidationResult validate_out_dir(const std::filesystem::path& out_dir) {
    ValidationResult vr;
    SplitMarker m;
    std::string err;
    if (!load_split_marker(out_dir, m, &err)) {
        vr.errors.push_back("no completion marker: " + err);
        vr.ok = false;
        return vr;
    }

    std::unordered_map<std::string, int> owner;
    for (int b = 1; b <= m.bin_count; ++b) {
        const std::string name = std::to_string(b);
        auto r = validate_bin_dir(out_dir / name);
        for (auto& e : r.errors) vr.errors.push_back(name + ": " + e);

        if ((size_t)(b - 1) < m.stats.bin_sizes.size() &&
            m.stats.bin_sizes[(size_t)(b - 1)] != r.ids.size()) {
            std::ostringstream oss;
            oss << name << ": marker says " << m.stats.bin_sizes[(size_t)(b - 1)]
                << " lines, ref.trn has " << r.ids.size();
            vr.errors.push_back(oss.str());
        }

        for (auto& id : r.ids) {
            auto ins = owner.emplace(id, b);
            if (!ins.second) {
                vr.errors.push_back("id " + id + " in bins " + std::to_string(ins.first->second) +
                                    " and " + name);
            }
            vr.ids.push_back(std::move(id));
        }
    }

    vr.ok = vr.errors.empty();
    return vr;
}

} // namespace strata
