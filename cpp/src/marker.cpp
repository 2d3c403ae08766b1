// strata/cpp/src/marker.cpp
#include "strata/marker.h"
#include "strata/format.h"

#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace strata {

static bool write_text_file_tmp(const std::filesystem::path& tmp, const std::string& content) {
    std::ofstream out(tmp, std::ios::binary);
    if (!out) return false;
    out.write(content.data(), (std::streamsize)content.size());
    out.flush();
    return (bool)out;
}

std::string marker_path_key(const std::filesystem::path& p) {
    std::error_code ec;
    auto c = std::filesystem::weakly_canonical(p, ec);
    if (!ec) return c.string();
    auto a = std::filesystem::absolute(p, ec);
    if (ec) return p.lexically_normal().string();
    return a.lexically_normal().string();
}

bool load_split_marker(const std::filesystem::path& out_dir, SplitMarker& out, std::string* err) {
    out = SplitMarker{};
    const auto p = out_dir / kMarkerFileName;
    std::ifstream in(p);
    if (!in) {
        if (err) *err = "cannot open " + p.string();
        return false;
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        if (err) *err = "failed parsing " + p.string() + ": " + e.what();
        return false;
    }
    if (!j.is_object()) {
        if (err) *err = "marker is not a json object: " + p.string();
        return false;
    }

    try {
        out.perplexity_file = j.value("perplexity_file", "");
        out.hypothesis_file = j.value("hypothesis_file", "");
        out.bin_count = j.value("bin_count", 0);
        out.cut = j.value("cut", 0.0);
        out.built_at_utc = j.value("built_at_utc", "");

        auto st = j.value("stats", json::object());
        out.stats.hypotheses = st.value("hypotheses", 0);
        out.stats.aligned = st.value("aligned", 0);
        out.stats.trimmed_low = st.value("trimmed_low", 0);
        out.stats.trimmed_high = st.value("trimmed_high", 0);
        out.stats.bin_sizes = st.value("bin_sizes", std::vector<uint64_t>{});
    } catch (const json::exception& e) {
        if (err) *err = "bad marker field in " + p.string() + ": " + e.what();
        return false;
    }

    if (out.perplexity_file.empty() || out.bin_count < 1) {
        if (err) *err = "marker is incomplete: " + p.string();
        return false;
    }
    return true;
}

bool write_split_marker(const std::filesystem::path& out_dir, const SplitMarker& m) {
    const auto fin = out_dir / kMarkerFileName;
    auto tmp = fin;
    tmp += ".tmp";

    json j;
    j["perplexity_file"] = m.perplexity_file;
    j["hypothesis_file"] = m.hypothesis_file;
    j["bin_count"] = m.bin_count;
    j["cut"] = m.cut;
    j["built_at_utc"] = m.built_at_utc;
    j["stats"] = {{"hypotheses", m.stats.hypotheses},
                  {"aligned", m.stats.aligned},
                  {"trimmed_low", m.stats.trimmed_low},
                  {"trimmed_high", m.stats.trimmed_high},
                  {"bin_sizes", m.stats.bin_sizes}};

    if (!write_text_file_tmp(tmp, j.dump(2) + "\n")) return false;
    return atomic_replace_file_best_effort(tmp, fin);
}

bool marker_matches(const SplitMarker& m,
                    const std::filesystem::path& perplexity_file,
                    const std::filesystem::path& hypothesis_file,
                    int bin_count,
                    double cut) {
    if (m.bin_count != bin_count) return false;
    // json round-trips doubles exactly
    if (m.cut != cut) return false;
    if (marker_path_key(m.perplexity_file) != marker_path_key(perplexity_file)) return false;
    // hypothesis_file в маркере необязателен
    if (!m.hypothesis_file.empty() &&
        marker_path_key(m.hypothesis_file) != marker_path_key(hypothesis_file)) {
        return false;
    }
    return true;
}

} // namespace strata
