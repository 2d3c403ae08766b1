// strata/cpp/tools/strata_section_main.cpp
#include <cctype>
#include <filesystem>
#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>
#include "strata/errors.h"
#include "strata/records.h"
#include "strata/section.h"

// non-negative decimal integer, nothing else
static bool parse_bin_count(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    out = std::stoi(s);
    return true;
}

static void print_missing_lines(const std::filesystem::path& hyp_trn,
                                const std::vector<std::string>& ids) {
    std::vector<strata::HypothesisRecord> hyps;
    std::string err;
    if (!strata::load_trn_file(hyp_trn, hyps, &err)) {
        for (const auto& id : ids) std::cerr << id << "\n";
        return;
    }
    const std::unordered_set<std::string> want(ids.begin(), ids.end());
    for (const auto& h : hyps) {
        if (want.count(h.id)) std::cerr << h.raw << "\n";
    }
}

int main(int argc, char** argv) {
    if (argc != 5) {
        std::cerr << "Usage: strata_section <perp_file> <hypothesis_trn_file> <num_bins> <out_dir>\n";
        return 1;
    }

    const std::filesystem::path perp_file = argv[1];
    const std::filesystem::path hyp_trn = argv[2];
    const std::string ns = argv[3];
    const std::filesystem::path out_dir = argv[4];

    std::error_code ec;
    if (!std::filesystem::is_regular_file(perp_file, ec)) {
        std::cerr << "'" << perp_file.string() << "' is not a file\n";
        return 1;
    }
    if (!std::filesystem::is_regular_file(hyp_trn, ec)) {
        std::cerr << "'" << hyp_trn.string() << "' is not a file\n";
        return 1;
    }

    strata::SectionOptions opt;
    if (!parse_bin_count(ns, opt.bin_count)) {
        std::cerr << "'" << ns << "' is not a non-negative int\n";
        return 1;
    }
    if (opt.bin_count == 0) {
        std::cerr << "num_bins must be at least 1\n";
        return 1;
    }
    if (!std::filesystem::is_directory(out_dir, ec)) {
        std::cerr << "'" << out_dir.string() << "' is not a directory\n";
        return 1;
    }

    try {
        auto st = strata::section_corpus(perp_file, hyp_trn, out_dir, opt);

        nlohmann::json j;
        j["out_dir"] = st.out_dir.string();
        j["skipped"] = st.skipped;
        j["hypotheses"] = st.hypotheses;
        j["aligned"] = st.aligned;
        j["trimmed_low"] = st.trimmed_low;
        j["trimmed_high"] = st.trimmed_high;
        nlohmann::json bins = nlohmann::json::array();
        for (const auto& b : st.bins) bins.push_back(b.ref_lines);
        j["bin_sizes"] = std::move(bins);
        j["built_at_utc"] = st.built_at_utc;
        std::cout << j.dump() << "\n";
        return 0;
    } catch (const strata::AlignmentError& e) {
        if (e.code() == strata::ErrorCode::DuplicateUtterances) {
            std::cerr << "'" << perp_file.string() << "' or '" << hyp_trn.string()
                      << "' repeats the following utterance ids:\n";
            for (const auto& id : e.missing_ids()) std::cerr << id << "\n";
        } else {
            std::cerr << "'" << perp_file.string() << "' is missing utterances corresponding to the "
                      << "following utterances in '" << hyp_trn.string() << "':\n";
            print_missing_lines(hyp_trn, e.missing_ids());
        }
        std::cerr << "strata_section failed: " << e.what() << "\n";
        return 1;
    } catch (const strata::StrataException& e) {
        std::cerr << "strata_section failed [" << strata::error_code_name(e.code()) << "]: "
                  << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "strata_section failed: " << e.what() << "\n";
        return 1;
    }
}
