// strata/cpp/tools/strata_make_trn_main.cpp
#include <filesystem>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>
#include "strata/corpus.h"

int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "Usage: strata_make_trn <data_dir> <out_trn>\n";
        return 1;
    }

    const std::filesystem::path data_dir = argv[1];
    const std::filesystem::path out_trn = argv[2];

    try {
        const size_t n = strata::write_corpus_trn(data_dir, out_trn);
        nlohmann::json j;
        j["data_dir"] = data_dir.string();
        j["out_trn"] = out_trn.string();
        j["utterances"] = n;
        std::cout << j.dump() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "strata_make_trn failed: " << e.what() << "\n";
        return 2;
    }
}
