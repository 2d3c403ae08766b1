// strata/cpp/tools/strata_validate_main.cpp
#include <iostream>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include "strata/validator.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: strata_validate <out_dir> [--bin N]\n";
        return 1;
    }

    std::filesystem::path out_dir = argv[1];
    std::string bin;

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--bin") bin = arg_value(i, argc, argv);
    }

    strata::ValidationResult vr;
    if (!bin.empty()) {
        vr = strata::validate_bin_dir(out_dir / bin);
    } else {
        vr = strata::validate_out_dir(out_dir);
    }

    nlohmann::json j;
    j["ok"] = vr.ok;
    j["utterances"] = vr.ids.size();
    j["errors"] = vr.errors;

    std::cout << j.dump() << "\n";
    return vr.ok ? 0 : 2;
}
