// strata/cpp/tools/strata_tokenize_main.cpp
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "strata/format.h"
#include "strata/tokenizer.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: strata_tokenize <in_trn> <out_trn|-> [--phonetic] [--word-marker S]\n";
        return 1;
    }

    const std::filesystem::path in_trn = argv[1];
    const std::string out_arg = argv[2];

    strata::TokenizerOptions opt = strata::plain_tokenizer_options();
    for (int i = 3; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--phonetic") opt.mode = strata::TokenizeMode::Phonetic;
        else if (a == "--word-marker") {
            opt.word_marker = arg_value(i, argc, argv);
            if (opt.word_marker.empty()) {
                std::cerr << "--word-marker needs a non-empty value\n";
                return 1;
            }
        }
        else {
            std::cerr << "Unknown option " << a << "\n";
            return 1;
        }
    }

    std::vector<std::string> lines;
    std::string err;
    if (!strata::read_lines(in_trn, lines, &err)) {
        std::cerr << "strata_tokenize failed: " << err << "\n";
        return 2;
    }

    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const auto& l : lines) out.push_back(strata::tokenize_trn_line(l, opt));

    if (out_arg == "-") {
        for (const auto& l : out) std::cout << l << "\n";
        return 0;
    }
    if (!strata::write_lines_atomic(out_arg, out, &err)) {
        std::cerr << "strata_tokenize failed: " << err << "\n";
        return 2;
    }
    return 0;
}
