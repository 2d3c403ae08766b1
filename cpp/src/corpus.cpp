// strata/cpp/src/corpus.cpp
#include "strata/corpus.h"
#include "strata/errors.h"
#include "strata/format.h"
#include "strata/records.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "text_common.h"

namespace fs = std::filesystem;

namespace strata {

std::vector<std::string> build_corpus_trn(const fs::path& data_dir) {
    std::error_code ec;
    if (!fs::is_directory(data_dir, ec)) {
        throw StrataException(ErrorCode::IoError, "'" + data_dir.string() + "' is not a directory");
    }

    std::vector<fs::path> wavs;
    for (fs::directory_iterator it(data_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& p = it->path();
        if (p.extension() == ".wav" && it->is_regular_file(ec)) wavs.push_back(p);
    }
    if (ec) {
        throw StrataException(ErrorCode::IoError,
                              "cannot list " + data_dir.string() + " err=" + ec.message());
    }
    std::sort(wavs.begin(), wavs.end());

    std::vector<std::string> out;
    out.reserve(wavs.size());
    for (const auto& w : wavs) {
        auto txt = w;
        txt.replace_extension(".txt");

        std::ifstream in(txt, std::ios::binary);
        if (!in) {
            throw StrataException(ErrorCode::ParseError,
                                  "no transcript for " + w.string() + " (expected " + txt.string() + ")");
        }
        std::ostringstream buf;
        buf << in.rdbuf();

        out.push_back(format_trn_line(collapse_ws(buf.str()), w.stem().string()));
    }
    return out;
}

size_t write_corpus_trn(const fs::path& data_dir, const fs::path& out_trn) {
    const auto lines = build_corpus_trn(data_dir);
    std::string err;
    if (!write_lines_atomic(out_trn, lines, &err)) {
        throw StrataException(ErrorCode::IoError, err);
    }
    return lines.size();
}

} // namespace strata
