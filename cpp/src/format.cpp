// strata/cpp/src/format.cpp
#include "strata/format.h"
#include "strata/errors.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace strata {

const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::Ok:                return "ok";
        case ErrorCode::IoError:           return "io_error";
        case ErrorCode::ParseError:        return "parse_error";
        case ErrorCode::InvalidArgs:       return "invalid_args";
        case ErrorCode::MissingUtterances: return "missing_utterances";
        case ErrorCode::DuplicateUtterances: return "duplicate_utterances";
        case ErrorCode::ValidationFailed:  return "validation_failed";
    }
    return "unknown";
}

std::string utc_now_compact() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin) {
    try {
        std::error_code ec;
        std::filesystem::create_directories(fin.parent_path(), ec);

        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::filesystem::remove(fin, ec);
        ec.clear();
        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::cerr << "[strata] atomic_replace failed: " << ec.message()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[strata] atomic_replace exception: " << e.what()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    }
}

bool write_lines_atomic(const std::filesystem::path& fin,
                        const std::vector<std::string>& lines,
                        std::string* err) {
    auto tmp = fin;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            if (err) *err = "cannot open " + tmp.string();
            return false;
        }
        for (const auto& l : lines) {
            out.write(l.data(), (std::streamsize)l.size());
            out.put('\n');
        }
        out.flush();
        if (!out) {
            if (err) *err = "write failed " + tmp.string();
            return false;
        }
    }
    if (!atomic_replace_file_best_effort(tmp, fin)) {
        if (err) *err = "atomic replace failed " + fin.string();
        return false;
    }
    return true;
}

bool read_lines(const std::filesystem::path& p,
                std::vector<std::string>& out,
                std::string* err) {
    out.clear();
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        if (err) *err = "cannot open " + p.string();
        return false;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(std::move(line));
        line.clear();
    }
    if (in.bad()) {
        if (err) *err = "read failed " + p.string();
        return false;
    }
    return true;
}

} // namespace strata
