#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace strata {

constexpr const char* kRefFileName = "ref.trn";
constexpr const char* kHypFileName = "hyp.trn";
constexpr const char* kMarkerFileName = ".done_split";

std::string utc_now_compact();

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin);

// Пишем во временный файл "<fin>.tmp", затем rename поверх fin.
bool write_lines_atomic(const std::filesystem::path& fin,
                        const std::vector<std::string>& lines,
                        std::string* err);

// Read lines, strips trailing '\r'. Empty lines are kept.
bool read_lines(const std::filesystem::path& p,
                std::vector<std::string>& out,
                std::string* err);

} // namespace strata
