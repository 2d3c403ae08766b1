// strata/cpp/include/strata/validator.h
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace strata {

struct ValidationResult {
    bool ok{false};
    std::vector<std::string> errors;
    std::vector<std::string> ids; // ids of ref.trn, in file order
};

// ref.trn and hyp.trn of one bin: same ids, same order.
ValidationResult validate_bin_dir(const std::filesystem::path& bin_dir);

// Marker + every bin it names; no id in two bins; sizes match the marker.
ValidationResult validate_out_dir(const std::filesystem::path& out_dir);

} // namespace strata
