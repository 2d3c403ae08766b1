#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace strata {

enum class ErrorCode {
    Ok = 0,
    IoError,
    ParseError,
    InvalidArgs,
    MissingUtterances,
    DuplicateUtterances,
    ValidationFailed,
};

const char* error_code_name(ErrorCode c);

class StrataException : public std::runtime_error {
public:
    explicit StrataException(const std::string& msg)
        : std::runtime_error(msg), code_(ErrorCode::IoError) {}
    StrataException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// MissingUtterances: hypothesis ids without a perplexity record.
// DuplicateUtterances: ids repeated in either file.
class AlignmentError : public StrataException {
public:
    AlignmentError(const std::string& msg, std::vector<std::string> missing_ids)
        : StrataException(ErrorCode::MissingUtterances, msg),
          missing_ids_(std::move(missing_ids)) {}
    AlignmentError(ErrorCode code, const std::string& msg, std::vector<std::string> ids)
        : StrataException(code, msg), missing_ids_(std::move(ids)) {}

    const std::vector<std::string>& missing_ids() const { return missing_ids_; }

private:
    std::vector<std::string> missing_ids_;
};

} // namespace strata
