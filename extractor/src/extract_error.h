#pragma once

#include <stdexcept>
#include <string>

namespace docimg {

// Categories of per-document failure
enum class ErrorKind {
    InvalidInput,
    Archive,
    UniqueNameExhausted,
    Filesystem,
};

// Fatal error for the document being processed. Sibling documents in a
// batch are unaffected.
class ExtractError : public std::runtime_error {
public:
    ExtractError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace docimg
