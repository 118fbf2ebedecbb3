#pragma once

#include <cstddef>
#include <string>

namespace svgrsx::core {

enum class ErrorKind {
    ExternalCompileFailed,
    ReadFailed,
    MalformedXml,
    MismatchedTag,
    UnclosedElement,
    NoRootElement,
    MultipleRootElements,
    DuplicateAttribute,
    InvalidEntity,
};

// Stable lowercase name, e.g. "mismatched-tag".
const char* error_kind_name(ErrorKind kind);

// Position of the offending input. Line and column are 1-based;
// line 0 means the position is unknown.
struct SourcePosition {
    std::size_t offset = 0;
    std::size_t line = 0;
    std::size_t column = 0;

    bool known() const { return line != 0; }
};

struct ConvertError {
    ErrorKind kind = ErrorKind::MalformedXml;
    std::string message;
    // Tag name, attribute name, raw entity text, file path or captured
    // compiler output, depending on the kind.
    std::string detail;
    SourcePosition position;
    int exit_code = 0;

    static ConvertError at(ErrorKind kind, SourcePosition position,
                           std::string message, std::string detail = {});
};

// "mismatched-tag at 1:10: expected </a> but found </b>"
std::string format_error(const ConvertError& error);

}  // namespace svgrsx::core
