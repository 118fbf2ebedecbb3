#include <svgrsx/core/error.h>

#include <sstream>
#include <utility>

namespace svgrsx::core {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ExternalCompileFailed: return "external-compile-failed";
        case ErrorKind::ReadFailed:            return "read-failed";
        case ErrorKind::MalformedXml:          return "malformed-xml";
        case ErrorKind::MismatchedTag:         return "mismatched-tag";
        case ErrorKind::UnclosedElement:       return "unclosed-element";
        case ErrorKind::NoRootElement:         return "no-root-element";
        case ErrorKind::MultipleRootElements:  return "multiple-root-elements";
        case ErrorKind::DuplicateAttribute:    return "duplicate-attribute";
        case ErrorKind::InvalidEntity:         return "invalid-entity";
    }
    return "unknown";
}

ConvertError ConvertError::at(ErrorKind kind, SourcePosition position,
                              std::string message, std::string detail) {
    ConvertError error;
    error.kind = kind;
    error.position = position;
    error.message = std::move(message);
    error.detail = std::move(detail);
    return error;
}

std::string format_error(const ConvertError& error) {
    std::ostringstream oss;
    oss << error_kind_name(error.kind);
    if (error.position.known()) {
        oss << " at " << error.position.line << ":" << error.position.column;
    }
    oss << ": " << error.message;
    if (error.kind == ErrorKind::ExternalCompileFailed && !error.detail.empty()) {
        oss << "\n" << error.detail;
    }
    return oss.str();
}

}  // namespace svgrsx::core
