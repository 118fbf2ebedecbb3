#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace svgrsx::core {

// Appends the UTF-8 encoding of code_point. The caller guarantees a
// Unicode scalar value.
void append_utf8(std::string& out, std::uint32_t code_point);

// Length of the well-formed UTF-8 sequence starting at offset, or 0 when the
// bytes there are ill-formed (stray continuation, overlong form, surrogate,
// value above U+10FFFF, or truncated at the end of text).
std::size_t utf8_sequence_length(std::string_view text, std::size_t offset);

// Code point of a sequence already checked by utf8_sequence_length.
std::uint32_t decode_utf8(std::string_view text, std::size_t offset, std::size_t length);

// Offset of the first ill-formed byte, if any.
std::optional<std::size_t> find_invalid_utf8(std::string_view text);

}  // namespace svgrsx::core
