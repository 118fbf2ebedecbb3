#include <svgrsx/core/utf8.h>

namespace svgrsx::core {

namespace {

bool in_range(std::string_view text, std::size_t index, unsigned lo, unsigned hi) {
    if (index >= text.size()) return false;
    const auto byte = static_cast<unsigned char>(text[index]);
    return byte >= lo && byte <= hi;
}

} // namespace

void append_utf8(std::string& out, std::uint32_t code_point) {
    if (code_point <= 0x7Fu) {
        out.push_back(static_cast<char>(code_point));
        return;
    }
    if (code_point <= 0x7FFu) {
        out.push_back(static_cast<char>(0xC0u | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
        return;
    }
    if (code_point <= 0xFFFFu) {
        out.push_back(static_cast<char>(0xE0u | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80u | ((code_point >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
        return;
    }
    out.push_back(static_cast<char>(0xF0u | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80u | ((code_point >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((code_point >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
}

std::size_t utf8_sequence_length(std::string_view text, std::size_t offset) {
    if (offset >= text.size()) return 0;
    const auto lead = static_cast<unsigned char>(text[offset]);
    if (lead <= 0x7F) return 1;

    // Second-byte ranges per lead byte exclude overlong forms, surrogates
    // and values past U+10FFFF.
    if (lead >= 0xC2 && lead <= 0xDF) {
        return in_range(text, offset + 1, 0x80, 0xBF) ? 2 : 0;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        const unsigned lo = lead == 0xE0 ? 0xA0 : 0x80;
        const unsigned hi = lead == 0xED ? 0x9F : 0xBF;
        return in_range(text, offset + 1, lo, hi) &&
               in_range(text, offset + 2, 0x80, 0xBF) ? 3 : 0;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        const unsigned lo = lead == 0xF0 ? 0x90 : 0x80;
        const unsigned hi = lead == 0xF4 ? 0x8F : 0xBF;
        return in_range(text, offset + 1, lo, hi) &&
               in_range(text, offset + 2, 0x80, 0xBF) &&
               in_range(text, offset + 3, 0x80, 0xBF) ? 4 : 0;
    }
    return 0;
}

std::uint32_t decode_utf8(std::string_view text, std::size_t offset, std::size_t length) {
    const auto lead = static_cast<unsigned char>(text[offset]);
    if (length == 1) return lead;

    std::uint32_t code_point = lead & (0xFFu >> (length + 1));
    for (std::size_t i = 1; i < length; ++i) {
        code_point = (code_point << 6) |
                     (static_cast<unsigned char>(text[offset + i]) & 0x3Fu);
    }
    return code_point;
}

std::optional<std::size_t> find_invalid_utf8(std::string_view text) {
    std::size_t offset = 0;
    while (offset < text.size()) {
        const std::size_t length = utf8_sequence_length(text, offset);
        if (length == 0) return offset;
        offset += length;
    }
    return std::nullopt;
}

}  // namespace svgrsx::core
