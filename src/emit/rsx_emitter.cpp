#include <svgrsx/emit/rsx_emitter.h>
#include <svgrsx/core/utf8.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <utility>

namespace svgrsx::emit {

namespace {

// Strict and reserved keywords that may be written as raw identifiers.
// self, Self, super and crate cannot take the prefix and never occur as
// SVG names.
constexpr std::array<std::string_view, 47> kReservedWords = {
    "abstract", "as", "async", "await", "become", "box", "break", "const",
    "continue", "do", "dyn", "else", "enum", "extern", "false", "final",
    "fn", "for", "gen", "if", "impl", "in", "let", "loop", "macro", "match",
    "mod", "move", "mut", "override", "priv", "pub", "ref", "return",
    "static", "struct", "trait", "true", "try", "type", "typeof", "unsafe",
    "unsized", "use", "virtual", "where", "while",
};

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Bidirectional formatting characters. A literal that contains one
// unescaped is rejected by the compiler.
bool is_text_direction_control(std::uint32_t code_point) {
    return (code_point >= 0x202A && code_point <= 0x202E) ||
           (code_point >= 0x2066 && code_point <= 0x2069);
}

void append_unicode_escape(std::string& out, std::uint32_t code_point) {
    static const char kHex[] = "0123456789abcdef";
    char digits[8];
    int count = 0;
    do {
        digits[count++] = kHex[code_point & 0x0F];
        code_point >>= 4;
    } while (code_point != 0 || count < 2);
    out += "\\u{";
    while (count > 0) out += digits[--count];
    out += '}';
}

std::string with_raw_prefix(std::string ident) {
    if (is_reserved_word(ident)) {
        return "r#" + ident;
    }
    return ident;
}

} // namespace

std::string map_attribute_name(std::string_view name) {
    std::string mapped(name);
    std::replace(mapped.begin(), mapped.end(), '-', '_');
    return mapped;
}

bool is_identifier(std::string_view name) {
    if (name.empty() || name == "_" || !is_ident_start(name.front())) {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), is_ident_char);
}

bool is_reserved_word(std::string_view name) {
    return std::find(kReservedWords.begin(), kReservedWords.end(), name) != kReservedWords.end();
}

std::string component_identifier(std::string_view tag) {
    std::string ident = map_attribute_name(tag);
    for (auto& c : ident) {
        if (!is_ident_char(c)) c = '_';
    }
    if (ident.empty() || !is_ident_start(ident.front()) || ident == "_") {
        ident.insert(ident.begin(), '_');
    }
    return with_raw_prefix(std::move(ident));
}

std::string attribute_key(std::string_view name) {
    std::string mapped = map_attribute_name(name);
    if (is_identifier(mapped)) {
        return with_raw_prefix(std::move(mapped));
    }
    return quote_literal(mapped);
}

std::string escape_literal(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        const auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x80) {
            const size_t length = core::utf8_sequence_length(text, i);
            if (length == 0) {
                // Not UTF-8; the replacement character keeps the output valid.
                append_unicode_escape(out, 0xFFFD);
                ++i;
                continue;
            }
            const std::uint32_t code_point = core::decode_utf8(text, i, length);
            if (code_point <= 0x9F || is_text_direction_control(code_point)) {
                append_unicode_escape(out, code_point);
            } else {
                out.append(text, i, length);
            }
            i += length;
            continue;
        }

        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\0': out += "\\0"; break;
            case '{':  out += "{{"; break;
            case '}':  out += "}}"; break;
            default:
                if (byte < 0x20 || byte == 0x7F) {
                    append_unicode_escape(out, byte);
                } else {
                    out += c;
                }
        }
        ++i;
    }
    return out;
}

std::string quote_literal(std::string_view text) {
    return "\"" + escape_literal(text) + "\"";
}

std::optional<std::string> unescape_literal(std::string_view literal) {
    if (literal.size() < 2 || literal.front() != '"' || literal.back() != '"') {
        return std::nullopt;
    }
    std::string_view body = literal.substr(1, literal.size() - 2);

    std::string out;
    out.reserve(body.size());
    size_t i = 0;
    while (i < body.size()) {
        char c = body[i++];
        if (c == '"') return std::nullopt;
        if (c == '{' || c == '}') {
            // Single braces would start or end an interpolation.
            if (i >= body.size() || body[i] != c) return std::nullopt;
            out += c;
            ++i;
            continue;
        }
        if (c != '\\') {
            out += c;
            continue;
        }

        if (i >= body.size()) return std::nullopt;
        char e = body[i++];
        switch (e) {
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case '0':  out += '\0'; break;
            case '\\': out += '\\'; break;
            case '"':  out += '"'; break;
            case '\'': out += '\''; break;
            case 'u': {
                if (i >= body.size() || body[i] != '{') return std::nullopt;
                ++i;
                unsigned long codepoint = 0;
                size_t digits = 0;
                while (i < body.size() && body[i] != '}') {
                    const auto byte = static_cast<unsigned char>(body[i]);
                    if (!std::isxdigit(byte) || ++digits > 6) return std::nullopt;
                    const unsigned digit = std::isdigit(byte)
                        ? static_cast<unsigned>(byte - '0')
                        : static_cast<unsigned>(std::tolower(byte) - 'a' + 10);
                    codepoint = codepoint * 16 + digit;
                    ++i;
                }
                if (i >= body.size() || digits == 0 || codepoint > 0x10FFFF) return std::nullopt;
                ++i;  // '}'
                core::append_utf8(out, static_cast<std::uint32_t>(codepoint));
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return out;
}

RsxEmitter::RsxEmitter(EmitOptions options) : options_(std::move(options)) {}

std::string RsxEmitter::render(const dom::Node& root) {
    out_.clear();
    write_node(root, 0);
    if (options_.trailing_separator) {
        out_ += ',';
    }
    return std::move(out_);
}

bool RsxEmitter::is_skipped(const dom::Node& node) const {
    if (!options_.skip_whitespace_text || !node.is_text()) return false;
    return std::all_of(node.data.begin(), node.data.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    });
}

void RsxEmitter::begin_item(size_t depth) {
    if (options_.compact) {
        out_ += ' ';
        return;
    }
    out_ += '\n';
    out_.append(depth * options_.indent_width, ' ');
}

void RsxEmitter::end_item() {
    out_ += ',';
}

void RsxEmitter::write_node(const dom::Node& node, size_t depth) {
    if (node.is_text()) {
        out_ += quote_literal(node.data);
        return;
    }
    write_element(node, depth);
}

void RsxEmitter::write_element(const dom::Node& element, size_t depth) {
    out_ += component_identifier(element.tag_name);
    out_ += " {";

    bool has_items = false;
    for (const auto& attr : element.attributes) {
        begin_item(depth + 1);
        out_ += attribute_key(attr.name);
        out_ += ": ";
        out_ += quote_literal(attr.value);
        end_item();
        has_items = true;
    }
    for (const auto& child : element.children) {
        if (is_skipped(*child)) continue;
        begin_item(depth + 1);
        write_node(*child, depth + 1);
        end_item();
        has_items = true;
    }

    if (has_items) {
        if (options_.compact) {
            out_ += ' ';
        } else {
            out_ += '\n';
            out_.append(depth * options_.indent_width, ' ');
        }
    }
    out_ += '}';
}

std::string render(const dom::Node& root, const EmitOptions& options) {
    RsxEmitter emitter(options);
    return emitter.render(root);
}

} // namespace svgrsx::emit
