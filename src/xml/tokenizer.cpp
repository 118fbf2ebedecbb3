#include <svgrsx/xml/tokenizer.h>
#include <svgrsx/core/utf8.h>
#include <cctype>
#include <cstdint>
#include <utility>

namespace svgrsx::xml {

namespace {

constexpr size_t kMaxEntityLength = 32;

std::string describe(char c) {
    if (std::isprint(static_cast<unsigned char>(c))) {
        return std::string("'") + c + "'";
    }
    static const char kHex[] = "0123456789ABCDEF";
    const auto byte = static_cast<unsigned char>(c);
    return std::string("byte 0x") + kHex[byte >> 4] + kHex[byte & 0x0F];
}

} // namespace

Tokenizer::Tokenizer(std::string_view input) : input_(input) {
    check_encoding();
}

void Tokenizer::check_encoding() {
    const auto bad = core::find_invalid_utf8(input_);
    if (!bad) return;

    core::SourcePosition at{*bad, 1, 1};
    for (size_t i = 0; i < *bad; ++i) {
        if (input_[i] == '\n') {
            ++at.line;
            at.column = 1;
        } else {
            ++at.column;
        }
    }
    pending_error_ = core::ConvertError::at(
        core::ErrorKind::MalformedXml, at,
        "invalid UTF-8 " + describe(input_[*bad]));
}

bool Tokenizer::is_name_start_char(char c) {
    const auto byte = static_cast<unsigned char>(c);
    return std::isalpha(byte) || c == '_' || c == ':' || byte >= 0x80;
}

bool Tokenizer::is_name_char(char c) {
    return is_name_start_char(c) || std::isdigit(static_cast<unsigned char>(c))
        || c == '-' || c == '.';
}

bool Tokenizer::is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

core::SourcePosition Tokenizer::position() const {
    return core::SourcePosition{pos_, line_, column_};
}

char Tokenizer::consume() {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

char Tokenizer::peek() const {
    if (pos_ < input_.size()) {
        return input_[pos_];
    }
    return '\0';
}

bool Tokenizer::at_end() const {
    return pos_ >= input_.size();
}

bool Tokenizer::starts_with(std::string_view s) const {
    return input_.substr(pos_, s.size()) == s;
}

void Tokenizer::advance(size_t count) {
    for (size_t i = 0; i < count && !at_end(); ++i) {
        consume();
    }
}

Token Tokenizer::emit_current() {
    state_ = TokenizerState::Data;
    Token t = std::move(current_token_);
    current_token_ = Token{};
    return t;
}

Token Tokenizer::emit_eof() {
    Token t;
    t.type = Token::EndOfFile;
    t.position = position();
    return t;
}

Token Tokenizer::fail(core::ErrorKind kind, core::SourcePosition at,
                      std::string message, std::string detail) {
    state_ = TokenizerState::Failed;
    Token t;
    t.type = Token::Error;
    t.position = at;
    t.error = core::ConvertError::at(kind, at, std::move(message), std::move(detail));
    return t;
}

Token Tokenizer::fail_pending() {
    state_ = TokenizerState::Failed;
    Token t;
    t.type = Token::Error;
    t.error = std::move(pending_error_);
    pending_error_.reset();
    t.position = t.error->position;
    return t;
}

bool Tokenizer::consume_entity(std::string& out, core::SourcePosition amp) {
    std::string raw = "&";
    while (!at_end() && raw.size() < kMaxEntityLength) {
        char c = peek();
        if (c == ';') {
            raw += consume();
            break;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '#') break;
        raw += consume();
    }

    auto invalid = [&](const char* message) {
        pending_error_ = core::ConvertError::at(
            core::ErrorKind::InvalidEntity, amp, message, raw);
        return false;
    };

    if (raw.back() != ';') return invalid("entity reference is missing ';'");

    std::string_view body(raw);
    body = body.substr(1, body.size() - 2);
    if (body.empty()) return invalid("empty entity reference");

    // Numeric character reference: &#NNN; or &#xHHH;
    if (body.front() == '#') {
        body.remove_prefix(1);
        const bool hex = !body.empty() && body.front() == 'x';
        if (hex) body.remove_prefix(1);
        if (body.empty()) return invalid("character reference has no digits");

        unsigned long codepoint = 0;
        for (char c : body) {
            const auto byte = static_cast<unsigned char>(c);
            unsigned digit = 0;
            if (std::isdigit(byte)) {
                digit = static_cast<unsigned>(c - '0');
            } else if (hex && std::isxdigit(byte)) {
                digit = static_cast<unsigned>(std::tolower(byte) - 'a' + 10);
            } else {
                return invalid("invalid digit in character reference");
            }
            codepoint = codepoint * (hex ? 16 : 10) + digit;
            if (codepoint > 0x10FFFF) return invalid("character reference out of range");
        }
        if (codepoint == 0 || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return invalid("character reference out of range");
        }
        core::append_utf8(out, static_cast<std::uint32_t>(codepoint));
        return true;
    }

    // The five predefined XML entities. SVG documents may not rely on DTD
    // declared entities here.
    if (body == "amp")  { out += '&';  return true; }
    if (body == "lt")   { out += '<';  return true; }
    if (body == "gt")   { out += '>';  return true; }
    if (body == "quot") { out += '"';  return true; }
    if (body == "apos") { out += '\''; return true; }
    return invalid("unknown entity");
}

Token Tokenizer::consume_character_run() {
    Token t;
    t.type = Token::Character;
    t.position = position();
    while (!at_end() && peek() != '<') {
        if (peek() == '&') {
            const auto amp = position();
            consume();
            if (!consume_entity(t.data, amp)) return fail_pending();
            continue;
        }
        t.data += consume();
    }
    return t;
}

Token Tokenizer::next_token() {
    // Ill-formed input is rejected before any token is produced.
    if (pending_error_ && state_ != TokenizerState::Failed) return fail_pending();

    while (true) {
        switch (state_) {

        // ====================================================================
        // Data state
        // ====================================================================
        case TokenizerState::Data: {
            if (at_end()) return emit_eof();
            if (peek() == '<') {
                current_token_ = Token{};
                current_token_.position = position();
                consume();
                state_ = TokenizerState::TagOpen;
                continue;
            }
            return consume_character_run();
        }

        // ====================================================================
        // Tag Open state
        // ====================================================================
        case TokenizerState::TagOpen: {
            if (at_end()) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated tag");
            }
            char c = peek();
            if (c == '!') {
                consume();
                state_ = TokenizerState::MarkupDeclarationOpen;
                continue;
            }
            if (c == '/') {
                consume();
                state_ = TokenizerState::EndTagOpen;
                continue;
            }
            if (c == '?') {
                consume();
                state_ = TokenizerState::ProcessingInstruction;
                continue;
            }
            if (is_name_start_char(c)) {
                current_token_.type = Token::StartTag;
                state_ = TokenizerState::TagName;
                continue;
            }
            return fail(core::ErrorKind::MalformedXml, position(),
                        "invalid character " + describe(c) + " at start of tag name");
        }

        // ====================================================================
        // Markup declarations: comments, CDATA, DOCTYPE
        // ====================================================================
        case TokenizerState::MarkupDeclarationOpen: {
            if (starts_with("--")) {
                advance(2);
                state_ = TokenizerState::Comment;
                continue;
            }
            if (starts_with("[CDATA[")) {
                advance(7);
                state_ = TokenizerState::CDATASection;
                continue;
            }
            if (starts_with("DOCTYPE")) {
                advance(7);
                state_ = TokenizerState::Doctype;
                continue;
            }
            return fail(core::ErrorKind::MalformedXml, current_token_.position,
                        "unrecognized markup declaration");
        }

        case TokenizerState::Comment: {
            const size_t end = input_.find("-->", pos_);
            if (end == std::string_view::npos) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated comment");
            }
            advance(end + 3 - pos_);
            state_ = TokenizerState::Data;
            continue;
        }

        case TokenizerState::ProcessingInstruction: {
            const size_t end = input_.find("?>", pos_);
            if (end == std::string_view::npos) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated processing instruction");
            }
            advance(end + 2 - pos_);
            state_ = TokenizerState::Data;
            continue;
        }

        case TokenizerState::Doctype: {
            // Skip to the closing '>', stepping over quoted literals and an
            // internal subset in brackets.
            int depth = 0;
            char quote = '\0';
            while (!at_end()) {
                char c = consume();
                if (quote != '\0') {
                    if (c == quote) quote = '\0';
                } else if (c == '"' || c == '\'') {
                    quote = c;
                } else if (c == '[') {
                    ++depth;
                } else if (c == ']') {
                    --depth;
                } else if (c == '>' && depth <= 0) {
                    state_ = TokenizerState::Data;
                    break;
                }
            }
            if (state_ != TokenizerState::Data) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated DOCTYPE");
            }
            continue;
        }

        case TokenizerState::CDATASection: {
            const size_t end = input_.find("]]>", pos_);
            if (end == std::string_view::npos) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated CDATA section");
            }
            Token t;
            t.type = Token::Character;
            t.position = position();
            t.data = std::string(input_.substr(pos_, end - pos_));
            advance(end + 3 - pos_);
            state_ = TokenizerState::Data;
            if (t.data.empty()) continue;
            return t;
        }

        // ====================================================================
        // Start tag name
        // ====================================================================
        case TokenizerState::TagName: {
            if (at_end()) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated tag <" + current_token_.name);
            }
            char c = peek();
            if (is_name_char(c)) {
                current_token_.name += consume();
                continue;
            }
            if (is_whitespace(c)) {
                consume();
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '/') {
                consume();
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '>') {
                consume();
                return emit_current();
            }
            return fail(core::ErrorKind::MalformedXml, position(),
                        "invalid character " + describe(c) + " in tag name");
        }

        // ====================================================================
        // End tag
        // ====================================================================
        case TokenizerState::EndTagOpen: {
            if (at_end()) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated end tag");
            }
            char c = peek();
            if (is_name_start_char(c)) {
                current_token_.type = Token::EndTag;
                state_ = TokenizerState::EndTagName;
                continue;
            }
            return fail(core::ErrorKind::MalformedXml, position(),
                        "invalid character " + describe(c) + " at start of end tag name");
        }

        case TokenizerState::EndTagName: {
            if (at_end()) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated end tag </" + current_token_.name);
            }
            char c = peek();
            if (is_name_char(c)) {
                current_token_.name += consume();
                continue;
            }
            if (is_whitespace(c)) {
                consume();
                state_ = TokenizerState::AfterEndTagName;
                continue;
            }
            if (c == '>') {
                consume();
                return emit_current();
            }
            return fail(core::ErrorKind::MalformedXml, position(),
                        "invalid character " + describe(c) + " in end tag name");
        }

        case TokenizerState::AfterEndTagName: {
            if (at_end()) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated end tag </" + current_token_.name);
            }
            char c = peek();
            if (is_whitespace(c)) {
                consume();
                continue;
            }
            if (c == '>') {
                consume();
                return emit_current();
            }
            return fail(core::ErrorKind::MalformedXml, position(),
                        "unexpected " + describe(c) + " in end tag");
        }

        // ====================================================================
        // Attributes
        // ====================================================================
        case TokenizerState::BeforeAttributeName: {
            if (at_end()) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated tag <" + current_token_.name);
            }
            char c = peek();
            if (is_whitespace(c)) {
                consume();
                continue;
            }
            if (c == '/') {
                consume();
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '>') {
                consume();
                return emit_current();
            }
            if (is_name_start_char(c)) {
                Attribute attr;
                attr.position = position();
                current_token_.attributes.push_back(std::move(attr));
                state_ = TokenizerState::AttributeName;
                continue;
            }
            return fail(core::ErrorKind::MalformedXml, position(),
                        "invalid character " + describe(c) + " at start of attribute name");
        }

        case TokenizerState::AttributeName: {
            if (at_end()) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated tag <" + current_token_.name);
            }
            char c = peek();
            if (is_name_char(c)) {
                current_token_.attributes.back().name += consume();
                continue;
            }
            if (is_whitespace(c)) {
                consume();
                state_ = TokenizerState::AfterAttributeName;
                continue;
            }
            if (c == '=') {
                consume();
                state_ = TokenizerState::BeforeAttributeValue;
                continue;
            }
            return fail(core::ErrorKind::MalformedXml, position(),
                        "expected '=' after attribute name '" +
                            current_token_.attributes.back().name + "'");
        }

        case TokenizerState::AfterAttributeName: {
            if (at_end()) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated tag <" + current_token_.name);
            }
            char c = peek();
            if (is_whitespace(c)) {
                consume();
                continue;
            }
            if (c == '=') {
                consume();
                state_ = TokenizerState::BeforeAttributeValue;
                continue;
            }
            return fail(core::ErrorKind::MalformedXml, position(),
                        "expected '=' after attribute name '" +
                            current_token_.attributes.back().name + "'");
        }

        case TokenizerState::BeforeAttributeValue: {
            if (at_end()) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated tag <" + current_token_.name);
            }
            char c = peek();
            if (is_whitespace(c)) {
                consume();
                continue;
            }
            if (c == '"') {
                consume();
                state_ = TokenizerState::AttributeValueDoubleQuoted;
                continue;
            }
            if (c == '\'') {
                consume();
                state_ = TokenizerState::AttributeValueSingleQuoted;
                continue;
            }
            return fail(core::ErrorKind::MalformedXml, position(),
                        "value of attribute '" + current_token_.attributes.back().name +
                            "' must be quoted");
        }

        case TokenizerState::AttributeValueDoubleQuoted:
        case TokenizerState::AttributeValueSingleQuoted: {
            const char quote =
                state_ == TokenizerState::AttributeValueDoubleQuoted ? '"' : '\'';
            auto& attr = current_token_.attributes.back();
            if (at_end()) {
                return fail(core::ErrorKind::MalformedXml, attr.position,
                            "unterminated value of attribute '" + attr.name + "'");
            }
            char c = peek();
            if (c == quote) {
                consume();
                state_ = TokenizerState::AfterAttributeValueQuoted;
                continue;
            }
            if (c == '&') {
                const auto amp = position();
                consume();
                if (!consume_entity(attr.value, amp)) return fail_pending();
                continue;
            }
            if (c == '<') {
                return fail(core::ErrorKind::MalformedXml, position(),
                            "'<' is not allowed in value of attribute '" + attr.name + "'");
            }
            attr.value += consume();
            continue;
        }

        case TokenizerState::AfterAttributeValueQuoted: {
            if (at_end()) {
                return fail(core::ErrorKind::MalformedXml, current_token_.position,
                            "unterminated tag <" + current_token_.name);
            }
            char c = peek();
            if (is_whitespace(c)) {
                consume();
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '/') {
                consume();
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '>') {
                consume();
                return emit_current();
            }
            return fail(core::ErrorKind::MalformedXml, position(),
                        "missing whitespace between attributes");
        }

        case TokenizerState::SelfClosingStartTag: {
            if (!at_end() && peek() == '>') {
                consume();
                current_token_.self_closing = true;
                return emit_current();
            }
            return fail(core::ErrorKind::MalformedXml, position(),
                        "expected '>' after '/' in tag <" + current_token_.name);
        }

        case TokenizerState::Failed:
            return emit_eof();
        }
    }
}

} // namespace svgrsx::xml
