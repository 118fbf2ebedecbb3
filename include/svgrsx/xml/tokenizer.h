#pragma once
#include <svgrsx/core/error.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace svgrsx::xml {

struct Attribute {
    std::string name;
    std::string value;
    core::SourcePosition position;
};

struct Token {
    enum Type { StartTag, EndTag, Character, EndOfFile, Error };
    Type type = EndOfFile;
    std::string name;
    std::vector<Attribute> attributes;
    bool self_closing = false;
    std::string data;  // For Character tokens

    // Where the token starts: the '<' of a tag, the first byte of text.
    core::SourcePosition position;

    // Set on Error tokens only.
    std::optional<core::ConvertError> error;
};

enum class TokenizerState {
    Data, TagOpen, EndTagOpen, TagName, EndTagName, AfterEndTagName,
    BeforeAttributeName, AttributeName, AfterAttributeName,
    BeforeAttributeValue, AttributeValueDoubleQuoted, AttributeValueSingleQuoted,
    AfterAttributeValueQuoted, SelfClosingStartTag,
    MarkupDeclarationOpen, Comment, ProcessingInstruction, Doctype,
    CDATASection, Failed
};

// Single forward pass over XML text. Comments, processing instructions and
// the DOCTYPE are consumed silently. Character data comes out as one token
// per run with entities decoded. Input must be well-formed UTF-8. The first malformed construct produces an
// Error token; every call after that returns EndOfFile.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    Token next_token();
    TokenizerState state() const { return state_; }
    core::SourcePosition position() const;

    static bool is_name_start_char(char c);
    static bool is_name_char(char c);
    static bool is_whitespace(char c);

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    TokenizerState state_ = TokenizerState::Data;
    Token current_token_;
    std::optional<core::ConvertError> pending_error_;

    char consume();
    char peek() const;
    bool at_end() const;
    bool starts_with(std::string_view s) const;
    void advance(size_t count);

    Token emit_current();
    Token emit_eof();
    Token fail(core::ErrorKind kind, core::SourcePosition at,
               std::string message, std::string detail = {});
    Token fail_pending();

    Token consume_character_run();

    // Records a MalformedXml error at the first byte that is not UTF-8.
    void check_encoding();

    // Called after '&' has been consumed. Appends the decoded text to out, or
    // records an InvalidEntity error and returns false.
    bool consume_entity(std::string& out, core::SourcePosition amp);
};

} // namespace svgrsx::xml
