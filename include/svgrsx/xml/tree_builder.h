#pragma once
#include <svgrsx/core/error.h>
#include <svgrsx/dom/node.h>
#include <svgrsx/xml/tokenizer.h>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace svgrsx::xml {

struct ParseResult {
    std::unique_ptr<dom::Node> root;
    std::optional<core::ConvertError> error;

    bool ok() const { return root != nullptr && !error; }
};

// Builds a dom::Node tree from tokens using an explicit stack of open
// elements. Each open element is owned by the stack until its end tag
// arrives, then moved into its parent. The first structural error stops
// the build; later tokens are ignored.
class TreeBuilder {
public:
    TreeBuilder() = default;

    // Process a token. Returns false once the builder has failed.
    bool process_token(Token token);

    // Validates end-of-input conditions and hands over the result. The
    // builder is left empty.
    ParseResult finish();

    bool failed() const { return error_.has_value(); }
    const std::optional<core::ConvertError>& error() const { return error_; }
    size_t depth() const { return open_elements_.size(); }

private:
    struct OpenElement {
        std::unique_ptr<dom::Node> node;
        core::SourcePosition position;
    };

    std::vector<OpenElement> open_elements_;
    std::unique_ptr<dom::Node> root_;
    core::SourcePosition end_position_;
    std::optional<core::ConvertError> error_;

    void handle_start_tag(Token& token);
    void handle_end_tag(const Token& token);
    void handle_character(Token& token);

    void close_element(std::unique_ptr<dom::Node> element, core::SourcePosition position);
    void fail(core::ErrorKind kind, core::SourcePosition at,
              std::string message, std::string detail = {});
};

// Convenience: parse XML text into a document tree.
ParseResult parse(std::string_view xml);

} // namespace svgrsx::xml
