#pragma once
#include <svgrsx/core/config.h>
#include <svgrsx/dom/node.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace svgrsx::emit {

struct EmitOptions {
    size_t indent_width = core::config::kDefaultIndentWidth;
    // Everything on one line, items separated by single spaces.
    bool compact = false;
    // Drop Text children that consist only of XML whitespace.
    bool skip_whitespace_text = false;
    // Follow the root component with a separator as well.
    bool trailing_separator = false;
};

// Replaces every '-' with '_'. Case and all other characters are kept, so
// the mapping is idempotent.
std::string map_attribute_name(std::string_view name);

bool is_identifier(std::string_view name);

// Keywords of the host language that need the raw identifier prefix.
bool is_reserved_word(std::string_view name);

// Tag name as a component identifier: hyphens and other characters that
// cannot appear in an identifier become '_', reserved words get "r#".
std::string component_identifier(std::string_view tag);

// Attribute key: the mapped name, "r#"-prefixed when reserved, or quoted
// when the mapped name is still not an identifier (e.g. "xlink:href").
std::string attribute_key(std::string_view name);

// Escapes text for the inside of a string literal. Quotes, backslashes and
// control characters use backslash escapes; braces are doubled because
// they delimit interpolations. Every byte sequence has an escaped form.
std::string escape_literal(std::string_view text);

// escape_literal wrapped in double quotes.
std::string quote_literal(std::string_view text);

// Parses a double-quoted literal produced by quote_literal back into the
// original text. Returns nullopt for anything that is not a complete,
// interpolation-free literal.
std::optional<std::string> unescape_literal(std::string_view literal);

// Renders a node tree as nested component calls:
//
//   svg {
//       viewBox: "0 0 10 10",
//       text {
//           "Hello, ",
//           tspan {
//               font_weight: "bold",
//               "Typst!",
//           },
//       },
//   }
//
// Children keep their source order. Elements without attributes and
// children still render, as "rect {}".
class RsxEmitter {
public:
    explicit RsxEmitter(EmitOptions options = {});

    std::string render(const dom::Node& root);

    const EmitOptions& options() const { return options_; }

private:
    EmitOptions options_;
    std::string out_;

    void write_node(const dom::Node& node, size_t depth);
    void write_element(const dom::Node& element, size_t depth);
    void begin_item(size_t depth);
    void end_item();
    bool is_skipped(const dom::Node& node) const;
};

// Convenience: render with a fresh emitter.
std::string render(const dom::Node& root, const EmitOptions& options = {});

} // namespace svgrsx::emit
