#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace svgrsx::dom {

struct Attribute {
    std::string name;
    std::string value;
};

// One node of a parsed document. Elements own their children exclusively;
// there are no parent pointers, so a tree cannot contain cycles.
struct Node {
    enum Type { Element, Text };
    Type type = Element;
    std::string tag_name;  // Element only, exactly as written in the source
    std::string data;      // Text only, entities already resolved
    std::vector<Attribute> attributes;
    std::vector<std::unique_ptr<Node>> children;

    static std::unique_ptr<Node> make_element(std::string tag);
    static std::unique_ptr<Node> make_text(std::string data);

    bool is_element() const { return type == Element; }
    bool is_text() const { return type == Text; }

    Node* append_child(std::unique_ptr<Node> child);

    // Attributes keep insertion order. set_attribute refuses duplicates and
    // returns false without touching the existing value.
    bool set_attribute(std::string name, std::string value);
    std::optional<std::string> attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const;

    // Get text content recursively
    std::string text_content() const;

    Node* find_element(std::string_view tag) const;
    std::vector<Node*> find_all_elements(std::string_view tag) const;

    // Number of Element nodes in this subtree, this node included.
    std::size_t element_count() const;
};

} // namespace svgrsx::dom
