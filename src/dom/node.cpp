#include <svgrsx/dom/node.h>
#include <algorithm>
#include <utility>

namespace svgrsx::dom {

std::unique_ptr<Node> Node::make_element(std::string tag) {
    auto node = std::make_unique<Node>();
    node->type = Element;
    node->tag_name = std::move(tag);
    return node;
}

std::unique_ptr<Node> Node::make_text(std::string data) {
    auto node = std::make_unique<Node>();
    node->type = Text;
    node->data = std::move(data);
    return node;
}

Node* Node::append_child(std::unique_ptr<Node> child) {
    auto* raw = child.get();
    children.push_back(std::move(child));
    return raw;
}

bool Node::set_attribute(std::string name, std::string value) {
    if (has_attribute(name)) return false;
    attributes.push_back(Attribute{std::move(name), std::move(value)});
    return true;
}

std::optional<std::string> Node::attribute(std::string_view name) const {
    auto it = std::find_if(attributes.begin(), attributes.end(),
        [name](const Attribute& a) { return a.name == name; });
    if (it == attributes.end()) return std::nullopt;
    return it->value;
}

bool Node::has_attribute(std::string_view name) const {
    return std::any_of(attributes.begin(), attributes.end(),
        [name](const Attribute& a) { return a.name == name; });
}

std::string Node::text_content() const {
    if (type == Text) {
        return data;
    }
    std::string result;
    for (auto& child : children) {
        result += child->text_content();
    }
    return result;
}

Node* Node::find_element(std::string_view tag) const {
    for (auto& child : children) {
        if (child->type == Element && child->tag_name == tag) {
            return child.get();
        }
        auto* found = child->find_element(tag);
        if (found) return found;
    }
    return nullptr;
}

std::vector<Node*> Node::find_all_elements(std::string_view tag) const {
    std::vector<Node*> result;
    for (auto& child : children) {
        if (child->type == Element && child->tag_name == tag) {
            result.push_back(child.get());
        }
        auto sub = child->find_all_elements(tag);
        result.insert(result.end(), sub.begin(), sub.end());
    }
    return result;
}

std::size_t Node::element_count() const {
    if (type != Element) return 0;
    std::size_t count = 1;
    for (auto& child : children) {
        count += child->element_count();
    }
    return count;
}

} // namespace svgrsx::dom
