#include <svgrsx/xml/tree_builder.h>
#include <svgrsx/emit/rsx_emitter.h>
#include <algorithm>
#include <utility>

namespace svgrsx::xml {

namespace {

bool is_all_whitespace(const std::string& data) {
    return std::all_of(data.begin(), data.end(), Tokenizer::is_whitespace);
}

} // namespace

void TreeBuilder::fail(core::ErrorKind kind, core::SourcePosition at,
                       std::string message, std::string detail) {
    if (error_) return;
    error_ = core::ConvertError::at(kind, at, std::move(message), std::move(detail));
}

bool TreeBuilder::process_token(Token token) {
    if (error_) return false;

    switch (token.type) {
        case Token::StartTag:
            handle_start_tag(token);
            break;
        case Token::EndTag:
            handle_end_tag(token);
            break;
        case Token::Character:
            handle_character(token);
            break;
        case Token::EndOfFile:
            end_position_ = token.position;
            break;
        case Token::Error:
            error_ = std::move(token.error);
            break;
    }
    return !error_;
}

void TreeBuilder::handle_start_tag(Token& token) {
    if (open_elements_.empty() && root_) {
        fail(core::ErrorKind::MultipleRootElements, token.position,
             "second top-level element <" + token.name + "> after <" +
                 root_->tag_name + ">",
             token.name);
        return;
    }

    auto element = dom::Node::make_element(std::move(token.name));
    element->attributes.reserve(token.attributes.size());
    for (auto& attr : token.attributes) {
        if (element->has_attribute(attr.name)) {
            fail(core::ErrorKind::DuplicateAttribute, attr.position,
                 "duplicate attribute '" + attr.name + "' on <" + element->tag_name + ">",
                 attr.name);
            return;
        }
        const std::string key = emit::map_attribute_name(attr.name);
        for (const auto& existing : element->attributes) {
            if (emit::map_attribute_name(existing.name) == key) {
                fail(core::ErrorKind::DuplicateAttribute, attr.position,
                     "attribute '" + attr.name + "' on <" + element->tag_name +
                         "> renders to the same key as '" + existing.name + "'",
                     key);
                return;
            }
        }
        element->set_attribute(std::move(attr.name), std::move(attr.value));
    }

    if (token.self_closing) {
        close_element(std::move(element), token.position);
        return;
    }
    open_elements_.push_back(OpenElement{std::move(element), token.position});
}

void TreeBuilder::handle_end_tag(const Token& token) {
    if (open_elements_.empty()) {
        fail(core::ErrorKind::MismatchedTag, token.position,
             "closing tag </" + token.name + "> has no open element",
             token.name);
        return;
    }

    auto& current = open_elements_.back();
    if (current.node->tag_name != token.name) {
        fail(core::ErrorKind::MismatchedTag, token.position,
             "expected </" + current.node->tag_name + "> but found </" + token.name + ">",
             token.name);
        return;
    }

    OpenElement closed = std::move(current);
    open_elements_.pop_back();
    close_element(std::move(closed.node), closed.position);
}

void TreeBuilder::handle_character(Token& token) {
    if (open_elements_.empty()) {
        if (is_all_whitespace(token.data)) return;
        fail(core::ErrorKind::MalformedXml, token.position,
             "text content outside the root element");
        return;
    }

    auto& parent = *open_elements_.back().node;
    if (!parent.children.empty() && parent.children.back()->is_text()) {
        parent.children.back()->data += token.data;
        return;
    }
    parent.append_child(dom::Node::make_text(std::move(token.data)));
}

void TreeBuilder::close_element(std::unique_ptr<dom::Node> element,
                                core::SourcePosition position) {
    if (!open_elements_.empty()) {
        open_elements_.back().node->append_child(std::move(element));
        return;
    }
    if (root_) {
        fail(core::ErrorKind::MultipleRootElements, position,
             "second top-level element <" + element->tag_name + "> after <" +
                 root_->tag_name + ">",
             element->tag_name);
        return;
    }
    root_ = std::move(element);
}

ParseResult TreeBuilder::finish() {
    ParseResult result;
    if (!error_) {
        if (!open_elements_.empty()) {
            const auto& innermost = open_elements_.back();
            fail(core::ErrorKind::UnclosedElement, innermost.position,
                 "element <" + innermost.node->tag_name + "> is never closed",
                 innermost.node->tag_name);
        } else if (!root_) {
            fail(core::ErrorKind::NoRootElement, end_position_,
                 "document has no root element");
        }
    }

    open_elements_.clear();
    if (error_) {
        result.error = std::move(error_);
        error_.reset();
        root_.reset();
        return result;
    }
    result.root = std::move(root_);
    return result;
}

ParseResult parse(std::string_view xml) {
    Tokenizer tokenizer(xml);
    TreeBuilder builder;
    while (true) {
        Token token = tokenizer.next_token();
        const bool eof = token.type == Token::EndOfFile;
        if (!builder.process_token(std::move(token)) || eof) break;
    }
    return builder.finish();
}

} // namespace svgrsx::xml
