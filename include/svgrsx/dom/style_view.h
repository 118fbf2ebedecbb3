#pragma once
#include <svgrsx/dom/node.h>
#include <optional>
#include <string_view>

namespace svgrsx::dom {

// Read-only projections of an element's attributes onto well-known SVG
// fields. Every field views storage owned by the element, so a view must
// not outlive the node it was built from. Values are passed through
// unvalidated.

using AttributeView = std::optional<std::string_view>;

// Looks up a single attribute without copying its value.
AttributeView view_attribute(const Node& element, std::string_view name);

struct PathStyle {
    AttributeView d;
    AttributeView class_name;
    AttributeView fill;
    AttributeView stroke;
    AttributeView fill_rule;
    AttributeView stroke_width;
    AttributeView stroke_linecap;
    AttributeView stroke_linejoin;
    AttributeView stroke_miterlimit;

    static PathStyle from_element(const Node& element);

    bool has_stroke() const;
};

struct GroupStyle {
    AttributeView class_name;
    AttributeView transform;

    static GroupStyle from_element(const Node& element);
};

struct UseRef {
    // "href", falling back to the SVG 1.1 "xlink:href" spelling
    AttributeView href;
    AttributeView x;
    AttributeView y;
    AttributeView fill;
    AttributeView fill_rule;
    AttributeView transform;

    static UseRef from_element(const Node& element);

    // Fragment identifier without the leading '#', if href is local.
    std::optional<std::string_view> target_id() const;
};

} // namespace svgrsx::dom
