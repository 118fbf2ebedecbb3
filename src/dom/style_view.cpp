#include <svgrsx/dom/style_view.h>

namespace svgrsx::dom {

AttributeView view_attribute(const Node& element, std::string_view name) {
    for (const auto& attr : element.attributes) {
        if (attr.name == name) {
            return std::string_view(attr.value);
        }
    }
    return std::nullopt;
}

PathStyle PathStyle::from_element(const Node& element) {
    PathStyle style;
    style.d = view_attribute(element, "d");
    style.class_name = view_attribute(element, "class");
    style.fill = view_attribute(element, "fill");
    style.stroke = view_attribute(element, "stroke");
    style.fill_rule = view_attribute(element, "fill-rule");
    style.stroke_width = view_attribute(element, "stroke-width");
    style.stroke_linecap = view_attribute(element, "stroke-linecap");
    style.stroke_linejoin = view_attribute(element, "stroke-linejoin");
    style.stroke_miterlimit = view_attribute(element, "stroke-miterlimit");
    return style;
}

bool PathStyle::has_stroke() const {
    return stroke || stroke_width || stroke_linecap || stroke_linejoin || stroke_miterlimit;
}

GroupStyle GroupStyle::from_element(const Node& element) {
    GroupStyle style;
    style.class_name = view_attribute(element, "class");
    style.transform = view_attribute(element, "transform");
    return style;
}

UseRef UseRef::from_element(const Node& element) {
    UseRef ref;
    ref.href = view_attribute(element, "href");
    if (!ref.href) {
        ref.href = view_attribute(element, "xlink:href");
    }
    ref.x = view_attribute(element, "x");
    ref.y = view_attribute(element, "y");
    ref.fill = view_attribute(element, "fill");
    ref.fill_rule = view_attribute(element, "fill-rule");
    ref.transform = view_attribute(element, "transform");
    return ref;
}

std::optional<std::string_view> UseRef::target_id() const {
    if (!href || href->size() < 2 || href->front() != '#') {
        return std::nullopt;
    }
    return href->substr(1);
}

} // namespace svgrsx::dom
