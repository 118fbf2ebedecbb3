#include <svgrsx/dom/node.h>
#include <svgrsx/dom/style_view.h>
#include <svgrsx/xml/tree_builder.h>

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace svgrsx::dom;

// ---------------------------------------------------------------------------
// 1. Node construction
// ---------------------------------------------------------------------------
TEST(DomNode, MakeElement) {
    auto node = Node::make_element("linearGradient");
    EXPECT_TRUE(node->is_element());
    EXPECT_FALSE(node->is_text());
    EXPECT_EQ(node->tag_name, "linearGradient");
    EXPECT_TRUE(node->attributes.empty());
    EXPECT_TRUE(node->children.empty());
}

TEST(DomNode, MakeText) {
    auto node = Node::make_text("Hello");
    EXPECT_TRUE(node->is_text());
    EXPECT_EQ(node->data, "Hello");
    EXPECT_EQ(node->element_count(), 0u);
}

// ---------------------------------------------------------------------------
// 2. Attributes
// ---------------------------------------------------------------------------
TEST(DomNode, AttributesKeepInsertionOrder) {
    auto node = Node::make_element("path");
    EXPECT_TRUE(node->set_attribute("stroke", "black"));
    EXPECT_TRUE(node->set_attribute("d", "M0 0"));
    EXPECT_TRUE(node->set_attribute("fill", "none"));
    ASSERT_EQ(node->attributes.size(), 3u);
    EXPECT_EQ(node->attributes[0].name, "stroke");
    EXPECT_EQ(node->attributes[1].name, "d");
    EXPECT_EQ(node->attributes[2].name, "fill");
}

TEST(DomNode, SetAttributeRefusesDuplicate) {
    auto node = Node::make_element("path");
    EXPECT_TRUE(node->set_attribute("fill", "red"));
    EXPECT_FALSE(node->set_attribute("fill", "blue"));
    ASSERT_EQ(node->attributes.size(), 1u);
    EXPECT_EQ(node->attribute("fill"), "red");
}

TEST(DomNode, AttributeLookup) {
    auto node = Node::make_element("use");
    node->set_attribute("xlink:href", "#g1");
    EXPECT_TRUE(node->has_attribute("xlink:href"));
    EXPECT_FALSE(node->has_attribute("href"));
    EXPECT_EQ(node->attribute("xlink:href"), "#g1");
    EXPECT_FALSE(node->attribute("href").has_value());
}

// ---------------------------------------------------------------------------
// 3. Children and queries
// ---------------------------------------------------------------------------
TEST(DomNode, AppendChildReturnsObserver) {
    auto svg = Node::make_element("svg");
    Node* g = svg->append_child(Node::make_element("g"));
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(g, svg->children[0].get());
    g->append_child(Node::make_text("x"));
    EXPECT_EQ(svg->children[0]->children.size(), 1u);
}

TEST(DomNode, TextContentIsRecursive) {
    auto result = svgrsx::xml::parse("<text>Hello, <tspan>Typst</tspan>!</text>");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.root->text_content(), "Hello, Typst!");
}

TEST(DomNode, FindElementDepthFirst) {
    auto result = svgrsx::xml::parse(
        "<svg><g id=\"outer\"><path id=\"p1\"/></g><path id=\"p2\"/></svg>");
    ASSERT_TRUE(result.ok());
    Node* first = result.root->find_element("path");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->attribute("id"), "p1");
    EXPECT_EQ(result.root->find_element("circle"), nullptr);

    auto all = result.root->find_all_elements("path");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0]->attribute("id"), "p1");
    EXPECT_EQ(all[1]->attribute("id"), "p2");
}

TEST(DomNode, ElementCountIgnoresText) {
    auto result = svgrsx::xml::parse("<svg>a<g>b<path/></g>c<rect/></svg>");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.root->element_count(), 4u);
}

// ---------------------------------------------------------------------------
// 4. Styling views
// ---------------------------------------------------------------------------
TEST(DomStyleView, PathStyleProjectsKnownFields) {
    auto result = svgrsx::xml::parse(
        R"(<path class="typst-shape" fill="#000" fill-rule="nonzero" )"
        R"(stroke="#ff0000" stroke-width="1.5" stroke-linecap="round" )"
        R"(stroke-linejoin="miter" stroke-miterlimit="4" d="M 0 0 L 10 0" data-x="1"/>)");
    ASSERT_TRUE(result.ok());
    auto style = PathStyle::from_element(*result.root);
    EXPECT_EQ(style.d, "M 0 0 L 10 0");
    EXPECT_EQ(style.class_name, "typst-shape");
    EXPECT_EQ(style.fill, "#000");
    EXPECT_EQ(style.fill_rule, "nonzero");
    EXPECT_EQ(style.stroke, "#ff0000");
    EXPECT_EQ(style.stroke_width, "1.5");
    EXPECT_EQ(style.stroke_linecap, "round");
    EXPECT_EQ(style.stroke_linejoin, "miter");
    EXPECT_EQ(style.stroke_miterlimit, "4");
    EXPECT_TRUE(style.has_stroke());
}

TEST(DomStyleView, PathStyleMissingFieldsAreEmpty) {
    auto node = Node::make_element("path");
    node->set_attribute("d", "M0 0");
    auto style = PathStyle::from_element(*node);
    EXPECT_EQ(style.d, "M0 0");
    EXPECT_FALSE(style.fill.has_value());
    EXPECT_FALSE(style.stroke.has_value());
    EXPECT_FALSE(style.has_stroke());
}

TEST(DomStyleView, ValuesPassThroughUnvalidated) {
    auto node = Node::make_element("path");
    node->set_attribute("fill", "not-a-color");
    node->set_attribute("stroke-width", "-3banana");
    auto style = PathStyle::from_element(*node);
    EXPECT_EQ(style.fill, "not-a-color");
    EXPECT_EQ(style.stroke_width, "-3banana");
}

TEST(DomStyleView, ViewsPointIntoElementStorage) {
    auto node = Node::make_element("path");
    node->set_attribute("fill", "red");
    auto style = PathStyle::from_element(*node);
    ASSERT_TRUE(style.fill.has_value());
    EXPECT_EQ(style.fill->data(), node->attributes[0].value.data());
}

TEST(DomStyleView, GroupStyle) {
    auto node = Node::make_element("g");
    node->set_attribute("class", "typst-group");
    node->set_attribute("transform", "matrix(1 0 0 1 10 20)");
    auto style = GroupStyle::from_element(*node);
    EXPECT_EQ(style.class_name, "typst-group");
    EXPECT_EQ(style.transform, "matrix(1 0 0 1 10 20)");
}

TEST(DomStyleView, UseRefFallsBackToXlinkHref) {
    auto node = Node::make_element("use");
    node->set_attribute("xlink:href", "#gA1B2");
    node->set_attribute("x", "0");
    node->set_attribute("fill", "#000000");
    node->set_attribute("fill-rule", "nonzero");
    auto ref = UseRef::from_element(*node);
    EXPECT_EQ(ref.href, "#gA1B2");
    EXPECT_EQ(ref.x, "0");
    EXPECT_FALSE(ref.y.has_value());
    EXPECT_EQ(ref.fill_rule, "nonzero");
    EXPECT_EQ(ref.target_id(), "gA1B2");
}

TEST(DomStyleView, UseRefPrefersPlainHref) {
    auto node = Node::make_element("use");
    node->set_attribute("xlink:href", "#old");
    node->set_attribute("href", "#new");
    EXPECT_EQ(UseRef::from_element(*node).target_id(), "new");
}

TEST(DomStyleView, ExternalHrefHasNoTargetId) {
    auto node = Node::make_element("use");
    node->set_attribute("href", "sprites.svg#icon");
    EXPECT_FALSE(UseRef::from_element(*node).target_id().has_value());
}
