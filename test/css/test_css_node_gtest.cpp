#include <gtest/gtest.h>
#include "csspos/css/css_node.hpp"
#include <vector>

using namespace csspos;

class CssNodeTest : public ::testing::Test {
protected:
    std::vector<const CssNode*> children(const CssNode* node) {
        std::vector<const CssNode*> out;
        css_node_for_each_child(node, [&out](const CssNode* child) {
            out.push_back(child);
        });
        return out;
    }
};

TEST_F(CssNodeTest, TypeNames) {
    EXPECT_STREQ(css_node_type_name(CssNodeType::ROOT), "css-root");
    EXPECT_STREQ(css_node_type_name(CssNodeType::DECLARATION), "css-decl");
    EXPECT_STREQ(css_node_type_name(CssNodeType::COMMENT), "css-comment");
    EXPECT_STREQ(css_node_type_name(CssNodeType::SELECTOR_ROOT), "selector-root");
    EXPECT_STREQ(css_node_type_name(CssNodeType::VALUE_ROOT), "value-root");
    EXPECT_STREQ(css_node_type_name(CssNodeType::VALUE_UNKNOWN), "value-unknown");
    EXPECT_STREQ(css_node_type_name(CssNodeType::VALUE_COMMA_GROUP), "value-comma_group");
}

TEST_F(CssNodeTest, Factories) {
    CssNodePtr decl = css_decl_create("color", ": ", "red");
    EXPECT_EQ(decl->type, CssNodeType::DECLARATION);
    EXPECT_EQ(decl->prop, "color");
    EXPECT_EQ(decl->value, "red");
    EXPECT_TRUE(decl->raws.has_between);
    EXPECT_EQ(decl->raws.between, ": ");
    EXPECT_FALSE(decl->has_source);

    CssNodePtr media = css_atrule_create("media", " ", "screen");
    EXPECT_EQ(media->name, "media");
    EXPECT_EQ(media->value, "screen");
    EXPECT_TRUE(media->raws.has_after_name);
    EXPECT_FALSE(media->raws.has_between);

    CssNodePtr comment = css_comment_create(" note", true);
    EXPECT_TRUE(css_node_is_inline_comment(comment.get()));
    CssNodePtr block = css_comment_create(" note ", false);
    EXPECT_FALSE(css_node_is_inline_comment(block.get()));

    CssNodePtr word = css_value_leaf_create(CssNodeType::VALUE_WORD, "auto", 4);
    EXPECT_TRUE(word->has_source);
    EXPECT_TRUE(word->source.has_index);
    EXPECT_EQ(word->source.index, 4u);
    EXPECT_FALSE(word->source.has_start);
}

TEST_F(CssNodeTest, SourcePositions) {
    CssNodePtr rule = css_node_create(CssNodeType::RULE);
    css_node_set_start(rule.get(), 3, 1);
    EXPECT_TRUE(rule->has_source);
    EXPECT_TRUE(rule->source.has_start);
    EXPECT_FALSE(rule->source.has_end);
    EXPECT_EQ(rule->source.start.line, 3u);

    css_node_set_end(rule.get(), 5, 2);
    EXPECT_TRUE(rule->source.has_end);
    EXPECT_EQ(rule->source.end.column, 2u);
}

TEST_F(CssNodeTest, ValueRoots) {
    CssNodePtr root = css_value_root_create("10px auto");
    CssNodePtr unknown = css_value_unknown_create("$var !default");
    CssNodePtr word = css_value_leaf_create(CssNodeType::VALUE_WORD, "auto", 5);

    EXPECT_TRUE(css_node_is_value_root(root.get()));
    EXPECT_TRUE(css_node_is_value_root(unknown.get()));
    EXPECT_FALSE(css_node_is_value_root(word.get()));
    EXPECT_FALSE(css_node_is_value_root(nullptr));

    EXPECT_EQ(css_value_text(root.get()), "10px auto");
    EXPECT_EQ(css_value_text(unknown.get()), "$var !default");
    EXPECT_EQ(css_value_text(nullptr), "");

    // value-root without text falls back to its raw value
    CssNodePtr bare = css_value_root_create("");
    bare->value = "1px solid";
    EXPECT_EQ(css_value_text(bare.get()), "1px solid");
    root->value = "ignored";
    EXPECT_EQ(css_value_text(root.get()), "10px auto");
}

TEST_F(CssNodeTest, RuleSlotsInOrder) {
    CssNodePtr rule = css_node_create(CssNodeType::RULE);
    rule->selector = css_node_create(CssNodeType::SELECTOR_ROOT);
    CssNode* first = css_node_append(rule.get(), css_decl_create("top", ":", "0"));
    CssNode* second = css_node_append(rule.get(), css_comment_create("x", false));

    std::vector<const CssNode*> kids = children(rule.get());
    ASSERT_EQ(kids.size(), 3u);
    EXPECT_EQ(kids[0], rule->selector.get());
    EXPECT_EQ(kids[1], first);
    EXPECT_EQ(kids[2], second);
    EXPECT_EQ(css_node_last_child(rule.get()), second);
}

TEST_F(CssNodeTest, AtRuleSlots) {
    CssNodePtr media = css_atrule_create("media", " ", "screen");
    media->params = css_value_root_create("screen");
    css_node_append(media.get(), css_node_create(CssNodeType::RULE));

    std::vector<const CssNode*> kids = children(media.get());
    ASSERT_EQ(kids.size(), 2u);
    EXPECT_EQ(kids[0], media->params.get());
    EXPECT_EQ(kids[1]->type, CssNodeType::RULE);
}

TEST_F(CssNodeTest, SlotsOutsideTheKindAreNotVisited) {
    CssNodePtr decl = css_decl_create("color", ":", "red");
    decl->parsed_value = css_value_root_create("red");
    // payload left in a slot a declaration does not have
    css_node_append(decl.get(), css_node_create(CssNodeType::COMMENT));
    decl->group = css_node_create(CssNodeType::VALUE_WORD);

    std::vector<const CssNode*> kids = children(decl.get());
    ASSERT_EQ(kids.size(), 1u);
    EXPECT_EQ(kids[0], decl->parsed_value.get());

    CssNodePtr word = css_node_create(CssNodeType::VALUE_WORD);
    css_node_append(word.get(), css_node_create(CssNodeType::VALUE_WORD));
    EXPECT_TRUE(children(word.get()).empty());
}

TEST_F(CssNodeTest, ValueGroups) {
    CssNodePtr func = css_value_leaf_create(CssNodeType::VALUE_FUNC, "calc", 0);
    func->group = css_node_create(CssNodeType::VALUE_PAREN_GROUP);
    css_node_append_group(func.get(), css_value_leaf_create(CssNodeType::VALUE_NUMBER, "1", 5));
    css_node_append_group(func.get(), css_value_leaf_create(CssNodeType::VALUE_OPERATOR, "+", 7));

    std::vector<const CssNode*> kids = children(func.get());
    ASSERT_EQ(kids.size(), 3u);
    EXPECT_EQ(kids[0], func->group.get());
    EXPECT_EQ(kids[2]->value, "+");
    // groups are not the nodes slot
    EXPECT_EQ(css_node_last_child(func.get()), nullptr);
}

TEST_F(CssNodeTest, Count) {
    CssNodePtr root = css_node_create(CssNodeType::ROOT);
    CssNode* rule = css_node_append(root.get(), css_node_create(CssNodeType::RULE));
    rule->selector = css_node_create(CssNodeType::SELECTOR_ROOT);
    CssNode* decl = css_node_append(rule, css_decl_create("top", ":", "0"));
    decl->parsed_value = css_value_root_create("0");
    decl->parsed_value->group = css_value_leaf_create(CssNodeType::VALUE_NUMBER, "0", 0);

    EXPECT_EQ(css_node_count(root.get()), 6u);
    EXPECT_EQ(css_node_count(nullptr), 0u);
    EXPECT_EQ(css_node_append(nullptr, css_node_create(CssNodeType::RULE)), nullptr);
}
