#pragma once
#ifndef CSSPOS_CSS_NODE_HPP
#define CSSPOS_CSS_NODE_HPP

#include <memory>
#include <string>
#include <vector>
#include <cstddef>

namespace csspos {

/**
 * CSS Syntax Tree
 *
 * The tree an external stylesheet parser hands to the offset annotator.
 * Stylesheet nodes carry line/column positions in the outer document;
 * selector and value sub-trees are parsed from substrings and carry
 * positions local to the substring they came from.
 *
 * Every kind has a fixed set of child slots (see css_node_for_each_child),
 * so walking the tree never wanders into payload fields.
 */

// ============================================================================
// Node Types
// ============================================================================

enum class CssNodeType {
    // Stylesheet
    ROOT,                   // css-root
    RULE,                   // css-rule: selector { ... }
    ATRULE,                 // css-atrule: @name params { ... }
    DECLARATION,            // css-decl: prop: value
    COMMENT,                // css-comment: /* */ or // (inline)

    // Selector sub-tree
    SELECTOR_ROOT,
    SELECTOR,
    SELECTOR_COMMENT,
    SELECTOR_TAG,
    SELECTOR_CLASS,
    SELECTOR_ID,
    SELECTOR_ATTRIBUTE,
    SELECTOR_PSEUDO,
    SELECTOR_COMBINATOR,
    SELECTOR_NESTING,
    SELECTOR_UNIVERSAL,
    SELECTOR_UNKNOWN,

    // Value sub-tree
    VALUE_ROOT,             // parsed value, carries the text it was parsed from
    VALUE_UNKNOWN,          // unparsed value kept verbatim
    VALUE_COMMA_GROUP,
    VALUE_PAREN_GROUP,
    VALUE_FUNC,
    VALUE_PAREN,
    VALUE_NUMBER,
    VALUE_OPERATOR,
    VALUE_WORD,
    VALUE_COLON,
    VALUE_COMMA,
    VALUE_STRING,
    VALUE_ATWORD,
    VALUE_UNICODE_RANGE,
    VALUE_COMMENT
};

// ============================================================================
// Source Positions
// ============================================================================

// Tokenizer position: 1-based line, 1-based column
struct CssPosition {
    size_t line;
    size_t column;

    CssPosition() : line(0), column(0) {}
    CssPosition(size_t ln, size_t col) : line(ln), column(col) {}
};

struct CssSource {
    bool has_start;
    CssPosition start;
    bool has_end;
    CssPosition end;            // last character, inclusive
    bool has_index;
    size_t index;               // relative start assigned by a value parser

    CssSource() : has_start(false), has_end(false), has_index(false), index(0) {}
};

// Raw formatting fragments captured by the parser
struct CssRaws {
    bool has_between;
    std::string between;        // between prop/selector and value/body
    bool has_after_name;
    std::string after_name;     // after an at-rule name

    CssRaws() : has_between(false), has_after_name(false) {}
};

// ============================================================================
// Node
// ============================================================================

struct CssNode;
typedef std::unique_ptr<CssNode> CssNodePtr;

struct CssNode {
    CssNodeType type;
    bool has_source;
    CssSource source;
    CssRaws raws;

    // payload
    std::string prop;           // declaration property
    std::string name;           // at-rule name, without '@'
    std::string text;           // comment text, value-root source text
    std::string value;          // raw value / unknown text / leaf value
    bool is_inline;             // '//' comment

    // child slots
    CssNodePtr selector;        // rule, at-rule
    CssNodePtr params;          // at-rule
    CssNodePtr parsed_value;    // declaration
    CssNodePtr group;           // value-root, func, paren-group
    std::vector<CssNodePtr> groups;   // comma-group, paren-group, func
    std::vector<CssNodePtr> nodes;    // root, rule, at-rule, selector containers

    explicit CssNode(CssNodeType t) : type(t), has_source(false), is_inline(false) {}

    CssNode(const CssNode&) = delete;
    CssNode& operator=(const CssNode&) = delete;
};

// ============================================================================
// Type Queries
// ============================================================================

const char* css_node_type_name(CssNodeType type);

inline bool css_node_is_value_root(const CssNode* node) {
    return node && (node->type == CssNodeType::VALUE_ROOT ||
                    node->type == CssNodeType::VALUE_UNKNOWN);
}

inline bool css_node_is_inline_comment(const CssNode* node) {
    return node && node->type == CssNodeType::COMMENT && node->is_inline;
}

// Text a value root was parsed from: value-root keeps it in text (value
// when text is empty), value-unknown in value
const std::string& css_value_text(const CssNode* value_root);

// Last entry of the nodes slot, or nullptr
const CssNode* css_node_last_child(const CssNode* node);

size_t css_node_count(const CssNode* node);

// ============================================================================
// Child Slots
// ============================================================================

template <typename Fn>
void css_node_for_each_slot(const std::vector<CssNodePtr>& slot, Fn& fn) {
    for (size_t i = 0; i < slot.size(); i++) {
        if (slot[i]) fn(slot[i].get());
    }
}

/**
 * Visit the children of a node in source order, slot by slot.
 * Only the slots that belong to the node's kind are visited.
 */
template <typename Fn>
void css_node_for_each_child(const CssNode* node, Fn fn) {
    if (!node) return;
    switch (node->type) {
        case CssNodeType::ROOT:
            css_node_for_each_slot(node->nodes, fn);
            break;
        case CssNodeType::RULE:
            if (node->selector) fn(node->selector.get());
            css_node_for_each_slot(node->nodes, fn);
            break;
        case CssNodeType::ATRULE:
            if (node->selector) fn(node->selector.get());
            if (node->params) fn(node->params.get());
            css_node_for_each_slot(node->nodes, fn);
            break;
        case CssNodeType::DECLARATION:
            if (node->parsed_value) fn(node->parsed_value.get());
            break;
        case CssNodeType::SELECTOR_ROOT:
        case CssNodeType::SELECTOR:
        case CssNodeType::SELECTOR_PSEUDO:
            css_node_for_each_slot(node->nodes, fn);
            break;
        case CssNodeType::VALUE_ROOT:
            if (node->group) fn(node->group.get());
            break;
        case CssNodeType::VALUE_FUNC:
        case CssNodeType::VALUE_PAREN_GROUP:
            if (node->group) fn(node->group.get());
            css_node_for_each_slot(node->groups, fn);
            break;
        case CssNodeType::VALUE_COMMA_GROUP:
            css_node_for_each_slot(node->groups, fn);
            break;
        case CssNodeType::COMMENT:
        case CssNodeType::SELECTOR_COMMENT:
        case CssNodeType::SELECTOR_TAG:
        case CssNodeType::SELECTOR_CLASS:
        case CssNodeType::SELECTOR_ID:
        case CssNodeType::SELECTOR_ATTRIBUTE:
        case CssNodeType::SELECTOR_COMBINATOR:
        case CssNodeType::SELECTOR_NESTING:
        case CssNodeType::SELECTOR_UNIVERSAL:
        case CssNodeType::SELECTOR_UNKNOWN:
        case CssNodeType::VALUE_UNKNOWN:
        case CssNodeType::VALUE_PAREN:
        case CssNodeType::VALUE_NUMBER:
        case CssNodeType::VALUE_OPERATOR:
        case CssNodeType::VALUE_WORD:
        case CssNodeType::VALUE_COLON:
        case CssNodeType::VALUE_COMMA:
        case CssNodeType::VALUE_STRING:
        case CssNodeType::VALUE_ATWORD:
        case CssNodeType::VALUE_UNICODE_RANGE:
        case CssNodeType::VALUE_COMMENT:
            break;
    }
}

// ============================================================================
// Construction (parser adapters)
// ============================================================================

CssNodePtr css_node_create(CssNodeType type);

// Append to the nodes slot, returns the appended node
CssNode* css_node_append(CssNode* parent, CssNodePtr child);
// Append to the groups slot, returns the appended node
CssNode* css_node_append_group(CssNode* parent, CssNodePtr child);

void css_node_set_start(CssNode* node, size_t line, size_t column);
void css_node_set_end(CssNode* node, size_t line, size_t column);
void css_node_set_index(CssNode* node, size_t index);
void css_node_set_between(CssNode* node, const std::string& between);
void css_node_set_after_name(CssNode* node, const std::string& after_name);

CssNodePtr css_decl_create(const std::string& prop, const std::string& between,
                           const std::string& value);
CssNodePtr css_atrule_create(const std::string& name, const std::string& after_name,
                             const std::string& params);
CssNodePtr css_comment_create(const std::string& text, bool is_inline);
CssNodePtr css_value_root_create(const std::string& text);
CssNodePtr css_value_unknown_create(const std::string& value);
// Leaf value node (word, number, string, ...) at a relative index
CssNodePtr css_value_leaf_create(CssNodeType type, const std::string& value, size_t index);

} // namespace csspos

#endif // CSSPOS_CSS_NODE_HPP
