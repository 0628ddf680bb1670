#include "css_node.hpp"

namespace csspos {

const char* css_node_type_name(CssNodeType type) {
    switch (type) {
        case CssNodeType::ROOT:                 return "css-root";
        case CssNodeType::RULE:                 return "css-rule";
        case CssNodeType::ATRULE:               return "css-atrule";
        case CssNodeType::DECLARATION:          return "css-decl";
        case CssNodeType::COMMENT:              return "css-comment";
        case CssNodeType::SELECTOR_ROOT:        return "selector-root";
        case CssNodeType::SELECTOR:             return "selector-selector";
        case CssNodeType::SELECTOR_COMMENT:     return "selector-comment";
        case CssNodeType::SELECTOR_TAG:         return "selector-tag";
        case CssNodeType::SELECTOR_CLASS:       return "selector-class";
        case CssNodeType::SELECTOR_ID:          return "selector-id";
        case CssNodeType::SELECTOR_ATTRIBUTE:   return "selector-attribute";
        case CssNodeType::SELECTOR_PSEUDO:      return "selector-pseudo";
        case CssNodeType::SELECTOR_COMBINATOR:  return "selector-combinator";
        case CssNodeType::SELECTOR_NESTING:     return "selector-nesting";
        case CssNodeType::SELECTOR_UNIVERSAL:   return "selector-universal";
        case CssNodeType::SELECTOR_UNKNOWN:     return "selector-unknown";
        case CssNodeType::VALUE_ROOT:           return "value-root";
        case CssNodeType::VALUE_UNKNOWN:        return "value-unknown";
        case CssNodeType::VALUE_COMMA_GROUP:    return "value-comma_group";
        case CssNodeType::VALUE_PAREN_GROUP:    return "value-paren_group";
        case CssNodeType::VALUE_FUNC:           return "value-func";
        case CssNodeType::VALUE_PAREN:          return "value-paren";
        case CssNodeType::VALUE_NUMBER:         return "value-number";
        case CssNodeType::VALUE_OPERATOR:       return "value-operator";
        case CssNodeType::VALUE_WORD:           return "value-word";
        case CssNodeType::VALUE_COLON:          return "value-colon";
        case CssNodeType::VALUE_COMMA:          return "value-comma";
        case CssNodeType::VALUE_STRING:         return "value-string";
        case CssNodeType::VALUE_ATWORD:         return "value-atword";
        case CssNodeType::VALUE_UNICODE_RANGE:  return "value-unicode-range";
        case CssNodeType::VALUE_COMMENT:        return "value-comment";
    }
    return "unknown";
}

const std::string& css_value_text(const CssNode* value_root) {
    static const std::string empty;
    if (!value_root) return empty;
    // a value-root without its text falls back to the raw value
    if (value_root->type == CssNodeType::VALUE_ROOT && !value_root->text.empty()) {
        return value_root->text;
    }
    return value_root->value;
}

const CssNode* css_node_last_child(const CssNode* node) {
    if (!node || node->nodes.empty()) return nullptr;
    return node->nodes.back().get();
}

size_t css_node_count(const CssNode* node) {
    if (!node) return 0;
    size_t count = 1;
    css_node_for_each_child(node, [&count](const CssNode* child) {
        count += css_node_count(child);
    });
    return count;
}

CssNodePtr css_node_create(CssNodeType type) {
    return CssNodePtr(new CssNode(type));
}

CssNode* css_node_append(CssNode* parent, CssNodePtr child) {
    if (!parent || !child) return nullptr;
    parent->nodes.push_back(std::move(child));
    return parent->nodes.back().get();
}

CssNode* css_node_append_group(CssNode* parent, CssNodePtr child) {
    if (!parent || !child) return nullptr;
    parent->groups.push_back(std::move(child));
    return parent->groups.back().get();
}

void css_node_set_start(CssNode* node, size_t line, size_t column) {
    node->has_source = true;
    node->source.has_start = true;
    node->source.start = CssPosition(line, column);
}

void css_node_set_end(CssNode* node, size_t line, size_t column) {
    node->has_source = true;
    node->source.has_end = true;
    node->source.end = CssPosition(line, column);
}

void css_node_set_index(CssNode* node, size_t index) {
    node->has_source = true;
    node->source.has_index = true;
    node->source.index = index;
}

void css_node_set_between(CssNode* node, const std::string& between) {
    node->raws.has_between = true;
    node->raws.between = between;
}

void css_node_set_after_name(CssNode* node, const std::string& after_name) {
    node->raws.has_after_name = true;
    node->raws.after_name = after_name;
}

CssNodePtr css_decl_create(const std::string& prop, const std::string& between,
                           const std::string& value) {
    CssNodePtr decl = css_node_create(CssNodeType::DECLARATION);
    decl->prop = prop;
    decl->value = value;
    css_node_set_between(decl.get(), between);
    return decl;
}

CssNodePtr css_atrule_create(const std::string& name, const std::string& after_name,
                             const std::string& params) {
    CssNodePtr rule = css_node_create(CssNodeType::ATRULE);
    rule->name = name;
    rule->value = params;
    css_node_set_after_name(rule.get(), after_name);
    return rule;
}

CssNodePtr css_comment_create(const std::string& text, bool is_inline) {
    CssNodePtr comment = css_node_create(CssNodeType::COMMENT);
    comment->text = text;
    comment->is_inline = is_inline;
    return comment;
}

CssNodePtr css_value_root_create(const std::string& text) {
    CssNodePtr root = css_node_create(CssNodeType::VALUE_ROOT);
    root->text = text;
    return root;
}

CssNodePtr css_value_unknown_create(const std::string& value) {
    CssNodePtr unknown = css_node_create(CssNodeType::VALUE_UNKNOWN);
    unknown->value = value;
    return unknown;
}

CssNodePtr css_value_leaf_create(CssNodeType type, const std::string& value, size_t index) {
    CssNodePtr leaf = css_node_create(type);
    leaf->value = value;
    css_node_set_index(leaf.get(), index);
    return leaf;
}

} // namespace csspos
