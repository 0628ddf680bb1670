#include "css_loc.hpp"
#include "../../lib/log.h"

#include <re2/re2.h>
#include <sstream>

namespace csspos {

// ============================================================================
// Location Table
// ============================================================================

const CssOffsetRange* CssLocationTable::find(const CssNode* node) const {
    std::unordered_map<const CssNode*, CssOffsetRange>::const_iterator it = ranges_.find(node);
    return it == ranges_.end() ? nullptr : &it->second;
}

size_t CssLocationTable::resolvedCount() const {
    size_t count = 0;
    for (std::unordered_map<const CssNode*, CssOffsetRange>::const_iterator it = ranges_.begin();
         it != ranges_.end(); ++it) {
        if (it->second.resolved()) count++;
    }
    return count;
}

// ============================================================================
// Position Rules
// ============================================================================

bool css_loc_start(const CssNode* node, const SourceTracker& text, size_t* start) {
    if (!node || !node->has_source) return false;

    // value nodes come with a start relative to their own text
    if (node->source.has_index) {
        *start = node->source.index;
        return true;
    }
    if (!node->source.has_start) return false;

    size_t index = text.lineColumnToIndex(node->source.start.line, node->source.start.column);
    if (index == SourceTracker::npos || index == 0) return false;
    *start = index - 1;
    return true;
}

bool css_loc_end(const CssNode* node, const SourceTracker& text, size_t* end) {
    if (!node || !node->has_source) return false;

    // '//' comments get no end from the tokenizer, they run to the line break
    if (css_node_is_inline_comment(node)) {
        size_t start;
        if (!css_loc_start(node, text, &start)) return false;
        *end = text.lineEndFrom(start);
        return true;
    }

    // a block without its own end closes with its last child
    const CssNode* last = css_node_last_child(node);
    if (last && !node->source.has_end) {
        return css_loc_end(last, text, end);
    }

    if (node->source.has_end) {
        size_t index = text.lineColumnToIndex(node->source.end.line, node->source.end.column);
        if (index == SourceTracker::npos) return false;
        *end = index;
        return true;
    }
    return false;
}

namespace {

RE2::Options latin1_options() {
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingLatin1);
    options.set_log_errors(false);
    return options;
}

} // namespace

size_t css_leading_whitespace_length(const std::string& str) {
    static const RE2 leading_ws("^(\\s*)", latin1_options());
    std::string ws;
    if (!RE2::PartialMatch(str, leading_ws, &ws)) return 0;
    return ws.length();
}

size_t css_value_root_offset(const CssNode* owner, size_t owner_start) {
    size_t offset = owner_start;

    // the property name precedes the value
    if (owner->type == CssNodeType::DECLARATION) {
        offset += owner->prop.length();
    }

    if (owner->type == CssNodeType::ATRULE) {
        // '@' + name + whitespace before the params
        offset += 1 + owner->name.length();
        if (owner->raws.has_after_name) {
            offset += css_leading_whitespace_length(owner->raws.after_name);
        }
    } else if (owner->raws.has_between) {
        offset += owner->raws.between.length();
    }

    return offset;
}

// ============================================================================
// Annotator
// ============================================================================

CssLocAnnotator::CssLocAnnotator(const char* text, size_t len, const CssLocOptions& options)
    : document_(text, len)
    , options_(options)
    , diagnostics_(options.max_diagnostics)
    , table_(nullptr)
    , depth_cuts_(0)
{
}

CssLocAnnotator::CssLocAnnotator(const std::string& text, const CssLocOptions& options)
    : CssLocAnnotator(text.c_str(), text.length(), options)
{
}

SourceLocation CssLocAnnotator::locationOf(const CssNode* node) const {
    if (node->has_source && node->source.has_start) {
        size_t index = document_.lineColumnToIndex(node->source.start.line,
                                                   node->source.start.column);
        size_t offset = (index == SourceTracker::npos || index == 0) ? 0 : index - 1;
        return SourceLocation(offset, node->source.start.line, node->source.start.column);
    }
    return SourceLocation(0, 0, 0);
}

void CssLocAnnotator::noteUnresolved(const CssNode* node, const CssOffsetRange& range) {
    log_debug("[CSS Loc] %s: %s unknown", css_node_type_name(node->type),
              !range.has_start && !range.has_end ? "start and end" :
              !range.has_start ? "start" : "end");
    if (!options_.collect_diagnostics) return;

    std::string msg = std::string(css_node_type_name(node->type)) + ": ";
    if (!range.has_start && !range.has_end) msg += "start and end offsets unknown";
    else if (!range.has_start) msg += "start offset unknown";
    else msg += "end offset unknown";
    diagnostics_.addNote(locationOf(node), msg);
}

bool CssLocAnnotator::enter(const CssNode* node, size_t depth) {
    if (options_.max_depth == 0 || depth <= options_.max_depth) return true;

    if (depth_cuts_ == 0) {
        log_warn("[CSS Loc] nesting deeper than %zu, sub-trees left unannotated",
                 options_.max_depth);
    }
    depth_cuts_++;
    if (options_.collect_diagnostics) {
        diagnostics_.addWarning(locationOf(node),
            std::string(css_node_type_name(node->type)) + " exceeds maximum nesting depth, not annotated");
    }
    return false;
}

void CssLocAnnotator::annotateNode(const CssNode* node, size_t depth) {
    if (!enter(node, depth)) return;

    CssOffsetRange range;
    if (node->has_source) {
        range.has_start = css_loc_start(node, document_, &range.start);
        range.has_end = css_loc_end(node, document_, &range.end);
        table_->set(node, range);
        if (!range.resolved()) noteUnresolved(node, range);
    }

    css_node_for_each_child(node, [this, node, &range, depth](const CssNode* child) {
        if (css_node_is_value_root(child)) {
            annotateValueRoot(node, range, child, depth + 1);
        } else {
            annotateNode(child, depth + 1);
        }
    });
}

void CssLocAnnotator::annotateValueRoot(const CssNode* owner, const CssOffsetRange& owner_range,
                                        const CssNode* value_root, size_t depth) {
    // positions inside the value are relative to the value's own text
    SourceTracker value_text(css_value_text(value_root));

    if (!owner_range.has_start) {
        log_debug("[CSS Loc] %s: value offsets unknown, owner %s has no start",
                  css_node_type_name(value_root->type), css_node_type_name(owner->type));
        if (options_.collect_diagnostics) {
            diagnostics_.addNote(locationOf(owner),
                std::string(css_node_type_name(owner->type)) + ": start unknown, value offsets unknown");
        }
        annotateValueNode(value_root, false, 0, value_text, depth);
        return;
    }

    size_t root_offset = css_value_root_offset(owner, owner_range.start);
    log_debug("[CSS Loc] %s of %s starts at %zu", css_node_type_name(value_root->type),
              css_node_type_name(owner->type), root_offset);
    annotateValueNode(value_root, true, root_offset, value_text, depth);
}

void CssLocAnnotator::annotateValueNode(const CssNode* node, bool has_root_offset, size_t root_offset,
                                        const SourceTracker& value_text, size_t depth) {
    if (!enter(node, depth)) return;

    if (node->has_source) {
        CssOffsetRange range;
        size_t local;
        if (has_root_offset && css_loc_start(node, value_text, &local)) {
            range.has_start = true;
            range.start = local + root_offset;
        }
        if (has_root_offset && css_loc_end(node, value_text, &local)) {
            range.has_end = true;
            range.end = local + root_offset;
        }
        table_->set(node, range);
    }

    // same text scope and translation for the whole value sub-tree
    css_node_for_each_child(node, [this, has_root_offset, root_offset, &value_text, depth](const CssNode* child) {
        annotateValueNode(child, has_root_offset, root_offset, value_text, depth + 1);
    });
}

CssLocationTable CssLocAnnotator::annotate(const CssNode* root) {
    CssLocationTable table;
    diagnostics_.clear();
    depth_cuts_ = 0;
    if (!root) return table;

    table_ = &table;
    annotateNode(root, 0);
    table_ = nullptr;

    log_debug("[CSS Loc] %zu positioned nodes, %zu fully resolved",
              table.size(), table.resolvedCount());
    return table;
}

CssLocationTable css_calculate_loc(const CssNode* root, const char* text, size_t len) {
    CssLocAnnotator annotator(text, len);
    return annotator.annotate(root);
}

// ============================================================================
// Consumers
// ============================================================================

std::string css_loc_slice(const char* text, size_t len, const CssOffsetRange& range) {
    if (!text || !range.resolved()) return "";
    if (range.start > range.end || range.end > len) return "";
    return std::string(text + range.start, range.end - range.start);
}

std::string css_loc_slice(const std::string& text, const CssOffsetRange& range) {
    return css_loc_slice(text.data(), text.size(), range);
}

namespace {

void format_node(std::ostringstream& out, const CssNode* node, const CssLocationTable& table,
                 size_t indent) {
    out << std::string(indent * 2, ' ') << css_node_type_name(node->type);
    const CssOffsetRange* range = table.find(node);
    if (range) {
        out << " [";
        if (range->has_start) out << range->start; else out << '?';
        out << ", ";
        if (range->has_end) out << range->end; else out << '?';
        out << ")";
    }
    out << "\n";

    css_node_for_each_child(node, [&out, &table, indent](const CssNode* child) {
        format_node(out, child, table, indent + 1);
    });
}

} // namespace

std::string css_loc_format_tree(const CssNode* root, const CssLocationTable& table) {
    std::ostringstream out;
    if (root) format_node(out, root, table, 0);
    return out.str();
}

} // namespace csspos
