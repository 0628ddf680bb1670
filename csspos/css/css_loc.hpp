#pragma once
#ifndef CSSPOS_CSS_LOC_HPP
#define CSSPOS_CSS_LOC_HPP

#include "css_node.hpp"
#include "../input/diagnostic.hpp"
#include "../input/source_tracker.hpp"
#include <string>
#include <unordered_map>
#include <cstddef>

namespace csspos {

/**
 * CSS Offset Annotation
 *
 * Resolves the tokenizer's line/column positions to absolute character
 * offsets into the original document. Value sub-trees, which were parsed
 * from a substring and carry positions relative to it, are translated by
 * the offset at which that substring starts in the document.
 *
 * Offsets count the same units as the text buffer (bytes); the tokenizer's
 * columns are expected to count the same units.
 */

// ============================================================================
// Offset Ranges
// ============================================================================

// [start, end) in the original document, either bound may be unknown
struct CssOffsetRange {
    bool has_start;
    size_t start;
    bool has_end;
    size_t end;

    CssOffsetRange() : has_start(false), start(0), has_end(false), end(0) {}
    CssOffsetRange(size_t s, size_t e) : has_start(true), start(s), has_end(true), end(e) {}

    bool resolved() const { return has_start && has_end; }
};

// Offsets per node, keyed by node identity. Holds an entry for every node
// that has a source, whether or not its offsets could be resolved.
class CssLocationTable {
private:
    std::unordered_map<const CssNode*, CssOffsetRange> ranges_;

public:
    void set(const CssNode* node, const CssOffsetRange& range) { ranges_[node] = range; }

    // nullptr when the node had no source
    const CssOffsetRange* find(const CssNode* node) const;

    size_t size() const { return ranges_.size(); }
    size_t resolvedCount() const;
    void clear() { ranges_.clear(); }
};

// ============================================================================
// Position Rules
// ============================================================================

// Start of a node in the coordinates of text. A relative source index is
// the start as-is; a line/column start is resolved and moved back one.
bool css_loc_start(const CssNode* node, const SourceTracker& text, size_t* start);

// End of a node in the coordinates of text (exclusive):
//  1. inline comment: the next line break after its start, or end of text
//  2. no own end but nodes children: the end of the last child
//  3. own end position resolved as-is
bool css_loc_end(const CssNode* node, const SourceTracker& text, size_t* end);

// Document offset of the first character of a value parsed out of owner,
// given the owner's document start
size_t css_value_root_offset(const CssNode* owner, size_t owner_start);

size_t css_leading_whitespace_length(const std::string& str);

// ============================================================================
// Annotator
// ============================================================================

struct CssLocOptions {
    size_t max_depth;           // 0 = unlimited
    bool collect_diagnostics;
    size_t max_diagnostics;

    CssLocOptions() : max_depth(0), collect_diagnostics(true), max_diagnostics(100) {}
};

class CssLocAnnotator {
private:
    SourceTracker document_;        // original text, not the sanitized one
    CssLocOptions options_;
    DiagnosticList diagnostics_;
    CssLocationTable* table_;       // output of the running annotate()
    size_t depth_cuts_;

    bool enter(const CssNode* node, size_t depth);
    void annotateNode(const CssNode* node, size_t depth);
    void annotateValueNode(const CssNode* node, bool has_root_offset, size_t root_offset,
                           const SourceTracker& value_text, size_t depth);
    void annotateValueRoot(const CssNode* owner, const CssOffsetRange& owner_range,
                           const CssNode* value_root, size_t depth);
    void noteUnresolved(const CssNode* node, const CssOffsetRange& range);
    SourceLocation locationOf(const CssNode* node) const;

public:
    CssLocAnnotator(const char* text, size_t len,
                    const CssLocOptions& options = CssLocOptions());
    explicit CssLocAnnotator(const std::string& text,
                             const CssLocOptions& options = CssLocOptions());
    // the text is borrowed, it must outlive the annotator
    CssLocAnnotator(std::string&&, const CssLocOptions& = CssLocOptions()) = delete;

    // Walk the tree once. The tree is only read.
    CssLocationTable annotate(const CssNode* root);

    const DiagnosticList& diagnostics() const { return diagnostics_; }
    size_t depthCuts() const { return depth_cuts_; }
};

// One-call form of CssLocAnnotator::annotate
CssLocationTable css_calculate_loc(const CssNode* root, const char* text, size_t len);

// ============================================================================
// Consumers
// ============================================================================

// Original text covered by a resolved range, empty if unknown or out of range
std::string css_loc_slice(const char* text, size_t len, const CssOffsetRange& range);
std::string css_loc_slice(const std::string& text, const CssOffsetRange& range);

// Indented "kind [start, end)" listing, '?' for unknown bounds
std::string css_loc_format_tree(const CssNode* root, const CssLocationTable& table);

} // namespace csspos

#endif // CSSPOS_CSS_LOC_HPP
