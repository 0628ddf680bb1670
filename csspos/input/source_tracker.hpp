#pragma once
#ifndef CSSPOS_SOURCE_TRACKER_HPP
#define CSSPOS_SOURCE_TRACKER_HPP

#include "diagnostic.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace csspos {

// Maps between absolute offsets and 1-based line/column positions of a
// text buffer. The line index is built lazily on first lookup; lines break
// on '\n' only, so a "\r\n" pair keeps its '\r' at the end of the line.
class SourceTracker {
private:
    const char* source_;        // Source text (not owned)
    size_t source_len_;         // Total length of source

    // Offset of the first character of each line, line 1 at index 0
    mutable std::vector<size_t> line_starts_;
    mutable bool line_index_built_;

    void buildLineIndex() const;

public:
    static const size_t npos = static_cast<size_t>(-1);

    SourceTracker(const char* source, size_t len);
    explicit SourceTracker(const std::string& source);
    SourceTracker(std::string&&) = delete;

    // Non-copyable
    SourceTracker(const SourceTracker&) = delete;
    SourceTracker& operator=(const SourceTracker&) = delete;

    const char* data() const { return source_; }
    size_t length() const { return source_len_; }
    size_t lineCount() const;

    // Offset of the first character of a 1-based line, npos if out of range
    size_t lineStart(size_t line) const;

    // line_start(line) + column. With the tokenizer's 1-based columns this is
    // one past the character at (line, column): a start position needs a
    // minus-one adjustment, an end position (which the tokenizer reports as
    // the last character, inclusive) is exclusive as-is.
    // Returns npos when line is 0 or past the last line.
    size_t lineColumnToIndex(size_t line, size_t column) const;

    // Reverse mapping, offsets past the end clamp to the end of text
    SourceLocation locationAt(size_t offset) const;

    // Index of the first '\n' or '\r' at or after offset, or length()
    size_t lineEndFrom(size_t offset) const;

    // Extract text in [start_offset, end_offset)
    std::string extract(size_t start_offset, size_t end_offset) const;
    // Line content without its terminator
    std::string extractLine(size_t line_num) const;
};

} // namespace csspos

#endif // CSSPOS_SOURCE_TRACKER_HPP
