#include "source_tracker.hpp"
#include <algorithm>

namespace csspos {

const size_t SourceTracker::npos;

SourceTracker::SourceTracker(const char* source, size_t len)
    : source_(source)
    , source_len_(source ? len : 0)
    , line_index_built_(false)
{
}

SourceTracker::SourceTracker(const std::string& source)
    : SourceTracker(source.c_str(), source.length())
{
}

void SourceTracker::buildLineIndex() const {
    if (line_index_built_) return;

    line_starts_.clear();
    line_starts_.push_back(0);  // Line 1 starts at offset 0

    for (size_t i = 0; i < source_len_; ++i) {
        if (source_[i] == '\n') {
            line_starts_.push_back(i + 1);
        }
    }

    line_index_built_ = true;
}

size_t SourceTracker::lineCount() const {
    buildLineIndex();
    return line_starts_.size();
}

size_t SourceTracker::lineStart(size_t line) const {
    buildLineIndex();
    if (line < 1 || line > line_starts_.size()) {
        return npos;
    }
    return line_starts_[line - 1];
}

size_t SourceTracker::lineColumnToIndex(size_t line, size_t column) const {
    size_t start = lineStart(line);
    if (start == npos) {
        return npos;
    }
    return start + column;
}

SourceLocation SourceTracker::locationAt(size_t offset) const {
    buildLineIndex();
    if (offset > source_len_) offset = source_len_;

    // last line start <= offset
    std::vector<size_t>::const_iterator it =
        std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    size_t line = static_cast<size_t>(it - line_starts_.begin());
    size_t column = offset - line_starts_[line - 1] + 1;
    return SourceLocation(offset, line, column);
}

size_t SourceTracker::lineEndFrom(size_t offset) const {
    size_t i = std::min(offset, source_len_);
    while (i < source_len_ && source_[i] != '\n' && source_[i] != '\r') {
        i++;
    }
    return i;
}

std::string SourceTracker::extract(size_t start_offset, size_t end_offset) const {
    if (start_offset >= source_len_ || end_offset > source_len_ || start_offset >= end_offset) {
        return "";
    }
    return std::string(source_ + start_offset, end_offset - start_offset);
}

std::string SourceTracker::extractLine(size_t line_num) const {
    size_t start = lineStart(line_num);
    if (start == npos) return "";

    size_t end = source_len_;
    if (line_num < line_starts_.size()) {
        end = line_starts_[line_num] - 1;  // Exclude the newline
    }

    // Trim trailing newline/carriage return
    while (end > start && (source_[end - 1] == '\n' || source_[end - 1] == '\r')) {
        end--;
    }

    return extract(start, end);
}

} // namespace csspos
