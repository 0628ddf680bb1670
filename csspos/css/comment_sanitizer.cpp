#include "comment_sanitizer.hpp"
#include "../input/source_tracker.hpp"
#include "../../lib/log.h"

#include <re2/re2.h>
#include <vector>
#include <cctype>

namespace csspos {

namespace {

struct CommentRange {
    size_t start;
    size_t end;     // exclusive, the line terminator
};

bool is_line_break(char c) {
    return c == '\n' || c == '\r';
}

// case-insensitive "url(" at text[0..3]
bool starts_with_url(const char* text, size_t remaining) {
    if (remaining < 4) return false;
    return std::tolower((unsigned char)text[0]) == 'u' &&
           std::tolower((unsigned char)text[1]) == 'r' &&
           std::tolower((unsigned char)text[2]) == 'l' &&
           text[3] == '(';
}

// Byte-oriented so replacements never shift offsets in non-UTF-8 input
RE2::Options latin1_options() {
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingLatin1);
    options.set_log_errors(false);
    return options;
}

const RE2& quote_pattern() {
    static const RE2 pattern("[\"']", latin1_options());
    return pattern;
}

void report_abort(const char* text, size_t len, size_t offset, SanitizeState state,
                  DiagnosticList* diagnostics) {
    bool in_url = state == SanitizeState::URL;
    log_warn("[CSS Sanitize] line break inside %s at offset %zu, inline comments left as-is",
             in_url ? "url()" : "quoted string", offset);
    if (!diagnostics) return;

    SourceTracker tracker(text, len);
    SourceLocation loc = tracker.locationAt(offset);
    diagnostics->addWarning(loc,
        in_url ? "line break inside url(), inline comments not sanitized"
               : "line break inside quoted string, inline comments not sanitized",
        tracker.extractLine(loc.line),
        "close the string on the same line");
}

} // namespace

const char* sanitize_status_name(SanitizeStatus status) {
    switch (status) {
        case SanitizeStatus::UNCHANGED: return "unchanged";
        case SanitizeStatus::SANITIZED: return "sanitized";
        case SanitizeStatus::ABORTED:   return "aborted";
    }
    return "unknown";
}

const char* sanitize_state_name(SanitizeState state) {
    switch (state) {
        case SanitizeState::INITIAL:        return "initial";
        case SanitizeState::SINGLE_QUOTE:   return "single-quote";
        case SanitizeState::DOUBLE_QUOTE:   return "double-quote";
        case SanitizeState::URL:            return "url";
        case SanitizeState::BLOCK_COMMENT:  return "block-comment";
        case SanitizeState::INLINE_COMMENT: return "inline-comment";
    }
    return "unknown";
}

SanitizeResult css_sanitize_inline_comments(const char* text, size_t len,
                                            DiagnosticList* diagnostics) {
    SanitizeResult result;
    if (!text || len == 0) return result;

    SanitizeState state = SanitizeState::INITIAL;
    SanitizeState return_state = SanitizeState::INITIAL;  // where a closing quote leads
    size_t comment_start = 0;
    bool comment_has_quotes = false;
    std::vector<CommentRange> ranges;

    for (size_t i = 0; i < len; i++) {
        char c = text[i];
        char prev = i > 0 ? text[i - 1] : '\0';

        switch (state) {
            case SanitizeState::INITIAL:
                if (c == '\'') {
                    state = SanitizeState::SINGLE_QUOTE;
                } else if (c == '"') {
                    state = SanitizeState::DOUBLE_QUOTE;
                } else if ((c == 'u' || c == 'U') && starts_with_url(text + i, len - i)) {
                    state = SanitizeState::URL;
                    i += 3;
                } else if (c == '*' && prev == '/') {
                    state = SanitizeState::BLOCK_COMMENT;
                } else if (c == '/' && prev == '/') {
                    state = SanitizeState::INLINE_COMMENT;
                    comment_start = i - 1;
                }
                break;

            case SanitizeState::SINGLE_QUOTE:
            case SanitizeState::DOUBLE_QUOTE: {
                char quote = state == SanitizeState::SINGLE_QUOTE ? '\'' : '"';
                if (c == quote && prev != '\\') {
                    state = return_state;
                    return_state = SanitizeState::INITIAL;
                } else if (is_line_break(c)) {
                    report_abort(text, len, i, state, diagnostics);
                    result.text.assign(text, len);
                    result.status = SanitizeStatus::ABORTED;
                    result.abort_offset = i;
                    result.abort_state = state;
                    return result;
                }
                break;
            }

            case SanitizeState::URL:
                if (c == ')') {
                    state = SanitizeState::INITIAL;
                } else if (is_line_break(c)) {
                    report_abort(text, len, i, state, diagnostics);
                    result.text.assign(text, len);
                    result.status = SanitizeStatus::ABORTED;
                    result.abort_offset = i;
                    result.abort_state = state;
                    return result;
                } else if (c == '\'') {
                    state = SanitizeState::SINGLE_QUOTE;
                    return_state = SanitizeState::URL;
                } else if (c == '"') {
                    state = SanitizeState::DOUBLE_QUOTE;
                    return_state = SanitizeState::URL;
                }
                break;

            case SanitizeState::BLOCK_COMMENT:
                if (c == '/' && prev == '*') {
                    state = SanitizeState::INITIAL;
                }
                break;

            case SanitizeState::INLINE_COMMENT:
                if (c == '"' || c == '\'') {
                    comment_has_quotes = true;
                } else if (is_line_break(c)) {
                    if (comment_has_quotes) {
                        CommentRange range = { comment_start, i };
                        ranges.push_back(range);
                    }
                    state = SanitizeState::INITIAL;
                    comment_has_quotes = false;
                }
                break;
        }
    }

    result.text.assign(text, len);
    for (size_t r = 0; r < ranges.size(); r++) {
        const CommentRange& range = ranges[r];
        std::string comment = result.text.substr(range.start, range.end - range.start);
        int replaced = RE2::GlobalReplace(&comment, quote_pattern(), " ");
        if (replaced <= 0) continue;
        // one space per quote, so the comment keeps its length
        result.text.replace(range.start, comment.size(), comment);
        result.quotes_replaced += (size_t)replaced;
        result.comments_rewritten++;
    }

    if (result.comments_rewritten > 0) {
        result.status = SanitizeStatus::SANITIZED;
        log_debug("[CSS Sanitize] replaced %zu quotes in %zu inline comments",
                  result.quotes_replaced, result.comments_rewritten);
    }
    return result;
}

std::string css_replace_quotes_in_inline_comments(const std::string& text) {
    return css_sanitize_inline_comments(text.data(), text.size()).text;
}

} // namespace csspos
