#pragma once
#ifndef CSSPOS_COMMENT_SANITIZER_HPP
#define CSSPOS_COMMENT_SANITIZER_HPP

#include "../input/diagnostic.hpp"
#include <string>
#include <cstddef>

namespace csspos {

/**
 * Inline Comment Sanitizer
 *
 * Some stylesheet tokenizers treat a quote inside a '//' comment as the
 * start of a string and lose their line/column bookkeeping for the rest of
 * the file. Running this pass before tokenizing replaces such quotes with
 * spaces. The result has the same length and the same offsets as the input,
 * so positions computed on the sanitized text are valid for the original,
 * and the original text is still used to print comments verbatim.
 */

enum class SanitizeStatus {
    UNCHANGED,      // no inline comment contained a quote
    SANITIZED,      // quotes in at least one inline comment were replaced
    ABORTED         // newline inside a quoted string or url(), text returned as-is
};

// Scanner state, exposed for diagnostics and tests
enum class SanitizeState {
    INITIAL,
    SINGLE_QUOTE,
    DOUBLE_QUOTE,
    URL,
    BLOCK_COMMENT,
    INLINE_COMMENT
};

struct SanitizeResult {
    std::string text;
    SanitizeStatus status;
    size_t comments_rewritten;
    size_t quotes_replaced;
    size_t abort_offset;        // offset of the offending newline when ABORTED
    SanitizeState abort_state;  // context that was open when ABORTED

    SanitizeResult()
        : status(SanitizeStatus::UNCHANGED), comments_rewritten(0),
          quotes_replaced(0), abort_offset(0), abort_state(SanitizeState::INITIAL) {}
};

// Sanitize text. An abort adds a warning to diagnostics when given.
SanitizeResult css_sanitize_inline_comments(const char* text, size_t len,
                                            DiagnosticList* diagnostics = nullptr);

// Text-only form of css_sanitize_inline_comments
std::string css_replace_quotes_in_inline_comments(const std::string& text);

const char* sanitize_status_name(SanitizeStatus status);
const char* sanitize_state_name(SanitizeState state);

} // namespace csspos

#endif // CSSPOS_COMMENT_SANITIZER_HPP
