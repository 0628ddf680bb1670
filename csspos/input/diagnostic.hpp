#pragma once
#ifndef CSSPOS_DIAGNOSTIC_HPP
#define CSSPOS_DIAGNOSTIC_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace csspos {

// Source location - 0-based offset, 1-based line and column
struct SourceLocation {
    size_t offset;      // Character offset in source (0-based)
    size_t line;        // Line number (1-based)
    size_t column;      // Column number (1-based)

    SourceLocation() : offset(0), line(1), column(1) {}
    SourceLocation(size_t off, size_t ln, size_t col)
        : offset(off), line(ln), column(col) {}

    bool isValid() const { return line > 0 && column > 0; }
};

enum class DiagnosticSeverity {
    WARNING,
    NOTE
};

// Something the sanitizer or annotator could not do for a given position.
// Diagnostics never change results; they explain unknown offsets and
// skipped sanitization.
struct Diagnostic {
    SourceLocation location;
    DiagnosticSeverity severity;
    std::string message;
    std::string context_line;   // Source line at the location
    std::string hint;

    Diagnostic(const SourceLocation& loc, DiagnosticSeverity sev,
               const std::string& msg)
        : location(loc), severity(sev), message(msg) {}

    Diagnostic(const SourceLocation& loc, DiagnosticSeverity sev,
               const std::string& msg, const std::string& ctx,
               const std::string& h = "")
        : location(loc), severity(sev), message(msg),
          context_line(ctx), hint(h) {}
};

// Collection of diagnostics with configurable limit
class DiagnosticList {
private:
    std::vector<Diagnostic> items_;
    size_t max_items_;
    size_t warning_count_;
    size_t dropped_count_;    // Rejected after the limit was reached

public:
    explicit DiagnosticList(size_t max_items = 100)
        : max_items_(max_items), warning_count_(0),
          dropped_count_(0) {}

    // Returns false once the limit is reached
    bool add(const Diagnostic& diag);

    void addWarning(const SourceLocation& loc, const std::string& msg);
    void addWarning(const SourceLocation& loc, const std::string& msg,
                    const std::string& context, const std::string& hint = "");
    void addNote(const SourceLocation& loc, const std::string& msg);

    bool full() const { return items_.size() >= max_items_; }
    bool empty() const { return items_.empty(); }

    bool hasWarnings() const { return warning_count_ > 0; }
    size_t warningCount() const { return warning_count_; }
    size_t noteCount() const { return items_.size() - warning_count_; }
    size_t droppedCount() const { return dropped_count_; }
    size_t size() const { return items_.size(); }

    const std::vector<Diagnostic>& items() const { return items_; }
    const Diagnostic& operator[](size_t i) const { return items_[i]; }

    // Render as "line L, col C: severity: message" with a caret line
    std::string formatDiagnostics() const;
    std::string formatDiagnostic(const Diagnostic& diag) const;

    void setMaxItems(size_t max) { max_items_ = max; }
    size_t maxItems() const { return max_items_; }

    void clear() {
        items_.clear();
        warning_count_ = 0;
        dropped_count_ = 0;
    }
};

const char* diagnostic_severity_name(DiagnosticSeverity severity);

} // namespace csspos

#endif // CSSPOS_DIAGNOSTIC_HPP
