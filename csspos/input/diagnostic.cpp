#include "diagnostic.hpp"
#include <sstream>

namespace csspos {

const char* diagnostic_severity_name(DiagnosticSeverity severity) {
    switch (severity) {
        case DiagnosticSeverity::WARNING: return "warning";
        case DiagnosticSeverity::NOTE:    return "note";
    }
    return "";
}

bool DiagnosticList::add(const Diagnostic& diag) {
    if (items_.size() >= max_items_) {
        dropped_count_++;
        return false;
    }

    items_.push_back(diag);
    if (diag.severity == DiagnosticSeverity::WARNING) {
        warning_count_++;
    }

    return true;
}

void DiagnosticList::addWarning(const SourceLocation& loc, const std::string& msg) {
    add(Diagnostic(loc, DiagnosticSeverity::WARNING, msg));
}

void DiagnosticList::addWarning(const SourceLocation& loc, const std::string& msg,
                                const std::string& context, const std::string& hint) {
    add(Diagnostic(loc, DiagnosticSeverity::WARNING, msg, context, hint));
}

void DiagnosticList::addNote(const SourceLocation& loc, const std::string& msg) {
    add(Diagnostic(loc, DiagnosticSeverity::NOTE, msg));
}

std::string DiagnosticList::formatDiagnostic(const Diagnostic& diag) const {
    std::ostringstream oss;

    oss << "line " << diag.location.line << ", col " << diag.location.column
        << ": " << diagnostic_severity_name(diag.severity) << ": " << diag.message << "\n";

    if (!diag.context_line.empty()) {
        oss << "  " << diag.context_line << "\n";

        // caret under the column, if it falls on the context line
        if (diag.location.column > 0 && diag.location.column <= diag.context_line.length() + 1) {
            oss << "  ";
            for (size_t i = 1; i < diag.location.column; ++i) {
                oss << (diag.context_line[i - 1] == '\t' ? '\t' : ' ');
            }
            oss << "^\n";
        }
    }

    if (!diag.hint.empty()) {
        oss << "  hint: " << diag.hint << "\n";
    }

    return oss.str();
}

std::string DiagnosticList::formatDiagnostics() const {
    if (items_.empty()) {
        return "";
    }

    std::ostringstream oss;

    size_t notes = noteCount();
    oss << "Diagnostics (" << warning_count_ << " warning";
    if (warning_count_ != 1) oss << "s";
    oss << ", " << notes << " note";
    if (notes != 1) oss << "s";
    oss << "):\n\n";

    for (size_t i = 0; i < items_.size(); ++i) {
        oss << formatDiagnostic(items_[i]);
        if (i < items_.size() - 1) {
            oss << "\n";
        }
    }

    if (dropped_count_ > 0) {
        oss << "\n(limit of " << max_items_ << " reached, " << dropped_count_
            << " more not shown)\n";
    }

    return oss.str();
}

} // namespace csspos
