#include "FeedRecords.h"

#include <algorithm>

void Diagnostics::add(DiagnosticKind kind, std::string subject, std::string message) {
    entries_.push_back(Diagnostic{kind, std::move(subject), std::move(message)});
}

void Diagnostics::append(const Diagnostics& other) {
    entries_.insert(entries_.end(), other.entries_.begin(), other.entries_.end());
}

size_t Diagnostics::count(DiagnosticKind kind) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(), [kind](const Diagnostic& d) {
        return d.kind == kind;
    }));
}

const char* Diagnostics::kindName(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::COERCION_WARNING: return "CoercionWarning";
        case DiagnosticKind::DIVISION_UNDEFINED: return "DivisionUndefinedError";
        case DiagnosticKind::EMPTY_RESULT: return "EmptyResultWarning";
    }
    return "Unknown";
}
