#include "diagnostics.hpp"

#include <algorithm>

namespace dockbridge
{

const char* diagnostic_kind_name(DiagnosticKind kind)
{
    switch (kind)
    {
        case DiagnosticKind::StructuralViolation:
            return "structural-violation";
        case DiagnosticKind::StaleHint:
            return "stale-hint";
        case DiagnosticKind::DoubleClaim:
            return "double-claim";
        case DiagnosticKind::IntegrityIssue:
            return "integrity";
        case DiagnosticKind::Lifecycle:
            return "lifecycle";
        case DiagnosticKind::Drop:
            return "drop";
    }
    return "unknown";
}

void DiagnosticsLog::record(uint64_t frame, DiagnosticKind kind, std::string message)
{
    if (capacity_ == 0)
        return;
    while (records_.size() >= capacity_)
        records_.pop_front();
    records_.push_back({frame, kind, std::move(message)});
}

size_t DiagnosticsLog::count(DiagnosticKind kind) const
{
    return static_cast<size_t>(std::count_if(records_.begin(),
                                             records_.end(),
                                             [kind](const auto& r) { return r.kind == kind; }));
}

std::vector<DiagnosticRecord> DiagnosticsLog::of_kind(DiagnosticKind kind) const
{
    std::vector<DiagnosticRecord> out;
    for (const auto& r : records_)
    {
        if (r.kind == kind)
            out.push_back(r);
    }
    return out;
}

void DiagnosticsLog::set_capacity(size_t capacity)
{
    capacity_ = capacity;
    while (records_.size() > capacity_)
        records_.pop_front();
}

}   // namespace dockbridge
