#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace dockbridge
{

enum class DiagnosticKind
{
    StructuralViolation,
    StaleHint,
    DoubleClaim,
    IntegrityIssue,
    Lifecycle,
    Drop,
};

const char* diagnostic_kind_name(DiagnosticKind kind);

struct DiagnosticRecord
{
    uint64_t       frame = 0;
    DiagnosticKind kind  = DiagnosticKind::Drop;
    std::string    message;
};

// Bounded ring of drag/drop diagnostics; the oldest record is dropped first.
class DiagnosticsLog
{
   public:
    explicit DiagnosticsLog(size_t capacity = 200) : capacity_(capacity) {}

    void record(uint64_t frame, DiagnosticKind kind, std::string message);
    void clear() { records_.clear(); }

    const std::deque<DiagnosticRecord>& records() const { return records_; }
    size_t                              count(DiagnosticKind kind) const;
    std::vector<DiagnosticRecord>       of_kind(DiagnosticKind kind) const;

    void   set_capacity(size_t capacity);
    size_t capacity() const { return capacity_; }

   private:
    size_t                       capacity_;
    std::deque<DiagnosticRecord> records_;
};

}   // namespace dockbridge
