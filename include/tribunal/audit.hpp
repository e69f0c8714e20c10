#pragma once

// tribunal/audit.hpp: Immutable, append-only decision log.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence number.
//   3. STRUCTURED: every entry is a single-line JSON object (NDJSON format).
//   4. CHAINED: each entry carries prev = H("audit:" || prev_of_previous || previous_line),
//      so editing or dropping any line breaks every later link.
//   5. FAIL-SAFE: write failures never abort an arbitration. The in-memory
//      session is authoritative; audit failures increment a counter.
//   6. RESUMABLE: opening an existing log continues its sequence and chain
//      from the last entry, so every process writing to one path extends a
//      single verifiable chain.
//
// Invariant: AUDIT_LOG_VERSION (version.hpp) must be bumped before any
// structural change to DecisionRecord fields.

#include <cstdint>
#include <memory>
#include <string>

namespace tribunal {

enum class DecisionKind : uint8_t {
  verdict,
  verdict_superseded,
  waiver_decision,
  appeal_decision,
  session_completed,
  session_failed,
};

std::string to_string(DecisionKind k);

// ---------------------------------------------------------------------------
// DecisionRecord: one adjudication fact
// ---------------------------------------------------------------------------
struct DecisionRecord {
  uint64_t     sequence{0};            // assigned by append()
  std::string  previous_digest;        // assigned by append()
  DecisionKind kind{DecisionKind::verdict};
  std::string  session_id;
  std::string  subject_id;             // verdict id, waiver request id or appeal id
  std::string  outcome;                // confirmed / approved / overturned / COMPLETED ...
  double       confidence{0.0};
  std::string  digest;                 // verdict digest where applicable
  std::string  actor;                  // issued_by / decided_by
  std::string  error_code;
  std::string  engine_semver;          // assigned by append()
  uint32_t     audit_log_version{0};   // assigned by append()
  uint32_t     hash_algorithm_version{0};
  uint64_t     timestamp_unix_ms{0};   // assigned by append()
};

std::string decision_to_json(const DecisionRecord& r);

// ---------------------------------------------------------------------------
// ImmutableAuditLog: append-only NDJSON log writer
// ---------------------------------------------------------------------------
// Thread-safe: one internal mutex serializes appends. Each write is followed
// by fflush(). An empty path disables the log; append() then succeeds without
// writing.
struct AuditLogImpl;

class ImmutableAuditLog {
 public:
  explicit ImmutableAuditLog(const std::string& path = "");
  ~ImmutableAuditLog();

  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  // Never throws. INVARIANT: if append() returns false, the entry was NOT
  // counted and the chain head did not advance.
  bool append(DecisionRecord& record);

  bool enabled() const;
  uint64_t entry_count() const;   // entries appended by this instance
  uint64_t failure_count() const;
  std::string head_digest() const;
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::unique_ptr<AuditLogImpl> impl_;
};

// ---------------------------------------------------------------------------
// Chain verification
// ---------------------------------------------------------------------------
struct AuditVerifyResult {
  bool        ok{true};
  uint64_t    entries{0};
  uint64_t    first_bad_sequence{0};  // 0 when ok
  std::string error;
};

// Re-reads an audit file and checks sequence monotonicity and every chain link.
AuditVerifyResult verify_audit_log(const std::string& path);

// ---------------------------------------------------------------------------
// Global audit log singleton
// ---------------------------------------------------------------------------
// Activated by TRIBUNAL_AUDIT_LOG=/path/to/audit.ndjson, or programmatically
// with set_audit_log_path() before the first arbitration.
ImmutableAuditLog& global_audit_log();
void set_audit_log_path(const std::string& path);

}  // namespace tribunal
