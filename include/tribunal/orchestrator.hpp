#pragma once

// tribunal/orchestrator.hpp: Arbitration session coordinator.
//
// DESIGN:
//   The orchestrator owns the session registry and drives every session through
//   the transition table in state_machine.hpp, calling the five collaborators
//   through the phase functions in phases.hpp.
//
//   Registry: id -> shared_ptr<SessionSlot>, guarded by a shared_mutex
//   (shared for lookup, exclusive for insert and clear). Each slot carries its
//   own mutex; every lifecycle operation on a session holds that mutex for its
//   whole duration, so operations on one session are strictly ordered while
//   different sessions proceed in parallel.
//
//   Each operation works on a copy of the session and commits it, together
//   with its metrics, precedents, events and audit records, only when the
//   operation succeeds. A failed operation leaves the session as it found it,
//   except that evaluate_waiver() commits VERDICT_GENERATION -> WAIVER_EVALUATION
//   before calling the interpreter.
//
//   Events are delivered to the event hook after the slot mutex is released,
//   so a hook may call back into the orchestrator, including for the session
//   it was told about.
//
// INVARIANTS:
//   1. The number of non-terminal sessions never exceeds
//      max_concurrent_sessions. Capacity is reserved with a CAS on active_
//      before a session is created or reopened, and released when the session
//      enters COMPLETED or FAILED.
//   2. end_time_unix_ms is set iff the session state is terminal.
//   3. A verdict with confidence > 0.8 becomes a precedent; exactly 0.8 does not.
//   4. fail_session() is the single failure path: it records an ErrorRecord,
//      sets end_time and finalizes metrics.
//
// REOPENING:
//   COMPLETED -> APPEAL_REVIEW moves the first completion time into
//   first_completed_at_unix_ms, clears end_time, stamps reopened_at_unix_ms
//   and bumps reopen_count. The next terminal transition sets a fresh
//   end_time and adds the reopened interval to appeal_phase_ms.
//
// EXTENSION_POINT: supervisor
//   fail_expired_sessions() fails sessions older than session_timeout_ms. The
//   engine runs no timer of its own; a host calls it periodically.

#include <atomic>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tribunal/appeal.hpp"
#include "tribunal/audit.hpp"
#include "tribunal/config.hpp"
#include "tribunal/phases.hpp"
#include "tribunal/precedent.hpp"
#include "tribunal/rule_engine.hpp"
#include "tribunal/types.hpp"
#include "tribunal/verdict.hpp"
#include "tribunal/waiver.hpp"

namespace tribunal {

// Collaborators. Any member left null is default-constructed from the config.
struct OrchestratorComponents {
  std::shared_ptr<ConstitutionalRuleEngine> rule_engine;
  std::shared_ptr<PrecedentManager>         precedent_manager;
  std::shared_ptr<VerdictGenerator>         verdict_generator;
  std::shared_ptr<WaiverInterpreter>        waiver_interpreter;
  std::shared_ptr<AppealArbitrator>         appeal_arbitrator;
  ImmutableAuditLog*                        audit_log{nullptr};  // null: global_audit_log()
};

struct OrchestratorStatistics {
  uint64_t total_sessions{0};
  uint64_t active_sessions{0};
  uint64_t completed_sessions{0};
  uint64_t failed_sessions{0};
  double   average_duration_ms{0.0};   // over COMPLETED and FAILED sessions
  uint64_t total_precedents{0};
  uint64_t total_appeals{0};
  uint64_t total_waivers{0};
  uint64_t verdicts_generated{0};
  uint64_t overturned_appeals{0};
  uint64_t audit_write_failures{0};

  std::string to_json() const;
};

class ArbitrationOrchestrator {
 public:
  explicit ArbitrationOrchestrator(ArbitrationConfig config = {},
                                   OrchestratorComponents components = {});
  ~ArbitrationOrchestrator();

  ArbitrationOrchestrator(const ArbitrationOrchestrator&) = delete;
  ArbitrationOrchestrator& operator=(const ArbitrationOrchestrator&) = delete;

  // --- Lifecycle --------------------------------------------------------------
  // Throws SESSION_LIMIT_EXCEEDED, INVALID_ARGUMENT (no rules).
  ArbitrationSession start_session(const ConstitutionalViolation& violation,
                                   const std::vector<ConstitutionalRule>& rules,
                                   const std::vector<std::string>& participants);

  // Requires RULE_EVALUATION. Ends in VERDICT_GENERATION, passing through
  // EVIDENCE_COLLECTION and a precedent lookup when auto_apply_precedents is on.
  ArbitrationSession evaluate_rules(const std::string& session_id);

  // From EVIDENCE_COLLECTION: looks up precedents and moves to
  // VERDICT_GENERATION. From VERDICT_GENERATION before any verdict: refreshes
  // the session precedents in place.
  ArbitrationSession find_precedents(const std::string& session_id);

  // Requires VERDICT_GENERATION. Does not transition.
  Verdict generate_verdict(const std::string& session_id, const std::string& issued_by);

  // Throws WAIVERS_DISABLED, NO_VERDICT, INVALID_STATE (COMPLETED or FAILED).
  // Ends in COMPLETED. If the interpreter throws, the session is left in
  // WAIVER_EVALUATION.
  WaiverDecision evaluate_waiver(const std::string& session_id, const WaiverRequest& request,
                                 const std::string& decided_by);

  // Throws APPEALS_DISABLED, NO_VERDICT, INVALID_STATE (FAILED),
  // SESSION_LIMIT_EXCEEDED (reopening), and the arbitrator's errors.
  Appeal submit_appeal(const std::string& session_id, const std::string& appellant_id,
                       const std::string& grounds, const std::vector<std::string>& new_evidence);

  // Ends in COMPLETED. An overturn replaces the verdict and creates an
  // "Appeal Overturn" precedent.
  AppealDecision review_appeal(const std::string& session_id, const std::string& appeal_id,
                               const std::vector<std::string>& reviewers);

  // No-op on a COMPLETED session.
  ArbitrationSession complete_session(const std::string& session_id);

  ArbitrationSession fail_session(const std::string& session_id, const std::exception& error);
  ArbitrationSession fail_session(const std::string& session_id, const std::string& message,
                                  ErrorCode code = ErrorCode::none);

  // Fails every non-terminal session older than session_timeout_ms with
  // SESSION_TIMEOUT. Returns the ids it failed.
  std::vector<std::string> fail_expired_sessions(uint64_t now_ms = now_unix_ms());

  // --- Queries (snapshots) ----------------------------------------------------
  ArbitrationSession get_session(const std::string& session_id) const;
  std::vector<ArbitrationSession> get_active_sessions() const;
  std::optional<SessionMetrics> get_session_metrics(const std::string& session_id) const;
  std::vector<SessionMetrics> get_all_metrics() const;
  OrchestratorStatistics get_statistics() const;

  const ArbitrationConfig& config() const { return config_; }
  const OrchestratorComponents& components() const { return components_; }

  // Drops every session and resets the id counter and all components.
  void clear();

 private:
  struct SessionSlot;
  struct PendingOp;

  std::shared_ptr<SessionSlot> find_slot(const std::string& session_id) const;
  bool try_reserve_capacity();
  void release_capacity();

  void enter_state(PendingOp& op, ArbitrationState to);
  void require_state(const PendingOp& op, ArbitrationState required, const char* operation) const;
  void apply_phase(PendingOp& op, const PhaseResult& result);
  void fail_locked(PendingOp& op, const std::string& message, const std::string& code);
  void commit(PendingOp& op);

  ArbitrationConfig      config_;
  OrchestratorComponents components_;
  ImmutableAuditLog*     audit_{nullptr};

  mutable std::shared_mutex registry_mu_;
  std::map<std::string, std::shared_ptr<SessionSlot>> sessions_;

  std::atomic<uint32_t> active_{0};
  std::atomic<uint64_t> id_counter_{0};
  std::atomic<uint64_t> verdicts_generated_{0};
  std::atomic<uint64_t> audit_failures_{0};
};

}  // namespace tribunal
