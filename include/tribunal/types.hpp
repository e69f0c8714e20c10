#pragma once

// tribunal/types.hpp: Core data model for the Tribunal arbitration protocol engine.
//
// DESIGN:
//   Every type here is a value type. Sessions, verdicts, precedents and
//   decisions are copied across component boundaries; no component holds a
//   pointer into another component's state. Queries on the orchestrator return
//   snapshots, never references into the session registry.
//
// INVARIANTS:
//   - ConstitutionalViolation is immutable once a session is started with it.
//   - Precedent is immutable once created (see precedent.hpp).
//   - ArbitrationSession::end_time_unix_ms is set iff state is COMPLETED or FAILED.
//   - ArbitrationSession::history is append-only. Records are never rewritten,
//     a superseded verdict is retained as a VerdictSupersededRecord.
//
// TIME:
//   Wall-clock timestamps are unix milliseconds (system_clock). Phase durations
//   are measured with steady_clock and reported in milliseconds.

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace tribunal {

// ---------------------------------------------------------------------------
// ErrorCode: stable error taxonomy
// ---------------------------------------------------------------------------
enum class ErrorCode {
  none,
  session_limit_exceeded,
  session_not_found,
  invalid_state,
  invalid_state_transition,
  waivers_disabled,
  appeals_disabled,
  no_verdict,
  appeal_not_found,
  appeal_limit_exceeded,
  appeal_already_decided,
  insufficient_reviewers,
  invalid_argument,
  session_timeout,
  config_invalid,
};

// Canonical upper-case code, e.g. "SESSION_LIMIT_EXCEEDED". Empty for none.
std::string to_string(ErrorCode code);

// ArbitrationError: raised synchronously by every failing lifecycle operation.
// Carries the stable code and, where one is known, the session id.
class ArbitrationError : public std::runtime_error {
 public:
  ArbitrationError(ErrorCode code, const std::string& message,
                   std::string session_id = "");

  ErrorCode code() const noexcept { return code_; }
  const std::string& session_id() const noexcept { return session_id_; }

 private:
  ErrorCode   code_;
  std::string session_id_;
};

// ---------------------------------------------------------------------------
// Enumerations
// ---------------------------------------------------------------------------
enum class ArbitrationState : uint8_t {
  initialized,
  rule_evaluation,
  evidence_collection,
  verdict_generation,
  waiver_evaluation,
  appeal_review,
  debate_in_progress,
  completed,
  failed,
};

std::string to_string(ArbitrationState s);
std::optional<ArbitrationState> state_from_string(const std::string& s);
bool is_terminal(ArbitrationState s);

// Ordered: low < medium < high < critical.
enum class ViolationSeverity : uint8_t {
  low      = 0,
  medium   = 1,
  high     = 2,
  critical = 3,
};

std::string to_string(ViolationSeverity s);
// Accepts canonical names plus the aliases minor / moderate / major.
std::optional<ViolationSeverity> severity_from_string(const std::string& s);
int severity_distance(ViolationSeverity a, ViolationSeverity b);

enum class RuleCategory : uint8_t {
  code_quality,
  testing,
  security,
  performance,
  documentation,
  deployment,
  governance,
  resource_usage,
};

std::string to_string(RuleCategory c);
std::optional<RuleCategory> category_from_string(const std::string& s);

enum class VerdictOutcome : uint8_t {
  confirmed,    // violation established
  dismissed,    // no applicable rule was violated
  conditional,  // established, subject to the attached conditions
};

std::string to_string(VerdictOutcome o);
std::optional<VerdictOutcome> outcome_from_string(const std::string& s);

enum class WaiverStatus : uint8_t {
  approved,
  partially_approved,
  rejected,
  revoked,
};

std::string to_string(WaiverStatus s);

enum class AppealStatus : uint8_t {
  submitted,
  under_review,
  decided,
  withdrawn,
};

std::string to_string(AppealStatus s);

enum class AppealRecommendation : uint8_t {
  uphold,
  overturn,
  remand,
};

std::string to_string(AppealRecommendation r);
std::optional<AppealRecommendation> recommendation_from_string(const std::string& s);

enum class AppealOutcome : uint8_t {
  upheld,
  overturned,
  remanded,
};

std::string to_string(AppealOutcome o);

// ---------------------------------------------------------------------------
// Rules and violations (inputs from the violation-detection collaborator)
// ---------------------------------------------------------------------------
struct ConstitutionalRule {
  std::string       id;
  std::string       version{"1.0.0"};
  RuleCategory      category{RuleCategory::code_quality};
  std::string       title;
  std::string       description;
  std::string       condition;              // clause expression, see rule_engine.hpp
  ViolationSeverity severity{ViolationSeverity::medium};
  bool              waivable{true};
  std::vector<std::string> required_evidence;
  uint64_t          effective_from_unix_ms{0};  // 0 = always in effect
  uint64_t          expires_at_unix_ms{0};      // 0 = never expires
  std::map<std::string, std::string> metadata;
};

struct ConstitutionalViolation {
  std::string       id;
  std::string       rule_id;
  std::string       violator{"unknown"};
  ViolationSeverity severity{ViolationSeverity::medium};
  std::string       description;
  std::map<std::string, std::string> context;  // opaque to the orchestrator
  uint64_t          detected_at_unix_ms{0};
  std::vector<std::string> evidence;
};

// ---------------------------------------------------------------------------
// Rule evaluation result (produced by ConstitutionalRuleEngine)
// ---------------------------------------------------------------------------
struct RuleEvaluationResult {
  std::string rule_id;
  bool        loaded{false};      // false: id was never registered with the engine
  bool        applicable{false};  // loaded and in effect at the action timestamp
  bool        violated{false};
  double      strength{0.0};      // [0,1], 0 when not violated
  std::vector<std::string> failed_clauses;
  std::vector<std::string> indeterminate_clauses;
  std::vector<std::string> missing_evidence;
  std::string explanation;

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// Verdict
// ---------------------------------------------------------------------------
struct ReasoningStep {
  uint32_t    index{0};
  std::string description;
  double      contribution{0.0};  // weighted share of the final confidence, 0 if n/a
};

struct Verdict {
  std::string    id;
  std::string    session_id;
  VerdictOutcome outcome{VerdictOutcome::confirmed};
  std::vector<ReasoningStep> reasoning;
  std::vector<std::string>   rules_applied;
  std::vector<std::string>   evidence;
  std::vector<std::string>   precedents;   // cited precedent ids
  std::vector<std::string>   conditions;
  double         confidence{0.0};          // [0,1]
  std::string    issued_by;
  uint64_t       issued_at_unix_ms{0};
  std::string    digest;                   // BLAKE3("verdict:" + canonical_json())

  // Deterministic fields only: excludes id, issued_at and digest, so two
  // generations over identical session state produce the same digest.
  std::string canonical_json() const;
  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// Precedent: immutable record derived from a verdict
// ---------------------------------------------------------------------------
struct Precedent {
  std::string       id;
  uint64_t          sequence{0};           // creation order, monotonic per manager
  std::string       title;
  std::string       description;
  std::vector<std::string> key_facts;
  std::string       reasoning;
  RuleCategory      category{RuleCategory::code_quality};
  ViolationSeverity severity{ViolationSeverity::medium};
  std::vector<std::string> conditions;
  std::vector<std::string> rules_involved;
  std::string       source_verdict_id;
  VerdictOutcome    outcome{VerdictOutcome::confirmed};
  uint64_t          created_at_unix_ms{0};
  std::string       digest;

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// Waivers
// ---------------------------------------------------------------------------
struct WaiverRequest {
  std::string id;
  std::string rule_id;
  std::string requested_by;
  std::string justification;
  std::vector<std::string> evidence;
  int64_t     requested_duration_ms{0};   // signed: a negative duration is already expired
  uint64_t    requested_at_unix_ms{0};
  std::map<std::string, std::string> context;
};

struct WaiverDecision {
  std::string  request_id;
  std::string  rule_id;
  WaiverStatus status{WaiverStatus::rejected};
  std::string  reasoning;
  std::vector<std::string> conditions;
  double       confidence{0.0};
  std::string  decided_by;
  uint64_t     decided_at_unix_ms{0};
  int64_t      approved_duration_ms{0};
  std::optional<int64_t> expires_at_unix_ms;
  std::optional<int64_t> auto_revoke_at_unix_ms;

  bool grants_waiver() const {
    return status == WaiverStatus::approved || status == WaiverStatus::partially_approved;
  }
  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// Appeals
// ---------------------------------------------------------------------------
struct Appeal {
  std::string  id;
  std::string  session_id;
  std::string  original_verdict_id;
  std::string  appellant_id;
  std::string  grounds;
  std::vector<std::string> new_evidence;
  AppealStatus status{AppealStatus::submitted};
  uint64_t     submitted_at_unix_ms{0};

  std::string to_json() const;
};

struct ReviewerVote {
  std::string reviewer_id;
  std::optional<AppealRecommendation> recommendation;  // unset: derived from the appeal
  std::string rationale;
  std::optional<Verdict> proposed_verdict;             // only meaningful with overturn
};

struct AppealDecision {
  std::string   appeal_id;
  AppealOutcome decision{AppealOutcome::upheld};
  std::string   reasoning;
  double        confidence{0.0};
  std::vector<ReviewerVote> votes;
  std::optional<Verdict> new_verdict;   // present iff decision == overturned
  uint64_t      decided_at_unix_ms{0};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// SessionMetrics: per-session phase timings
// ---------------------------------------------------------------------------
struct SessionMetrics {
  std::string      session_id;
  uint64_t         rule_evaluation_ms{0};
  uint64_t         precedent_lookup_ms{0};
  uint64_t         verdict_generation_ms{0};
  std::optional<uint64_t> waiver_evaluation_ms;
  uint64_t         rules_evaluated{0};
  uint64_t         precedents_found{0};
  uint64_t         total_duration_ms{0};
  uint64_t         appeal_phase_ms{0};    // accumulated time spent reopened for appeal
  uint32_t         reopen_count{0};
  ArbitrationState final_state{ArbitrationState::initialized};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// Session history: tagged records replacing a free-form metadata bag
// ---------------------------------------------------------------------------
struct StateTransition {
  ArbitrationState from{ArbitrationState::initialized};
  ArbitrationState to{ArbitrationState::initialized};
  uint64_t         timestamp_unix_ms{0};
};

struct RuleEvaluationRecord {
  std::vector<RuleEvaluationResult> results;
  uint64_t timestamp_unix_ms{0};
};

struct PrecedentLookupRecord {
  std::vector<std::string> precedent_ids;
  std::vector<double>      scores;
  uint64_t timestamp_unix_ms{0};
};

struct VerdictRecord {
  std::string    verdict_id;
  std::string    digest;
  VerdictOutcome outcome{VerdictOutcome::confirmed};
  double         confidence{0.0};
  uint64_t       timestamp_unix_ms{0};
};

struct WaiverRecord {
  WaiverDecision decision;
};

struct AppealSubmittedRecord {
  std::string appeal_id;
  std::string appellant_id;
  uint64_t    timestamp_unix_ms{0};
};

struct AppealDecisionRecord {
  AppealDecision decision;
};

struct VerdictSupersededRecord {
  Verdict     superseded;
  std::string replaced_by;
  std::string appeal_id;
  uint64_t    timestamp_unix_ms{0};
};

struct ErrorRecord {
  std::string      message;
  std::string      code;     // ErrorCode string when the cause was an ArbitrationError
  ArbitrationState state_at_failure{ArbitrationState::initialized};
  uint64_t         timestamp_unix_ms{0};
};

using SessionEvent = std::variant<StateTransition,
                                  RuleEvaluationRecord,
                                  PrecedentLookupRecord,
                                  VerdictRecord,
                                  WaiverRecord,
                                  AppealSubmittedRecord,
                                  AppealDecisionRecord,
                                  VerdictSupersededRecord,
                                  ErrorRecord>;

// ---------------------------------------------------------------------------
// ArbitrationSession: the unit of work
// ---------------------------------------------------------------------------
struct ArbitrationSession {
  std::string                     id;          // ARB-<unix_ms>-<counter>
  ArbitrationState                state{ArbitrationState::initialized};
  ConstitutionalViolation         violation;
  std::vector<ConstitutionalRule> rules_evaluated;
  std::vector<std::string>        evidence;
  std::vector<std::string>        participants;
  std::vector<Precedent>          precedents;
  std::optional<Verdict>          verdict;
  std::optional<WaiverRequest>    waiver_request;
  std::optional<WaiverDecision>   waiver_decision;
  uint64_t                        start_time_unix_ms{0};
  std::optional<uint64_t>         end_time_unix_ms;
  std::optional<uint64_t>         first_completed_at_unix_ms;
  std::optional<uint64_t>         reopened_at_unix_ms;
  uint32_t                        reopen_count{0};
  std::vector<SessionEvent>       history;
  std::map<std::string, std::string> extensions;

  std::vector<StateTransition> transitions() const;
  std::optional<RuleEvaluationRecord> rule_evaluation_results() const;
  std::optional<AppealDecision> appeal_decision() const;  // most recent
  std::optional<ErrorRecord> error() const;

  // The rule the violation was reported against, else the first candidate.
  const ConstitutionalRule* primary_rule() const;

  std::string to_json() const;
};

// Current wall-clock time in unix milliseconds.
uint64_t now_unix_ms();

}  // namespace tribunal
