#include "tribunal/types.hpp"

#include <cctype>
#include <chrono>
#include <sstream>

#include "tribunal/jsonlite.hpp"

namespace tribunal {

namespace {

std::string q(const std::string& s) { return "\"" + jsonlite::escape(s) + "\""; }

std::string str_array(const std::vector<std::string>& items) {
  std::ostringstream o;
  o << "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) o << ",";
    o << q(items[i]);
  }
  o << "]";
  return o.str();
}

std::string str_map(const std::map<std::string, std::string>& m) {
  std::ostringstream o;
  o << "{";
  bool first = true;
  for (const auto& [k, v] : m) {
    if (!first) o << ",";
    first = false;
    o << q(k) << ":" << q(v);
  }
  o << "}";
  return o.str();
}

std::string opt_u64(const std::optional<uint64_t>& v) {
  return v ? std::to_string(*v) : "null";
}

std::string opt_i64(const std::optional<int64_t>& v) {
  return v ? std::to_string(*v) : "null";
}

std::string reasoning_json(const std::vector<ReasoningStep>& steps) {
  std::ostringstream o;
  o << "[";
  for (size_t i = 0; i < steps.size(); ++i) {
    if (i) o << ",";
    o << "{\"index\":" << steps[i].index
      << ",\"description\":" << q(steps[i].description)
      << ",\"contribution\":" << jsonlite::format_double(steps[i].contribution) << "}";
  }
  o << "]";
  return o.str();
}

std::string vote_json(const ReviewerVote& v) {
  std::ostringstream o;
  o << "{\"reviewer_id\":" << q(v.reviewer_id)
    << ",\"recommendation\":" << (v.recommendation ? q(to_string(*v.recommendation)) : "null")
    << ",\"rationale\":" << q(v.rationale)
    << ",\"proposed_verdict\":" << (v.proposed_verdict ? v.proposed_verdict->to_json() : "null")
    << "}";
  return o.str();
}

std::string event_json(const SessionEvent& ev) {
  std::ostringstream o;
  if (const auto* t = std::get_if<StateTransition>(&ev)) {
    o << "{\"type\":\"state_transition\",\"from\":" << q(to_string(t->from))
      << ",\"to\":" << q(to_string(t->to))
      << ",\"timestamp_unix_ms\":" << t->timestamp_unix_ms << "}";
  } else if (const auto* r = std::get_if<RuleEvaluationRecord>(&ev)) {
    o << "{\"type\":\"rule_evaluation\",\"results\":[";
    for (size_t i = 0; i < r->results.size(); ++i) {
      if (i) o << ",";
      o << r->results[i].to_json();
    }
    o << "],\"timestamp_unix_ms\":" << r->timestamp_unix_ms << "}";
  } else if (const auto* p = std::get_if<PrecedentLookupRecord>(&ev)) {
    o << "{\"type\":\"precedent_lookup\",\"precedent_ids\":" << str_array(p->precedent_ids)
      << ",\"scores\":[";
    for (size_t i = 0; i < p->scores.size(); ++i) {
      if (i) o << ",";
      o << jsonlite::format_double(p->scores[i]);
    }
    o << "],\"timestamp_unix_ms\":" << p->timestamp_unix_ms << "}";
  } else if (const auto* v = std::get_if<VerdictRecord>(&ev)) {
    o << "{\"type\":\"verdict\",\"verdict_id\":" << q(v->verdict_id)
      << ",\"digest\":" << q(v->digest)
      << ",\"outcome\":" << q(to_string(v->outcome))
      << ",\"confidence\":" << jsonlite::format_double(v->confidence)
      << ",\"timestamp_unix_ms\":" << v->timestamp_unix_ms << "}";
  } else if (const auto* w = std::get_if<WaiverRecord>(&ev)) {
    o << "{\"type\":\"waiver\",\"decision\":" << w->decision.to_json() << "}";
  } else if (const auto* a = std::get_if<AppealSubmittedRecord>(&ev)) {
    o << "{\"type\":\"appeal_submitted\",\"appeal_id\":" << q(a->appeal_id)
      << ",\"appellant_id\":" << q(a->appellant_id)
      << ",\"timestamp_unix_ms\":" << a->timestamp_unix_ms << "}";
  } else if (const auto* d = std::get_if<AppealDecisionRecord>(&ev)) {
    o << "{\"type\":\"appeal_decision\",\"decision\":" << d->decision.to_json() << "}";
  } else if (const auto* s = std::get_if<VerdictSupersededRecord>(&ev)) {
    o << "{\"type\":\"verdict_superseded\",\"superseded\":" << s->superseded.to_json()
      << ",\"replaced_by\":" << q(s->replaced_by)
      << ",\"appeal_id\":" << q(s->appeal_id)
      << ",\"timestamp_unix_ms\":" << s->timestamp_unix_ms << "}";
  } else if (const auto* e = std::get_if<ErrorRecord>(&ev)) {
    o << "{\"type\":\"error\",\"message\":" << q(e->message)
      << ",\"code\":" << q(e->code)
      << ",\"state_at_failure\":" << q(to_string(e->state_at_failure))
      << ",\"timestamp_unix_ms\":" << e->timestamp_unix_ms << "}";
  }
  return o.str();
}

}  // namespace

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::session_limit_exceeded: return "SESSION_LIMIT_EXCEEDED";
    case ErrorCode::session_not_found: return "SESSION_NOT_FOUND";
    case ErrorCode::invalid_state: return "INVALID_STATE";
    case ErrorCode::invalid_state_transition: return "INVALID_STATE_TRANSITION";
    case ErrorCode::waivers_disabled: return "WAIVERS_DISABLED";
    case ErrorCode::appeals_disabled: return "APPEALS_DISABLED";
    case ErrorCode::no_verdict: return "NO_VERDICT";
    case ErrorCode::appeal_not_found: return "APPEAL_NOT_FOUND";
    case ErrorCode::appeal_limit_exceeded: return "APPEAL_LIMIT_EXCEEDED";
    case ErrorCode::appeal_already_decided: return "APPEAL_ALREADY_DECIDED";
    case ErrorCode::insufficient_reviewers: return "INSUFFICIENT_REVIEWERS";
    case ErrorCode::invalid_argument: return "INVALID_ARGUMENT";
    case ErrorCode::session_timeout: return "SESSION_TIMEOUT";
    case ErrorCode::config_invalid: return "CONFIG_INVALID";
  }
  return "";
}

ArbitrationError::ArbitrationError(ErrorCode code, const std::string& message,
                                   std::string session_id)
    : std::runtime_error(message), code_(code), session_id_(std::move(session_id)) {}

// ---------------------------------------------------------------------------
// Enumerations
// ---------------------------------------------------------------------------

std::string to_string(ArbitrationState s) {
  switch (s) {
    case ArbitrationState::initialized: return "INITIALIZED";
    case ArbitrationState::rule_evaluation: return "RULE_EVALUATION";
    case ArbitrationState::evidence_collection: return "EVIDENCE_COLLECTION";
    case ArbitrationState::verdict_generation: return "VERDICT_GENERATION";
    case ArbitrationState::waiver_evaluation: return "WAIVER_EVALUATION";
    case ArbitrationState::appeal_review: return "APPEAL_REVIEW";
    case ArbitrationState::debate_in_progress: return "DEBATE_IN_PROGRESS";
    case ArbitrationState::completed: return "COMPLETED";
    case ArbitrationState::failed: return "FAILED";
  }
  return "";
}

std::optional<ArbitrationState> state_from_string(const std::string& s) {
  static const ArbitrationState kAll[] = {
      ArbitrationState::initialized,        ArbitrationState::rule_evaluation,
      ArbitrationState::evidence_collection, ArbitrationState::verdict_generation,
      ArbitrationState::waiver_evaluation,  ArbitrationState::appeal_review,
      ArbitrationState::debate_in_progress, ArbitrationState::completed,
      ArbitrationState::failed,
  };
  for (auto st : kAll) {
    if (to_string(st) == s) return st;
  }
  return std::nullopt;
}

bool is_terminal(ArbitrationState s) {
  return s == ArbitrationState::completed || s == ArbitrationState::failed;
}

std::string to_string(ViolationSeverity s) {
  switch (s) {
    case ViolationSeverity::low: return "low";
    case ViolationSeverity::medium: return "medium";
    case ViolationSeverity::high: return "high";
    case ViolationSeverity::critical: return "critical";
  }
  return "";
}

std::optional<ViolationSeverity> severity_from_string(const std::string& s) {
  std::string l;
  for (char c : s) l += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (l == "low" || l == "minor") return ViolationSeverity::low;
  if (l == "medium" || l == "moderate") return ViolationSeverity::medium;
  if (l == "high" || l == "major") return ViolationSeverity::high;
  if (l == "critical") return ViolationSeverity::critical;
  return std::nullopt;
}

int severity_distance(ViolationSeverity a, ViolationSeverity b) {
  const int d = static_cast<int>(a) - static_cast<int>(b);
  return d < 0 ? -d : d;
}

std::string to_string(RuleCategory c) {
  switch (c) {
    case RuleCategory::code_quality: return "code_quality";
    case RuleCategory::testing: return "testing";
    case RuleCategory::security: return "security";
    case RuleCategory::performance: return "performance";
    case RuleCategory::documentation: return "documentation";
    case RuleCategory::deployment: return "deployment";
    case RuleCategory::governance: return "governance";
    case RuleCategory::resource_usage: return "resource_usage";
  }
  return "";
}

std::optional<RuleCategory> category_from_string(const std::string& s) {
  std::string l;
  for (char c : s) l += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  static const RuleCategory kAll[] = {
      RuleCategory::code_quality,  RuleCategory::testing,    RuleCategory::security,
      RuleCategory::performance,   RuleCategory::documentation, RuleCategory::deployment,
      RuleCategory::governance,    RuleCategory::resource_usage,
  };
  for (auto c : kAll) {
    if (to_string(c) == l) return c;
  }
  return std::nullopt;
}

std::string to_string(VerdictOutcome o) {
  switch (o) {
    case VerdictOutcome::confirmed: return "confirmed";
    case VerdictOutcome::dismissed: return "dismissed";
    case VerdictOutcome::conditional: return "conditional";
  }
  return "";
}

std::optional<VerdictOutcome> outcome_from_string(const std::string& s) {
  if (s == "confirmed") return VerdictOutcome::confirmed;
  if (s == "dismissed") return VerdictOutcome::dismissed;
  if (s == "conditional") return VerdictOutcome::conditional;
  return std::nullopt;
}

std::string to_string(WaiverStatus s) {
  switch (s) {
    case WaiverStatus::approved: return "approved";
    case WaiverStatus::partially_approved: return "partially_approved";
    case WaiverStatus::rejected: return "rejected";
    case WaiverStatus::revoked: return "revoked";
  }
  return "";
}

std::string to_string(AppealStatus s) {
  switch (s) {
    case AppealStatus::submitted: return "submitted";
    case AppealStatus::under_review: return "under_review";
    case AppealStatus::decided: return "decided";
    case AppealStatus::withdrawn: return "withdrawn";
  }
  return "";
}

std::string to_string(AppealRecommendation r) {
  switch (r) {
    case AppealRecommendation::uphold: return "uphold";
    case AppealRecommendation::overturn: return "overturn";
    case AppealRecommendation::remand: return "remand";
  }
  return "";
}

std::optional<AppealRecommendation> recommendation_from_string(const std::string& s) {
  if (s == "uphold") return AppealRecommendation::uphold;
  if (s == "overturn") return AppealRecommendation::overturn;
  if (s == "remand") return AppealRecommendation::remand;
  return std::nullopt;
}

std::string to_string(AppealOutcome o) {
  switch (o) {
    case AppealOutcome::upheld: return "upheld";
    case AppealOutcome::overturned: return "overturned";
    case AppealOutcome::remanded: return "remanded";
  }
  return "";
}

// ---------------------------------------------------------------------------
// JSON projections
// ---------------------------------------------------------------------------

std::string RuleEvaluationResult::to_json() const {
  std::ostringstream o;
  o << "{\"rule_id\":" << q(rule_id)
    << ",\"loaded\":" << (loaded ? "true" : "false")
    << ",\"applicable\":" << (applicable ? "true" : "false")
    << ",\"violated\":" << (violated ? "true" : "false")
    << ",\"strength\":" << jsonlite::format_double(strength)
    << ",\"failed_clauses\":" << str_array(failed_clauses)
    << ",\"indeterminate_clauses\":" << str_array(indeterminate_clauses)
    << ",\"missing_evidence\":" << str_array(missing_evidence)
    << ",\"explanation\":" << q(explanation)
    << "}";
  return o.str();
}

std::string Verdict::canonical_json() const {
  std::ostringstream o;
  o << "{\"conditions\":" << str_array(conditions)
    << ",\"confidence\":" << jsonlite::format_double(confidence)
    << ",\"evidence\":" << str_array(evidence)
    << ",\"issued_by\":" << q(issued_by)
    << ",\"outcome\":" << q(to_string(outcome))
    << ",\"precedents\":" << str_array(precedents)
    << ",\"reasoning\":" << reasoning_json(reasoning)
    << ",\"rules_applied\":" << str_array(rules_applied)
    << ",\"session_id\":" << q(session_id)
    << "}";
  return o.str();
}

std::string Verdict::to_json() const {
  std::ostringstream o;
  o << "{\"id\":" << q(id)
    << ",\"session_id\":" << q(session_id)
    << ",\"outcome\":" << q(to_string(outcome))
    << ",\"confidence\":" << jsonlite::format_double(confidence)
    << ",\"reasoning\":" << reasoning_json(reasoning)
    << ",\"rules_applied\":" << str_array(rules_applied)
    << ",\"evidence\":" << str_array(evidence)
    << ",\"precedents\":" << str_array(precedents)
    << ",\"conditions\":" << str_array(conditions)
    << ",\"issued_by\":" << q(issued_by)
    << ",\"issued_at_unix_ms\":" << issued_at_unix_ms
    << ",\"digest\":" << q(digest)
    << "}";
  return o.str();
}

std::string Precedent::to_json() const {
  std::ostringstream o;
  o << "{\"id\":" << q(id)
    << ",\"sequence\":" << sequence
    << ",\"title\":" << q(title)
    << ",\"description\":" << q(description)
    << ",\"key_facts\":" << str_array(key_facts)
    << ",\"reasoning\":" << q(reasoning)
    << ",\"category\":" << q(to_string(category))
    << ",\"severity\":" << q(to_string(severity))
    << ",\"conditions\":" << str_array(conditions)
    << ",\"rules_involved\":" << str_array(rules_involved)
    << ",\"source_verdict_id\":" << q(source_verdict_id)
    << ",\"outcome\":" << q(to_string(outcome))
    << ",\"created_at_unix_ms\":" << created_at_unix_ms
    << ",\"digest\":" << q(digest)
    << "}";
  return o.str();
}

std::string WaiverDecision::to_json() const {
  std::ostringstream o;
  o << "{\"request_id\":" << q(request_id)
    << ",\"rule_id\":" << q(rule_id)
    << ",\"status\":" << q(to_string(status))
    << ",\"reasoning\":" << q(reasoning)
    << ",\"conditions\":" << str_array(conditions)
    << ",\"confidence\":" << jsonlite::format_double(confidence)
    << ",\"decided_by\":" << q(decided_by)
    << ",\"decided_at_unix_ms\":" << decided_at_unix_ms
    << ",\"approved_duration_ms\":" << approved_duration_ms
    << ",\"expires_at_unix_ms\":" << opt_i64(expires_at_unix_ms)
    << ",\"auto_revoke_at_unix_ms\":" << opt_i64(auto_revoke_at_unix_ms)
    << "}";
  return o.str();
}

std::string Appeal::to_json() const {
  std::ostringstream o;
  o << "{\"id\":" << q(id)
    << ",\"session_id\":" << q(session_id)
    << ",\"original_verdict_id\":" << q(original_verdict_id)
    << ",\"appellant_id\":" << q(appellant_id)
    << ",\"grounds\":" << q(grounds)
    << ",\"new_evidence\":" << str_array(new_evidence)
    << ",\"status\":" << q(to_string(status))
    << ",\"submitted_at_unix_ms\":" << submitted_at_unix_ms
    << "}";
  return o.str();
}

std::string AppealDecision::to_json() const {
  std::ostringstream o;
  o << "{\"appeal_id\":" << q(appeal_id)
    << ",\"decision\":" << q(to_string(decision))
    << ",\"reasoning\":" << q(reasoning)
    << ",\"confidence\":" << jsonlite::format_double(confidence)
    << ",\"votes\":[";
  for (size_t i = 0; i < votes.size(); ++i) {
    if (i) o << ",";
    o << vote_json(votes[i]);
  }
  o << "],\"new_verdict\":" << (new_verdict ? new_verdict->to_json() : "null")
    << ",\"decided_at_unix_ms\":" << decided_at_unix_ms
    << "}";
  return o.str();
}

std::string SessionMetrics::to_json() const {
  std::ostringstream o;
  o << "{\"session_id\":" << q(session_id)
    << ",\"rule_evaluation_ms\":" << rule_evaluation_ms
    << ",\"precedent_lookup_ms\":" << precedent_lookup_ms
    << ",\"verdict_generation_ms\":" << verdict_generation_ms
    << ",\"waiver_evaluation_ms\":" << opt_u64(waiver_evaluation_ms)
    << ",\"rules_evaluated\":" << rules_evaluated
    << ",\"precedents_found\":" << precedents_found
    << ",\"total_duration_ms\":" << total_duration_ms
    << ",\"appeal_phase_ms\":" << appeal_phase_ms
    << ",\"reopen_count\":" << reopen_count
    << ",\"final_state\":" << q(to_string(final_state))
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// ArbitrationSession
// ---------------------------------------------------------------------------

std::vector<StateTransition> ArbitrationSession::transitions() const {
  std::vector<StateTransition> out;
  for (const auto& ev : history) {
    if (const auto* t = std::get_if<StateTransition>(&ev)) out.push_back(*t);
  }
  return out;
}

std::optional<RuleEvaluationRecord> ArbitrationSession::rule_evaluation_results() const {
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (const auto* r = std::get_if<RuleEvaluationRecord>(&*it)) return *r;
  }
  return std::nullopt;
}

std::optional<AppealDecision> ArbitrationSession::appeal_decision() const {
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (const auto* d = std::get_if<AppealDecisionRecord>(&*it)) return d->decision;
  }
  return std::nullopt;
}

std::optional<ErrorRecord> ArbitrationSession::error() const {
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (const auto* e = std::get_if<ErrorRecord>(&*it)) return *e;
  }
  return std::nullopt;
}

const ConstitutionalRule* ArbitrationSession::primary_rule() const {
  for (const auto& r : rules_evaluated) {
    if (r.id == violation.rule_id) return &r;
  }
  return rules_evaluated.empty() ? nullptr : &rules_evaluated.front();
}

std::string ArbitrationSession::to_json() const {
  std::ostringstream o;
  o << "{\"id\":" << q(id)
    << ",\"state\":" << q(to_string(state))
    << ",\"violation\":{\"id\":" << q(violation.id)
    << ",\"rule_id\":" << q(violation.rule_id)
    << ",\"violator\":" << q(violation.violator)
    << ",\"severity\":" << q(to_string(violation.severity))
    << ",\"description\":" << q(violation.description)
    << ",\"context\":" << str_map(violation.context)
    << ",\"detected_at_unix_ms\":" << violation.detected_at_unix_ms
    << ",\"evidence\":" << str_array(violation.evidence) << "}"
    << ",\"rules_evaluated\":[";
  for (size_t i = 0; i < rules_evaluated.size(); ++i) {
    if (i) o << ",";
    const auto& r = rules_evaluated[i];
    o << "{\"id\":" << q(r.id) << ",\"category\":" << q(to_string(r.category))
      << ",\"severity\":" << q(to_string(r.severity)) << "}";
  }
  o << "],\"evidence\":" << str_array(evidence)
    << ",\"participants\":" << str_array(participants)
    << ",\"precedents\":[";
  for (size_t i = 0; i < precedents.size(); ++i) {
    if (i) o << ",";
    o << q(precedents[i].id);
  }
  o << "],\"verdict\":" << (verdict ? verdict->to_json() : "null")
    << ",\"waiver_decision\":" << (waiver_decision ? waiver_decision->to_json() : "null")
    << ",\"start_time_unix_ms\":" << start_time_unix_ms
    << ",\"end_time_unix_ms\":" << opt_u64(end_time_unix_ms)
    << ",\"first_completed_at_unix_ms\":" << opt_u64(first_completed_at_unix_ms)
    << ",\"reopened_at_unix_ms\":" << opt_u64(reopened_at_unix_ms)
    << ",\"reopen_count\":" << reopen_count
    << ",\"history\":[";
  for (size_t i = 0; i < history.size(); ++i) {
    if (i) o << ",";
    o << event_json(history[i]);
  }
  o << "],\"extensions\":" << str_map(extensions)
    << "}";
  return o.str();
}

uint64_t now_unix_ms() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count());
}

}  // namespace tribunal
