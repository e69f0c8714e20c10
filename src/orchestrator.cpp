#include "tribunal/orchestrator.hpp"

#include <sstream>

#include "tribunal/jsonlite.hpp"
#include "tribunal/observability.hpp"
#include "tribunal/state_machine.hpp"

namespace tribunal {

// ---------------------------------------------------------------------------
// Slots and pending operations
// ---------------------------------------------------------------------------
struct ArbitrationOrchestrator::SessionSlot {
  std::mutex         mu;
  ArbitrationSession session;
  SessionMetrics     metrics;
};

// Working copy of one session for the duration of one operation. Nothing in
// here reaches the registry, the precedent store or the audit log until
// commit(). Events go to the caller's outbox, which is delivered only after
// the slot mutex is released.
struct ArbitrationOrchestrator::PendingOp {
  PendingOp(ArbitrationOrchestrator& o, SessionSlot& s, std::vector<ArbitrationEvent>& out)
      : owner(o), slot(s), outbox(out), session(s.session), metrics(s.metrics) {}
  ~PendingOp() {
    if (!committed && reserved) owner.release_capacity();
  }
  PendingOp(const PendingOp&) = delete;
  PendingOp& operator=(const PendingOp&) = delete;

  ArbitrationOrchestrator&       owner;
  SessionSlot&                   slot;
  std::vector<ArbitrationEvent>& outbox;
  ArbitrationSession             session;
  SessionMetrics           metrics;
  std::vector<ArbitrationEvent>      events;
  std::vector<DecisionRecord>        decisions;
  std::vector<CreatePrecedentEffect> precedents;
  bool reserved{false};   // capacity taken by this operation
  bool released{false};   // session entered a terminal state
  bool committed{false};
};

namespace {

ArbitrationEvent make_event(EventKind kind, const std::string& session_id, std::string detail = "") {
  ArbitrationEvent ev;
  ev.kind              = kind;
  ev.session_id        = session_id;
  ev.detail            = std::move(detail);
  ev.timestamp_unix_ms = now_unix_ms();
  return ev;
}

DecisionRecord make_decision(DecisionKind kind, const std::string& session_id,
                             const std::string& subject_id, const std::string& outcome) {
  DecisionRecord r;
  r.kind       = kind;
  r.session_id = session_id;
  r.subject_id = subject_id;
  r.outcome    = outcome;
  return r;
}

DecisionRecord verdict_decision(const Verdict& v) {
  DecisionRecord r = make_decision(DecisionKind::verdict, v.session_id, v.id, to_string(v.outcome));
  r.confidence = v.confidence;
  r.digest     = v.digest;
  r.actor      = v.issued_by;
  return r;
}

void deliver(std::vector<ArbitrationEvent>& outbox) {
  std::vector<ArbitrationEvent> batch;
  batch.swap(outbox);
  for (const auto& ev : batch) emit_arbitration_event(ev);
}

// Runs a locked section, then delivers whatever it queued. Events committed
// or rejected before a throw are delivered too.
template <typename Locked>
auto deliver_after(std::vector<ArbitrationEvent>& outbox, Locked&& locked) -> decltype(locked()) {
  try {
    auto result = locked();
    deliver(outbox);
    return result;
  } catch (const std::exception&) {
    deliver(outbox);
    throw;
  }
}

std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (const auto& s : items) {
    if (!out.empty()) out += sep;
    out += s;
  }
  return out;
}

}  // namespace

std::string OrchestratorStatistics::to_json() const {
  std::ostringstream o;
  o << "{\"total_sessions\":" << total_sessions
    << ",\"active_sessions\":" << active_sessions
    << ",\"completed_sessions\":" << completed_sessions
    << ",\"failed_sessions\":" << failed_sessions
    << ",\"average_duration_ms\":" << jsonlite::format_double(average_duration_ms)
    << ",\"total_precedents\":" << total_precedents
    << ",\"total_appeals\":" << total_appeals
    << ",\"total_waivers\":" << total_waivers
    << ",\"verdicts_generated\":" << verdicts_generated
    << ",\"overturned_appeals\":" << overturned_appeals
    << ",\"audit_write_failures\":" << audit_write_failures
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
ArbitrationOrchestrator::ArbitrationOrchestrator(ArbitrationConfig config,
                                                 OrchestratorComponents components)
    : config_(std::move(config)), components_(std::move(components)) {
  if (config_.max_concurrent_sessions == 0) {
    throw ArbitrationError(ErrorCode::config_invalid, "max_concurrent_sessions must be positive");
  }
  if (!config_.verdict_weights.sums_to_one()) {
    throw ArbitrationError(ErrorCode::config_invalid, "verdict weights must sum to 1");
  }
  if (!components_.rule_engine) {
    components_.rule_engine = std::make_shared<ConstitutionalRuleEngine>();
  }
  if (!components_.precedent_manager) {
    components_.precedent_manager = std::make_shared<PrecedentManager>(config_.precedents);
  }
  if (!components_.verdict_generator) {
    components_.verdict_generator = std::make_shared<WeightedVerdictGenerator>(config_.verdict_weights);
  }
  if (!components_.waiver_interpreter) {
    components_.waiver_interpreter = std::make_shared<WaiverInterpreter>(config_.waivers);
  }
  if (!components_.appeal_arbitrator) {
    components_.appeal_arbitrator = std::make_shared<AppealArbitrator>(config_.appeals);
  }
  audit_ = components_.audit_log ? components_.audit_log : &global_audit_log();
}

ArbitrationOrchestrator::~ArbitrationOrchestrator() = default;

// ---------------------------------------------------------------------------
// Registry and capacity
// ---------------------------------------------------------------------------
std::shared_ptr<ArbitrationOrchestrator::SessionSlot> ArbitrationOrchestrator::find_slot(
    const std::string& session_id) const {
  std::shared_lock lk(registry_mu_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw ArbitrationError(ErrorCode::session_not_found, "Session not found: " + session_id, session_id);
  }
  return it->second;
}

bool ArbitrationOrchestrator::try_reserve_capacity() {
  uint32_t cur = active_.load(std::memory_order_relaxed);
  while (cur < config_.max_concurrent_sessions) {
    if (active_.compare_exchange_weak(cur, cur + 1, std::memory_order_acq_rel)) return true;
  }
  return false;
}

void ArbitrationOrchestrator::release_capacity() {
  uint32_t cur = active_.load(std::memory_order_relaxed);
  while (cur > 0 && !active_.compare_exchange_weak(cur, cur - 1, std::memory_order_acq_rel)) {
  }
}

// ---------------------------------------------------------------------------
// Transition core
// ---------------------------------------------------------------------------
void ArbitrationOrchestrator::enter_state(PendingOp& op, ArbitrationState to) {
  ArbitrationSession& s = op.session;
  const ArbitrationState from = s.state;
  try {
    validate_transition(from, to, s.id);
  } catch (const ArbitrationError& e) {
    ArbitrationEvent ev = make_event(EventKind::transition_rejected, s.id);
    ev.from_state = to_string(from);
    ev.to_state   = to_string(to);
    ev.ok         = false;
    ev.error_code = to_string(e.code());
    op.outbox.push_back(ev);
    throw;
  }

  const uint64_t now = now_unix_ms();
  if (from == ArbitrationState::completed && to == ArbitrationState::appeal_review) {
    if (!s.first_completed_at_unix_ms) s.first_completed_at_unix_ms = s.end_time_unix_ms;
    s.end_time_unix_ms.reset();
    s.reopened_at_unix_ms = now;
    ++s.reopen_count;
    op.metrics.reopen_count = s.reopen_count;
  }

  s.state = to;
  s.history.emplace_back(StateTransition{from, to, now});
  op.metrics.final_state = to;

  ArbitrationEvent ev = make_event(EventKind::transition, s.id);
  ev.from_state = to_string(from);
  ev.to_state   = to_string(to);
  op.events.push_back(ev);

  if (is_terminal(to)) {
    s.end_time_unix_ms = now;
    op.metrics.total_duration_ms = now >= s.start_time_unix_ms ? now - s.start_time_unix_ms : 0;
    if (s.reopened_at_unix_ms && s.first_completed_at_unix_ms && now >= *s.reopened_at_unix_ms) {
      op.metrics.appeal_phase_ms += now - *s.reopened_at_unix_ms;
    }
    op.released = true;
  }

  if (to == ArbitrationState::completed) {
    op.events.push_back(make_event(EventKind::session_completed, s.id));
    op.decisions.push_back(make_decision(DecisionKind::session_completed, s.id,
                                         s.verdict ? s.verdict->id : std::string(),
                                         to_string(ArbitrationState::completed)));
  }
}

void ArbitrationOrchestrator::require_state(const PendingOp& op, ArbitrationState required,
                                            const char* operation) const {
  if (op.session.state == required) return;
  throw ArbitrationError(ErrorCode::invalid_state,
                         std::string("Cannot ") + operation + ": session " + op.session.id + " is in " +
                             to_string(op.session.state) + ", expected " + to_string(required),
                         op.session.id);
}

void ArbitrationOrchestrator::apply_phase(PendingOp& op, const PhaseResult& result) {
  for (const auto& effect : result.effects) {
    if (const auto* m = std::get_if<MetricEffect>(&effect)) {
      switch (m->phase) {
        case Phase::rule_evaluation:
          op.metrics.rule_evaluation_ms = m->duration_ms;
          op.metrics.rules_evaluated    = m->count;
          break;
        case Phase::precedent_lookup:
          op.metrics.precedent_lookup_ms = m->duration_ms;
          op.metrics.precedents_found    = m->count;
          break;
        case Phase::verdict_generation:
          op.metrics.verdict_generation_ms = m->duration_ms;
          break;
        case Phase::waiver_evaluation:
          op.metrics.waiver_evaluation_ms = m->duration_ms;
          break;
        case Phase::appeal_review:
          break;
      }
      ArbitrationEvent ev = make_event(EventKind::phase_completed, op.session.id);
      ev.phase       = m->phase;
      ev.duration_ns = m->duration_ns;
      op.events.push_back(ev);
    } else if (const auto* p = std::get_if<CreatePrecedentEffect>(&effect)) {
      op.precedents.push_back(*p);
    }
  }
}

void ArbitrationOrchestrator::fail_locked(PendingOp& op, const std::string& message,
                                          const std::string& code) {
  op.session.history.emplace_back(ErrorRecord{message, code, op.session.state, now_unix_ms()});
  enter_state(op, ArbitrationState::failed);

  ArbitrationEvent ev = make_event(EventKind::session_failed, op.session.id, message);
  ev.ok         = false;
  ev.error_code = code.empty() ? "UNKNOWN" : code;
  op.events.push_back(ev);

  DecisionRecord r = make_decision(DecisionKind::session_failed, op.session.id,
                                   op.session.verdict ? op.session.verdict->id : std::string(),
                                   to_string(ArbitrationState::failed));
  r.error_code = code;
  op.decisions.push_back(r);
}

void ArbitrationOrchestrator::commit(PendingOp& op) {
  for (const auto& p : op.precedents) {
    auto created = components_.precedent_manager->create_precedent(p.verdict, p.title, p.key_facts,
                                                                   p.reasoning, p.attributes);
    op.events.push_back(make_event(EventKind::precedent_created, op.session.id, created->id));
  }

  op.slot.session = std::move(op.session);
  op.slot.metrics = op.metrics;
  if (op.released) release_capacity();
  op.committed = true;

  for (auto& r : op.decisions) {
    if (!audit_->append(r)) audit_failures_.fetch_add(1, std::memory_order_relaxed);
  }
  op.outbox.insert(op.outbox.end(), op.events.begin(), op.events.end());
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
ArbitrationSession ArbitrationOrchestrator::start_session(
    const ConstitutionalViolation& violation, const std::vector<ConstitutionalRule>& rules,
    const std::vector<std::string>& participants) {
  if (rules.empty()) {
    throw ArbitrationError(ErrorCode::invalid_argument, "At least one rule is required");
  }
  if (!try_reserve_capacity()) {
    throw ArbitrationError(ErrorCode::session_limit_exceeded,
                           "Maximum concurrent sessions (" +
                               std::to_string(config_.max_concurrent_sessions) + ") reached");
  }

  auto slot = std::make_shared<SessionSlot>();
  std::vector<ArbitrationEvent> outbox;
  return deliver_after(outbox, [&] {
    std::lock_guard<std::mutex> lk(slot->mu);
    PendingOp op(*this, *slot, outbox);
    op.reserved = true;

    const uint64_t now = now_unix_ms();
    ArbitrationSession& s = op.session;
    s.id                 = "ARB-" + std::to_string(now) + "-" + std::to_string(++id_counter_);
    s.state              = ArbitrationState::initialized;
    s.violation          = violation;
    s.rules_evaluated    = rules;
    s.evidence           = violation.evidence;
    s.participants       = participants;
    s.start_time_unix_ms = now;
    op.metrics.session_id  = s.id;
    op.metrics.final_state = s.state;

    op.events.push_back(make_event(EventKind::session_started, s.id, violation.rule_id));
    enter_state(op, ArbitrationState::rule_evaluation);

    const std::string id = s.id;
    {
      std::unique_lock reg(registry_mu_);
      sessions_[id] = slot;
    }
    commit(op);
    return slot->session;
  });
}

ArbitrationSession ArbitrationOrchestrator::evaluate_rules(const std::string& session_id) {
  auto slot = find_slot(session_id);
  std::vector<ArbitrationEvent> outbox;
  return deliver_after(outbox, [&] {
    std::lock_guard<std::mutex> lk(slot->mu);
    PendingOp op(*this, *slot, outbox);
    require_state(op, ArbitrationState::rule_evaluation, "evaluate rules");

    apply_phase(op, run_rule_evaluation(op.session, *components_.rule_engine));
    if (config_.auto_apply_precedents) {
      enter_state(op, ArbitrationState::evidence_collection);
      apply_phase(op, run_precedent_lookup(op.session, *components_.precedent_manager,
                                           components_.precedent_manager->config().default_limit));
    }
    enter_state(op, ArbitrationState::verdict_generation);
    commit(op);
    return slot->session;
  });
}

ArbitrationSession ArbitrationOrchestrator::find_precedents(const std::string& session_id) {
  auto slot = find_slot(session_id);
  std::vector<ArbitrationEvent> outbox;
  return deliver_after(outbox, [&] {
    std::lock_guard<std::mutex> lk(slot->mu);
    PendingOp op(*this, *slot, outbox);
    const bool refresh = op.session.state == ArbitrationState::verdict_generation && !op.session.verdict;
    if (!refresh) require_state(op, ArbitrationState::evidence_collection, "find precedents");

    apply_phase(op, run_precedent_lookup(op.session, *components_.precedent_manager,
                                         components_.precedent_manager->config().default_limit));
    if (!refresh) enter_state(op, ArbitrationState::verdict_generation);
    commit(op);
    return slot->session;
  });
}

Verdict ArbitrationOrchestrator::generate_verdict(const std::string& session_id,
                                                  const std::string& issued_by) {
  auto slot = find_slot(session_id);
  std::vector<ArbitrationEvent> outbox;
  return deliver_after(outbox, [&] {
    std::lock_guard<std::mutex> lk(slot->mu);
    PendingOp op(*this, *slot, outbox);
    require_state(op, ArbitrationState::verdict_generation, "generate verdict");

    apply_phase(op, run_verdict_generation(op.session, *components_.verdict_generator, issued_by));
    const Verdict& v = *op.session.verdict;
    op.events.push_back(make_event(EventKind::verdict_issued, v.session_id, v.id));
    op.decisions.push_back(verdict_decision(v));

    commit(op);
    verdicts_generated_.fetch_add(1, std::memory_order_relaxed);
    return *slot->session.verdict;
  });
}

WaiverDecision ArbitrationOrchestrator::evaluate_waiver(const std::string& session_id,
                                                        const WaiverRequest& request,
                                                        const std::string& decided_by) {
  if (!config_.enable_waivers) {
    throw ArbitrationError(ErrorCode::waivers_disabled, "Waivers are disabled", session_id);
  }
  auto slot = find_slot(session_id);
  std::vector<ArbitrationEvent> outbox;
  return deliver_after(outbox, [&] {
    std::lock_guard<std::mutex> lk(slot->mu);
    {
      PendingOp enter(*this, *slot, outbox);
      if (!enter.session.verdict) {
        throw ArbitrationError(ErrorCode::no_verdict, "Cannot evaluate waiver without verdict", session_id);
      }
      if (is_terminal(enter.session.state)) {
        throw ArbitrationError(ErrorCode::invalid_state,
                               "Cannot evaluate waiver: session " + session_id + " is " +
                                   to_string(enter.session.state),
                               session_id);
      }
      // Committed on its own: if the interpreter throws, the session stays
      // in WAIVER_EVALUATION for the caller to fail or retry.
      if (enter.session.state == ArbitrationState::verdict_generation) {
        enter_state(enter, ArbitrationState::waiver_evaluation);
        commit(enter);
      }
    }

    PendingOp op(*this, *slot, outbox);
    apply_phase(op, run_waiver_evaluation(op.session, *components_.waiver_interpreter, request, decided_by));

    const WaiverDecision& d = *op.session.waiver_decision;
    op.events.push_back(make_event(EventKind::waiver_decided, session_id, d.request_id));
    DecisionRecord r = make_decision(DecisionKind::waiver_decision, session_id, d.request_id,
                                     to_string(d.status));
    r.confidence = d.confidence;
    r.actor      = d.decided_by;
    op.decisions.push_back(r);

    enter_state(op, ArbitrationState::completed);
    commit(op);
    return *slot->session.waiver_decision;
  });
}

Appeal ArbitrationOrchestrator::submit_appeal(const std::string& session_id,
                                              const std::string& appellant_id,
                                              const std::string& grounds,
                                              const std::vector<std::string>& new_evidence) {
  if (!config_.enable_appeals) {
    throw ArbitrationError(ErrorCode::appeals_disabled, "Appeals are disabled", session_id);
  }
  auto slot = find_slot(session_id);
  std::vector<ArbitrationEvent> outbox;
  return deliver_after(outbox, [&] {
    std::lock_guard<std::mutex> lk(slot->mu);
    PendingOp op(*this, *slot, outbox);
    if (!op.session.verdict) {
      throw ArbitrationError(ErrorCode::no_verdict, "Cannot appeal session without verdict", session_id);
    }
    if (op.session.state == ArbitrationState::failed) {
      throw ArbitrationError(ErrorCode::invalid_state, "Cannot appeal failed session " + session_id,
                             session_id);
    }

    const ArbitrationState from = op.session.state;
    if (from == ArbitrationState::completed) {
      if (!try_reserve_capacity()) {
        throw ArbitrationError(ErrorCode::session_limit_exceeded,
                               "Maximum concurrent sessions (" +
                                   std::to_string(config_.max_concurrent_sessions) +
                                   ") reached; cannot reopen " + session_id,
                               session_id);
      }
      op.reserved = true;
    }
    if (from == ArbitrationState::verdict_generation || from == ArbitrationState::waiver_evaluation ||
        from == ArbitrationState::completed) {
      enter_state(op, ArbitrationState::appeal_review);
    }

    Appeal a = components_.appeal_arbitrator->submit_appeal(op.session, *op.session.verdict,
                                                            appellant_id, grounds, new_evidence);
    op.session.history.emplace_back(AppealSubmittedRecord{a.id, appellant_id, a.submitted_at_unix_ms});
    op.events.push_back(make_event(EventKind::appeal_submitted, session_id, a.id));
    commit(op);
    return a;
  });
}

AppealDecision ArbitrationOrchestrator::review_appeal(const std::string& session_id,
                                                      const std::string& appeal_id,
                                                      const std::vector<std::string>& reviewers) {
  if (!config_.enable_appeals) {
    throw ArbitrationError(ErrorCode::appeals_disabled, "Appeals are disabled", session_id);
  }
  auto slot = find_slot(session_id);
  std::vector<ArbitrationEvent> outbox;
  return deliver_after(outbox, [&] {
    std::lock_guard<std::mutex> lk(slot->mu);
    PendingOp op(*this, *slot, outbox);
    if (!op.session.verdict) {
      throw ArbitrationError(ErrorCode::no_verdict, "Cannot review appeal without verdict", session_id);
    }
    if (op.session.state == ArbitrationState::failed) {
      throw ArbitrationError(ErrorCode::invalid_state,
                             "Cannot review appeal on failed session " + session_id, session_id);
    }

    if (op.session.state == ArbitrationState::completed) {
      if (!try_reserve_capacity()) {
        throw ArbitrationError(ErrorCode::session_limit_exceeded,
                               "Maximum concurrent sessions (" +
                                   std::to_string(config_.max_concurrent_sessions) +
                                   ") reached; cannot reopen " + session_id,
                               session_id);
      }
      op.reserved = true;
      enter_state(op, ArbitrationState::appeal_review);
    }

    const Verdict before = *op.session.verdict;
    apply_phase(op, run_appeal_review(op.session, *components_.appeal_arbitrator, appeal_id, reviewers));
    const AppealDecision decision = *op.session.appeal_decision();

    op.events.push_back(make_event(EventKind::appeal_decided, session_id, appeal_id));
    DecisionRecord r = make_decision(DecisionKind::appeal_decision, session_id, appeal_id,
                                     to_string(decision.decision));
    r.confidence = decision.confidence;
    r.actor      = join(reviewers, ",");
    op.decisions.push_back(r);

    const bool superseded = decision.decision == AppealOutcome::overturned && decision.new_verdict;
    if (superseded) {
      const Verdict& nv = *op.session.verdict;
      DecisionRecord s = make_decision(DecisionKind::verdict_superseded, session_id, before.id, nv.id);
      s.confidence = before.confidence;
      s.digest     = before.digest;
      s.actor      = appeal_id;
      op.decisions.push_back(s);
      op.decisions.push_back(verdict_decision(nv));
      op.events.push_back(make_event(EventKind::verdict_issued, session_id, nv.id));
    }

    enter_state(op, ArbitrationState::completed);
    commit(op);
    if (superseded) verdicts_generated_.fetch_add(1, std::memory_order_relaxed);
    return decision;
  });
}

ArbitrationSession ArbitrationOrchestrator::complete_session(const std::string& session_id) {
  auto slot = find_slot(session_id);
  std::vector<ArbitrationEvent> outbox;
  return deliver_after(outbox, [&] {
    std::lock_guard<std::mutex> lk(slot->mu);
    if (slot->session.state == ArbitrationState::completed) return slot->session;
    PendingOp op(*this, *slot, outbox);
    enter_state(op, ArbitrationState::completed);
    commit(op);
    return slot->session;
  });
}

ArbitrationSession ArbitrationOrchestrator::fail_session(const std::string& session_id,
                                                         const std::exception& error) {
  const auto* arb = dynamic_cast<const ArbitrationError*>(&error);
  return fail_session(session_id, error.what(), arb ? arb->code() : ErrorCode::none);
}

ArbitrationSession ArbitrationOrchestrator::fail_session(const std::string& session_id,
                                                         const std::string& message, ErrorCode code) {
  auto slot = find_slot(session_id);
  std::vector<ArbitrationEvent> outbox;
  return deliver_after(outbox, [&] {
    std::lock_guard<std::mutex> lk(slot->mu);
    PendingOp op(*this, *slot, outbox);
    fail_locked(op, message, to_string(code));
    commit(op);
    return slot->session;
  });
}

std::vector<std::string> ArbitrationOrchestrator::fail_expired_sessions(uint64_t now_ms) {
  std::vector<std::shared_ptr<SessionSlot>> slots;
  {
    std::shared_lock lk(registry_mu_);
    for (const auto& [id, slot] : sessions_) slots.push_back(slot);
  }

  std::vector<ArbitrationEvent> outbox;
  return deliver_after(outbox, [&] {
    std::vector<std::string> failed;
    for (const auto& slot : slots) {
      std::lock_guard<std::mutex> lk(slot->mu);
      const ArbitrationSession& s = slot->session;
      if (is_terminal(s.state) || now_ms < s.start_time_unix_ms) continue;
      if (now_ms - s.start_time_unix_ms <= config_.session_timeout_ms) continue;

      PendingOp op(*this, *slot, outbox);
      fail_locked(op,
                  "Session exceeded timeout of " + std::to_string(config_.session_timeout_ms) + "ms",
                  to_string(ErrorCode::session_timeout));
      commit(op);
      failed.push_back(slot->session.id);
    }
    return failed;
  });
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
ArbitrationSession ArbitrationOrchestrator::get_session(const std::string& session_id) const {
  auto slot = find_slot(session_id);
  std::lock_guard<std::mutex> lk(slot->mu);
  return slot->session;
}

std::vector<ArbitrationSession> ArbitrationOrchestrator::get_active_sessions() const {
  std::shared_lock lk(registry_mu_);
  std::vector<ArbitrationSession> out;
  for (const auto& [id, slot] : sessions_) {
    std::lock_guard<std::mutex> slk(slot->mu);
    if (!is_terminal(slot->session.state)) out.push_back(slot->session);
  }
  return out;
}

std::optional<SessionMetrics> ArbitrationOrchestrator::get_session_metrics(
    const std::string& session_id) const {
  if (!config_.track_performance) return std::nullopt;
  std::shared_ptr<SessionSlot> slot;
  {
    std::shared_lock lk(registry_mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    slot = it->second;
  }
  std::lock_guard<std::mutex> lk(slot->mu);
  return slot->metrics;
}

std::vector<SessionMetrics> ArbitrationOrchestrator::get_all_metrics() const {
  std::vector<SessionMetrics> out;
  if (!config_.track_performance) return out;
  std::shared_lock lk(registry_mu_);
  for (const auto& [id, slot] : sessions_) {
    std::lock_guard<std::mutex> slk(slot->mu);
    out.push_back(slot->metrics);
  }
  return out;
}

OrchestratorStatistics ArbitrationOrchestrator::get_statistics() const {
  OrchestratorStatistics st;
  uint64_t duration_sum = 0;
  uint64_t finalized    = 0;
  {
    std::shared_lock lk(registry_mu_);
    st.total_sessions = sessions_.size();
    for (const auto& [id, slot] : sessions_) {
      std::lock_guard<std::mutex> slk(slot->mu);
      switch (slot->session.state) {
        case ArbitrationState::completed: ++st.completed_sessions; break;
        case ArbitrationState::failed: ++st.failed_sessions; break;
        default: ++st.active_sessions; break;
      }
      if (is_terminal(slot->session.state)) {
        duration_sum += slot->metrics.total_duration_ms;
        ++finalized;
      }
      if (slot->session.waiver_decision) ++st.total_waivers;
    }
  }
  st.average_duration_ms =
      finalized ? static_cast<double>(duration_sum) / static_cast<double>(finalized) : 0.0;
  st.total_precedents = components_.precedent_manager->size();

  const AppealStatistics appeals = components_.appeal_arbitrator->statistics();
  st.total_appeals        = appeals.total;
  st.overturned_appeals   = appeals.overturned;
  st.verdicts_generated   = verdicts_generated_.load(std::memory_order_relaxed);
  st.audit_write_failures = audit_failures_.load(std::memory_order_relaxed);
  return st;
}

void ArbitrationOrchestrator::clear() {
  std::unique_lock lk(registry_mu_);
  sessions_.clear();
  active_.store(0, std::memory_order_relaxed);
  id_counter_.store(0, std::memory_order_relaxed);
  verdicts_generated_.store(0, std::memory_order_relaxed);
  audit_failures_.store(0, std::memory_order_relaxed);
  components_.rule_engine->clear();
  components_.precedent_manager->clear();
  components_.waiver_interpreter->clear();
  components_.appeal_arbitrator->clear();
}

}  // namespace tribunal
