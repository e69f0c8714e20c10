#include "tribunal/phases.hpp"

#include <algorithm>

namespace tribunal {

namespace {

uint64_t ns_to_ms(uint64_t ns) { return ns / 1000000; }

MetricEffect make_metric(Phase phase, uint64_t duration_ns, uint64_t count = 0) {
  MetricEffect m;
  m.phase       = phase;
  m.duration_ns = duration_ns;
  m.duration_ms = ns_to_ms(duration_ns);
  m.count       = count;
  return m;
}

size_t recorded_verdicts(const ArbitrationSession& session) {
  return static_cast<size_t>(std::count_if(session.history.begin(), session.history.end(),
                                           [](const SessionEvent& ev) {
                                             return std::holds_alternative<VerdictRecord>(ev);
                                           }));
}

std::string reported_rule_id(const ArbitrationSession& session) {
  if (!session.violation.rule_id.empty()) return session.violation.rule_id;
  const ConstitutionalRule* rule = session.primary_rule();
  return rule ? rule->id : std::string("unknown");
}

PrecedentAttributes attributes_for(const ArbitrationSession& session, const Verdict& verdict) {
  PrecedentAttributes a;
  if (!session.rules_evaluated.empty()) a.category = session.rules_evaluated.front().category;
  a.severity   = session.violation.severity;
  a.conditions = verdict.conditions;
  return a;
}

void record_verdict(ArbitrationSession& session, const Verdict& v) {
  session.history.emplace_back(VerdictRecord{v.id, v.digest, v.outcome, v.confidence, now_unix_ms()});
}

}  // namespace

std::vector<CreatePrecedentEffect> PhaseResult::precedent_effects() const {
  std::vector<CreatePrecedentEffect> out;
  for (const auto& e : effects) {
    if (const auto* p = std::get_if<CreatePrecedentEffect>(&e)) out.push_back(*p);
  }
  return out;
}

std::optional<MetricEffect> PhaseResult::metric() const {
  for (const auto& e : effects) {
    if (const auto* m = std::get_if<MetricEffect>(&e)) return *m;
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Rule evaluation
// ---------------------------------------------------------------------------
PhaseResult run_rule_evaluation(ArbitrationSession& session, ConstitutionalRuleEngine& engine) {
  uint64_t ns = 0;
  RuleEvaluationRecord record;
  {
    ScopeTimer t(ns);
    std::vector<std::string> ids;
    ids.reserve(session.rules_evaluated.size());
    for (const auto& rule : session.rules_evaluated) {
      engine.load_rule(rule);
      ids.push_back(rule.id);
    }
    record.results = engine.evaluate_action(action_context_from(session.violation), ids);
    record.timestamp_unix_ms = now_unix_ms();
  }
  const uint64_t evaluated = record.results.size();
  session.history.emplace_back(std::move(record));

  PhaseResult r;
  r.effects.emplace_back(make_metric(Phase::rule_evaluation, ns, evaluated));
  return r;
}

// ---------------------------------------------------------------------------
// Precedent lookup
// ---------------------------------------------------------------------------
PhaseResult run_precedent_lookup(ArbitrationSession& session, const PrecedentManager& precedents,
                                 size_t limit) {
  uint64_t ns = 0;
  PrecedentLookupRecord record;
  {
    ScopeTimer t(ns);
    const ConstitutionalRule* rule = session.primary_rule();
    std::vector<std::string> rule_ids;
    for (const auto& r : session.rules_evaluated) rule_ids.push_back(r.id);

    const auto matches = precedents.find_similar_precedents(
        rule ? rule->category : RuleCategory::code_quality, session.violation.severity,
        {session.violation.description}, rule_ids, limit);

    session.precedents.clear();
    for (const auto& m : matches) {
      session.precedents.push_back(*m.precedent);
      record.precedent_ids.push_back(m.precedent->id);
      record.scores.push_back(m.similarity);
    }
    record.timestamp_unix_ms = now_unix_ms();
  }
  const uint64_t found = record.precedent_ids.size();
  session.history.emplace_back(std::move(record));

  PhaseResult r;
  r.effects.emplace_back(make_metric(Phase::precedent_lookup, ns, found));
  return r;
}

// ---------------------------------------------------------------------------
// Verdict generation
// ---------------------------------------------------------------------------
PhaseResult run_verdict_generation(ArbitrationSession& session, VerdictGenerator& generator,
                                   const std::string& issued_by) {
  uint64_t ns = 0;
  VerdictGenerationResult generated;
  {
    ScopeTimer t(ns);
    generated = generator.generate_verdict(session, issued_by);
  }
  Verdict& v = generated.verdict;
  v.session_id = session.id;
  v.confidence = normalize_confidence(v.confidence);
  if (v.issued_by.empty()) v.issued_by = issued_by;
  seal_verdict(v, recorded_verdicts(session));
  if (v.issued_at_unix_ms == 0) v.issued_at_unix_ms = now_unix_ms();

  record_verdict(session, v);
  session.verdict = v;

  PhaseResult r;
  MetricEffect m = make_metric(Phase::verdict_generation, ns);
  m.duration_ms = std::max<uint64_t>({1, m.duration_ms, generated.generation_time_ms});
  r.effects.emplace_back(m);

  if (v.confidence > kPrecedentConfidenceThreshold) {
    CreatePrecedentEffect p;
    p.verdict   = v;
    p.title     = reported_rule_id(session) + " Violation";
    p.key_facts = {session.violation.description};
    for (const auto& step : v.reasoning) {
      if (!p.reasoning.empty()) p.reasoning += ". ";
      p.reasoning += step.description;
    }
    p.attributes = attributes_for(session, v);
    r.effects.emplace_back(std::move(p));
  }
  return r;
}

// ---------------------------------------------------------------------------
// Waiver evaluation
// ---------------------------------------------------------------------------
const ConstitutionalRule* waiver_rule_for(const ArbitrationSession& session,
                                          const WaiverRequest& request) {
  for (const auto& rule : session.rules_evaluated) {
    if (!request.rule_id.empty() && rule.id == request.rule_id) return &rule;
  }
  return session.primary_rule();
}

PhaseResult run_waiver_evaluation(ArbitrationSession& session, WaiverInterpreter& interpreter,
                                  const WaiverRequest& request, const std::string& decided_by) {
  const ConstitutionalRule* rule = waiver_rule_for(session, request);
  if (!rule) {
    throw ArbitrationError(ErrorCode::invalid_argument, "session has no rule to waive", session.id);
  }

  uint64_t ns = 0;
  WaiverDecision decision;
  {
    ScopeTimer t(ns);
    decision = interpreter.process_waiver(request, *rule, decided_by);
  }
  session.waiver_request  = request;
  session.waiver_decision = decision;
  session.history.emplace_back(WaiverRecord{decision});

  PhaseResult r;
  r.effects.emplace_back(make_metric(Phase::waiver_evaluation, ns));
  return r;
}

// ---------------------------------------------------------------------------
// Appeal review
// ---------------------------------------------------------------------------
PhaseResult run_appeal_review(ArbitrationSession& session, AppealArbitrator& arbitrator,
                              const std::string& appeal_id,
                              const std::vector<std::string>& reviewers) {
  if (!session.verdict) {
    throw ArbitrationError(ErrorCode::no_verdict, "Cannot review appeal without verdict", session.id);
  }

  uint64_t ns = 0;
  AppealDecision decision;
  {
    ScopeTimer t(ns);
    decision = arbitrator.review_appeal(appeal_id, reviewers, session, *session.verdict);
  }

  PhaseResult r;
  if (decision.decision == AppealOutcome::overturned && decision.new_verdict) {
    Verdict& nv = *decision.new_verdict;
    nv.session_id = session.id;
    nv.confidence = normalize_confidence(nv.confidence);
    seal_verdict(nv, recorded_verdicts(session));
    if (nv.issued_at_unix_ms == 0) nv.issued_at_unix_ms = now_unix_ms();

    session.history.emplace_back(
        VerdictSupersededRecord{*session.verdict, nv.id, appeal_id, now_unix_ms()});
    record_verdict(session, nv);
    session.verdict = nv;

    CreatePrecedentEffect p;
    p.verdict   = nv;
    p.title     = reported_rule_id(session) + " Appeal Overturn";
    p.key_facts = {session.violation.description};
    for (const auto& e : nv.evidence) p.key_facts.push_back(e);
    p.reasoning  = decision.reasoning;
    p.attributes = attributes_for(session, nv);
    r.effects.emplace_back(std::move(p));
  }
  session.history.emplace_back(AppealDecisionRecord{decision});

  r.effects.insert(r.effects.begin(), PhaseEffect{make_metric(Phase::appeal_review, ns)});
  return r;
}

}  // namespace tribunal
