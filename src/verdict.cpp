#include "tribunal/verdict.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>

#include "tribunal/hash.hpp"
#include "tribunal/jsonlite.hpp"

namespace tribunal {

namespace {

std::string fmt(double d) { return jsonlite::format_double(d); }

size_t prior_verdict_count(const ArbitrationSession& session) {
  return static_cast<size_t>(std::count_if(session.history.begin(), session.history.end(),
                                           [](const SessionEvent& ev) {
                                             return std::holds_alternative<VerdictRecord>(ev);
                                           }));
}

}  // namespace

bool VerdictWeights::sums_to_one() const {
  return std::fabs(rule + precedent + evidence - 1.0) <= 1e-6;
}

double normalize_confidence(double c) {
  c = std::clamp(c, 0.0, 1.0);
  return std::round(c * 10000.0) / 10000.0;
}

void seal_verdict(Verdict& verdict, size_t prior_verdicts) {
  verdict.id     = "VERDICT-" + verdict.session_id + "-" + std::to_string(prior_verdicts + 1);
  verdict.digest = verdict_hash(verdict.canonical_json());
}

WeightedVerdictGenerator::WeightedVerdictGenerator(VerdictWeights weights) : weights_(weights) {}

VerdictGenerationResult WeightedVerdictGenerator::generate_verdict(const ArbitrationSession& session,
                                                                   const std::string& issued_by) {
  const auto started = std::chrono::steady_clock::now();

  Verdict v;
  v.session_id = session.id;
  v.issued_by  = issued_by;
  v.evidence   = session.evidence;

  const auto evaluation = session.rule_evaluation_results();
  const std::vector<RuleEvaluationResult> results =
      evaluation ? evaluation->results : std::vector<RuleEvaluationResult>{};

  // --- Rule component -------------------------------------------------------
  std::vector<const RuleEvaluationResult*> violated;
  std::vector<std::string> applicable_ids;
  size_t required_total = 0;
  std::vector<std::string> missing;
  for (const auto& r : results) {
    if (!r.applicable) continue;
    applicable_ids.push_back(r.rule_id);
    if (r.violated) violated.push_back(&r);
    for (const auto& rule : session.rules_evaluated) {
      if (rule.id == r.rule_id) required_total += rule.required_evidence.size();
    }
    for (const auto& m : r.missing_evidence) {
      if (std::find(missing.begin(), missing.end(), m) == missing.end()) missing.push_back(m);
    }
  }
  size_t missing_total = 0;
  for (const auto& r : results) {
    if (r.applicable) missing_total += r.missing_evidence.size();
  }

  double rule_component = 0.0;
  for (const auto* r : violated) rule_component += r->strength;
  if (!violated.empty()) rule_component /= static_cast<double>(violated.size());

  for (const auto* r : violated) v.rules_applied.push_back(r->rule_id);
  if (v.rules_applied.empty()) v.rules_applied = applicable_ids;

  // --- Precedent component --------------------------------------------------
  const ConstitutionalRule* primary = session.primary_rule();
  double agreement_sum = 0.0;
  for (const auto& p : session.precedents) {
    v.precedents.push_back(p.id);
    if (!primary || p.category != primary->category) {
      agreement_sum -= 1.0;
      continue;
    }
    const int d = severity_distance(p.severity, session.violation.severity);
    if (d == 0) agreement_sum += 1.0;
    else if (d == 1) agreement_sum += 0.5;
  }
  const double mean_agreement =
      session.precedents.empty() ? 0.0 : agreement_sum / static_cast<double>(session.precedents.size());
  const double precedent_component = 0.5 + 0.5 * mean_agreement;

  // --- Evidence component ---------------------------------------------------
  const double missing_ratio =
      required_total == 0 ? 0.0 : static_cast<double>(missing_total) / static_cast<double>(required_total);
  const double evidence_component =
      std::min(1.0, static_cast<double>(session.evidence.size()) / 3.0) * (1.0 - 0.5 * missing_ratio);

  v.confidence = normalize_confidence(weights_.rule * rule_component +
                                      weights_.precedent * precedent_component +
                                      weights_.evidence * evidence_component);

  // --- Outcome and conditions -----------------------------------------------
  if (violated.empty()) {
    v.outcome = VerdictOutcome::dismissed;
  } else if (v.confidence < 0.6 || !missing.empty()) {
    v.outcome = VerdictOutcome::conditional;
  } else {
    v.outcome = VerdictOutcome::confirmed;
  }

  if (v.outcome != VerdictOutcome::dismissed) {
    for (const auto& m : missing) v.conditions.push_back("Submit missing evidence: " + m);
    if (session.violation.severity == ViolationSeverity::critical) {
      v.conditions.push_back("Escalate to governance review");
    }
    if (v.outcome == VerdictOutcome::conditional && v.conditions.empty()) {
      v.conditions.push_back("Provide corroborating evidence");
    }
  }

  // --- Reasoning trail ------------------------------------------------------
  uint32_t index = 1;
  for (const auto& r : results) {
    double contribution = 0.0;
    if (r.applicable && r.violated && !violated.empty()) {
      contribution = weights_.rule * r.strength / static_cast<double>(violated.size());
    }
    v.reasoning.push_back(ReasoningStep{index++, r.explanation, contribution});
  }
  {
    std::ostringstream o;
    o << "Precedent analysis: " << session.precedents.size() << " precedent(s), mean agreement "
      << fmt(mean_agreement) << ", P=" << fmt(precedent_component);
    v.reasoning.push_back(ReasoningStep{index++, o.str(), weights_.precedent * precedent_component});
  }
  {
    std::ostringstream o;
    o << "Evidence completeness: " << session.evidence.size() << " item(s), " << missing_total
      << " of " << required_total << " required item(s) missing, E=" << fmt(evidence_component);
    v.reasoning.push_back(ReasoningStep{index++, o.str(), weights_.evidence * evidence_component});
  }
  {
    std::ostringstream o;
    o << "Confidence synthesis: " << fmt(weights_.rule) << " x R(" << fmt(rule_component) << ") + "
      << fmt(weights_.precedent) << " x P(" << fmt(precedent_component) << ") + "
      << fmt(weights_.evidence) << " x E(" << fmt(evidence_component) << ") = "
      << fmt(v.confidence) << ", outcome " << to_string(v.outcome);
    v.reasoning.push_back(ReasoningStep{index++, o.str(), v.confidence});
  }

  seal_verdict(v, prior_verdict_count(session));
  v.issued_at_unix_ms = now_unix_ms();

  VerdictGenerationResult out;
  out.verdict = std::move(v);
  out.generation_time_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)
          .count());
  return out;
}

}  // namespace tribunal
