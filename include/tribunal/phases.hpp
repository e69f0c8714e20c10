#pragma once

// tribunal/phases.hpp: Arbitration phase functions.
//
// DESIGN:
//   Each phase takes the session it works on plus the collaborator it calls,
//   mutates only that session (results, history records, verdict) and returns
//   the side effects the caller must apply: precedents to create and metrics
//   to record. Phases never change session state; transitions belong to the
//   orchestrator. This keeps every phase testable with plain components and a
//   hand-built session.
//
// INVARIANT: a phase that throws leaves no effects behind. The orchestrator
//   runs phases against a working copy and commits it only on success.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "tribunal/appeal.hpp"
#include "tribunal/observability.hpp"
#include "tribunal/precedent.hpp"
#include "tribunal/rule_engine.hpp"
#include "tribunal/types.hpp"
#include "tribunal/verdict.hpp"
#include "tribunal/waiver.hpp"

namespace tribunal {

// Confidence above which a verdict becomes a precedent (strict).
constexpr double kPrecedentConfidenceThreshold = 0.8;

struct CreatePrecedentEffect {
  Verdict                  verdict;
  std::string              title;
  std::vector<std::string> key_facts;
  std::string              reasoning;
  PrecedentAttributes      attributes;
};

struct MetricEffect {
  Phase    phase{Phase::rule_evaluation};
  uint64_t duration_ns{0};
  uint64_t duration_ms{0};
  uint64_t count{0};       // rules evaluated or precedents found; 0 elsewhere
};

using PhaseEffect = std::variant<CreatePrecedentEffect, MetricEffect>;

struct PhaseResult {
  std::vector<PhaseEffect> effects;

  std::vector<CreatePrecedentEffect> precedent_effects() const;
  std::optional<MetricEffect> metric() const;
};

// Loads every candidate rule into the engine and evaluates the violation.
PhaseResult run_rule_evaluation(ArbitrationSession& session, ConstitutionalRuleEngine& engine);

// Stores up to `limit` similar precedents on the session.
PhaseResult run_precedent_lookup(ArbitrationSession& session, const PrecedentManager& precedents,
                                 size_t limit);

// Generates and stores a verdict. Requests a precedent when the confidence
// exceeds kPrecedentConfidenceThreshold. The metric duration is at least 1ms.
PhaseResult run_verdict_generation(ArbitrationSession& session, VerdictGenerator& generator,
                                   const std::string& issued_by);

// The rule a waiver request is judged against: the session rule named by the
// request, else the reported rule, else the first candidate. Null only when
// the session carries no rules.
const ConstitutionalRule* waiver_rule_for(const ArbitrationSession& session,
                                          const WaiverRequest& request);

PhaseResult run_waiver_evaluation(ArbitrationSession& session, WaiverInterpreter& interpreter,
                                  const WaiverRequest& request, const std::string& decided_by);

// Reviews the appeal. On an overturn the session verdict is replaced, the old
// one is kept as a VerdictSupersededRecord and an "Appeal Overturn"
// precedent is requested.
PhaseResult run_appeal_review(ArbitrationSession& session, AppealArbitrator& arbitrator,
                              const std::string& appeal_id,
                              const std::vector<std::string>& reviewers);

}  // namespace tribunal
