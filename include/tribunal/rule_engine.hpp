#pragma once

// tribunal/rule_engine.hpp: Constitutional rule evaluation.
//
// DESIGN:
//   The engine owns a registry of rules keyed by id. Registration is
//   append-only per id (first registration wins), so a rule that a running
//   session has evaluated can never change underneath it. Evaluation reads the
//   registry and its inputs only; it keeps no per-session state and is safe to
//   call from many sessions at once.
//
// CONDITION GRAMMAR:
//   condition := clause ( "&&" clause )*
//   clause    := key OP literal | key
//   OP        := "===" | "==" | "!==" | "!=" | ">=" | "<=" | ">" | "<"
//   A clause states what a compliant action looks like. A clause that does not
//   hold is "failed"; a clause whose key is missing from the action parameters
//   is "indeterminate". A bare key holds when present and not false/0/empty.
//   Comparison is numeric when both sides parse as numbers, else lexicographic.

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tribunal/types.hpp"

namespace tribunal {

// What the engine evaluates rules against.
struct ActionContext {
  std::string action;                              // the reported rule id
  std::map<std::string, std::string> parameters;   // violation context
  std::vector<std::string> evidence;
  uint64_t timestamp_unix_ms{0};
};

// Builds the evaluation context for a violation. A zero detection time is
// replaced by the current time.
ActionContext action_context_from(const ConstitutionalViolation& violation);

struct Clause {
  std::string text;     // trimmed source text, used in failed/indeterminate lists
  std::string key;
  std::string op;       // empty for a bare key
  std::string literal;  // surrounding quotes removed
};

enum class ClauseOutcome { holds, fails, indeterminate };

std::vector<Clause> parse_condition(const std::string& condition);
ClauseOutcome evaluate_clause(const Clause& clause,
                              const std::map<std::string, std::string>& parameters);

class ConstitutionalRuleEngine {
 public:
  // Returns true if the rule was newly registered, false if the id was known.
  bool load_rule(const ConstitutionalRule& rule);

  bool has_rule(const std::string& rule_id) const;
  size_t rule_count() const;
  std::optional<ConstitutionalRule> get_rule(const std::string& rule_id) const;
  void clear();

  // One result per requested id, in request order.
  std::vector<RuleEvaluationResult> evaluate_action(const ActionContext& action,
                                                    const std::vector<std::string>& rule_ids) const;

 private:
  RuleEvaluationResult evaluate_one(const ConstitutionalRule& rule, const ActionContext& action) const;

  mutable std::shared_mutex mu_;
  std::map<std::string, ConstitutionalRule> rules_;
};

}  // namespace tribunal
