#include "tribunal/rule_engine.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <sstream>

#include "tribunal/jsonlite.hpp"

namespace tribunal {

namespace {

std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string unquote(const std::string& s) {
  if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                        (s.front() == '\'' && s.back() == '\''))) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

std::string lower(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool parse_number(const std::string& s, double& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  out = std::strtod(s.c_str(), &end);
  return end == s.c_str() + s.size();
}

// Longest operators first so ">=" is not read as ">".
constexpr const char* kOperators[] = {"===", "!==", "==", "!=", ">=", "<=", ">", "<"};

}  // namespace

ActionContext action_context_from(const ConstitutionalViolation& violation) {
  ActionContext ctx;
  ctx.action            = violation.rule_id;
  ctx.parameters        = violation.context;
  ctx.evidence          = violation.evidence;
  ctx.timestamp_unix_ms = violation.detected_at_unix_ms ? violation.detected_at_unix_ms : now_unix_ms();
  return ctx;
}

std::vector<Clause> parse_condition(const std::string& condition) {
  std::vector<Clause> out;
  size_t start = 0;
  while (start <= condition.size()) {
    size_t pos = condition.find("&&", start);
    const std::string raw = trim(condition.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
    if (!raw.empty()) {
      Clause c;
      c.text = raw;
      size_t op_pos = std::string::npos;
      for (const char* op : kOperators) {
        const size_t p = raw.find(op);
        if (p != std::string::npos && (op_pos == std::string::npos || p < op_pos)) {
          op_pos = p;
          c.op = op;
        }
      }
      if (op_pos == std::string::npos) {
        c.key = raw;
      } else {
        c.key     = trim(raw.substr(0, op_pos));
        c.literal = unquote(trim(raw.substr(op_pos + c.op.size())));
      }
      out.push_back(std::move(c));
    }
    if (pos == std::string::npos) break;
    start = pos + 2;
  }
  return out;
}

ClauseOutcome evaluate_clause(const Clause& clause,
                              const std::map<std::string, std::string>& parameters) {
  auto it = parameters.find(clause.key);
  if (it == parameters.end()) return ClauseOutcome::indeterminate;
  const std::string value = unquote(it->second);

  if (clause.op.empty()) {
    const bool truthy = !value.empty() && value != "false" && value != "0";
    return truthy ? ClauseOutcome::holds : ClauseOutcome::fails;
  }

  double lhs = 0.0;
  double rhs = 0.0;
  const bool numeric = parse_number(value, lhs) && parse_number(clause.literal, rhs);
  int cmp = 0;
  if (numeric) {
    cmp = (lhs < rhs) ? -1 : (lhs > rhs ? 1 : 0);
  } else {
    cmp = value.compare(clause.literal);
    cmp = (cmp < 0) ? -1 : (cmp > 0 ? 1 : 0);
  }

  bool holds = false;
  if (clause.op == "===" || clause.op == "==") holds = (cmp == 0);
  else if (clause.op == "!==" || clause.op == "!=") holds = (cmp != 0);
  else if (clause.op == ">=") holds = (cmp >= 0);
  else if (clause.op == "<=") holds = (cmp <= 0);
  else if (clause.op == ">") holds = (cmp > 0);
  else if (clause.op == "<") holds = (cmp < 0);
  return holds ? ClauseOutcome::holds : ClauseOutcome::fails;
}

// ---------------------------------------------------------------------------
// ConstitutionalRuleEngine
// ---------------------------------------------------------------------------

bool ConstitutionalRuleEngine::load_rule(const ConstitutionalRule& rule) {
  std::unique_lock lk(mu_);
  return rules_.emplace(rule.id, rule).second;
}

bool ConstitutionalRuleEngine::has_rule(const std::string& rule_id) const {
  std::shared_lock lk(mu_);
  return rules_.contains(rule_id);
}

size_t ConstitutionalRuleEngine::rule_count() const {
  std::shared_lock lk(mu_);
  return rules_.size();
}

std::optional<ConstitutionalRule> ConstitutionalRuleEngine::get_rule(const std::string& rule_id) const {
  std::shared_lock lk(mu_);
  auto it = rules_.find(rule_id);
  if (it == rules_.end()) return std::nullopt;
  return it->second;
}

void ConstitutionalRuleEngine::clear() {
  std::unique_lock lk(mu_);
  rules_.clear();
}

std::vector<RuleEvaluationResult> ConstitutionalRuleEngine::evaluate_action(
    const ActionContext& action, const std::vector<std::string>& rule_ids) const {
  std::vector<RuleEvaluationResult> out;
  out.reserve(rule_ids.size());
  std::shared_lock lk(mu_);
  for (const auto& id : rule_ids) {
    auto it = rules_.find(id);
    if (it == rules_.end()) {
      RuleEvaluationResult r;
      r.rule_id     = id;
      r.explanation = "Rule " + id + " is not loaded";
      out.push_back(std::move(r));
      continue;
    }
    out.push_back(evaluate_one(it->second, action));
  }
  return out;
}

RuleEvaluationResult ConstitutionalRuleEngine::evaluate_one(const ConstitutionalRule& rule,
                                                           const ActionContext& action) const {
  RuleEvaluationResult r;
  r.rule_id = rule.id;
  r.loaded  = true;

  const uint64_t ts = action.timestamp_unix_ms;
  const bool started = rule.effective_from_unix_ms == 0 || ts >= rule.effective_from_unix_ms;
  const bool expired = rule.expires_at_unix_ms != 0 && ts >= rule.expires_at_unix_ms;
  if (!started || expired) {
    r.explanation = "Rule " + rule.id + " is not in effect at " + std::to_string(ts);
    return r;
  }
  r.applicable = true;

  const auto clauses = parse_condition(rule.condition);
  for (const auto& c : clauses) {
    switch (evaluate_clause(c, action.parameters)) {
      case ClauseOutcome::holds: break;
      case ClauseOutcome::fails: r.failed_clauses.push_back(c.text); break;
      case ClauseOutcome::indeterminate: r.indeterminate_clauses.push_back(c.text); break;
    }
  }

  for (const auto& required : rule.required_evidence) {
    const std::string needle = lower(required);
    const bool found = std::any_of(action.evidence.begin(), action.evidence.end(),
                                   [&](const std::string& e) { return lower(e).find(needle) != std::string::npos; });
    if (!found) r.missing_evidence.push_back(required);
  }

  const bool reported = rule.id == action.action;
  if (clauses.empty()) {
    r.violated = reported;
    r.strength = reported ? 1.0 : 0.0;
  } else {
    r.violated = !r.failed_clauses.empty() || (reported && !r.indeterminate_clauses.empty());
    if (r.violated) {
      const double weighted = static_cast<double>(r.failed_clauses.size()) +
                              0.5 * static_cast<double>(r.indeterminate_clauses.size());
      r.strength = std::clamp(weighted / static_cast<double>(clauses.size()), 0.0, 1.0);
    }
  }

  std::ostringstream o;
  if (!r.violated) {
    o << "Rule " << rule.id << " satisfied";
    if (!r.indeterminate_clauses.empty()) {
      o << " (" << r.indeterminate_clauses.size() << " clause(s) indeterminate)";
    }
  } else if (clauses.empty()) {
    o << "Rule " << rule.id << " reported as violated";
  } else {
    o << "Rule " << rule.id << " violated: " << r.failed_clauses.size() << " of "
      << clauses.size() << " clause(s) failed, " << r.indeterminate_clauses.size()
      << " indeterminate";
  }
  o << ", strength " << jsonlite::format_double(r.strength);
  r.explanation = o.str();
  return r;
}

}  // namespace tribunal
