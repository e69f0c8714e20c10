#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "tribunal/appeal.hpp"
#include "tribunal/audit.hpp"
#include "tribunal/case_file.hpp"
#include "tribunal/config.hpp"
#include "tribunal/hash.hpp"
#include "tribunal/jsonlite.hpp"
#include "tribunal/observability.hpp"
#include "tribunal/orchestrator.hpp"
#include "tribunal/phases.hpp"
#include "tribunal/precedent.hpp"
#include "tribunal/rule_engine.hpp"
#include "tribunal/state_machine.hpp"
#include "tribunal/types.hpp"
#include "tribunal/verdict.hpp"
#include "tribunal/version.hpp"
#include "tribunal/waiver.hpp"

namespace fs = std::filesystem;
using namespace tribunal;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

bool has_item(const std::vector<std::string>& items, const std::string& item) {
  return std::find(items.begin(), items.end(), item) != items.end();
}

// Runs fn and returns the ArbitrationError code it raised, or none.
template <typename Fn>
ErrorCode error_code_of(Fn fn) {
  try {
    fn();
  } catch (const ArbitrationError& e) {
    return e.code();
  }
  return ErrorCode::none;
}

// ---------------------------------------------------------------------------
// Fixtures
// ---------------------------------------------------------------------------

ConstitutionalRule make_rule(const std::string& id, RuleCategory category, ViolationSeverity severity,
                             const std::string& condition) {
  ConstitutionalRule r;
  r.id        = id;
  r.title     = id + " title";
  r.category  = category;
  r.severity  = severity;
  r.condition = condition;
  return r;
}

// Reported against R-TEST: both clauses of R-TEST fail, R-DOCS is indeterminate.
ConstitutionalViolation make_violation(ViolationSeverity severity = ViolationSeverity::medium) {
  ConstitutionalViolation v;
  v.id          = "V-1";
  v.rule_id     = "R-TEST";
  v.violator    = "agent-7";
  v.severity    = severity;
  v.description = "Merged change without passing tests";
  v.context     = {{"tests_passed", "false"}, {"coverage", "55"}};
  v.evidence    = {"ci-run-1842", "coverage-report", "review-thread"};
  v.detected_at_unix_ms = now_unix_ms();
  return v;
}

std::vector<ConstitutionalRule> make_rules() {
  return {make_rule("R-TEST", RuleCategory::testing, ViolationSeverity::medium,
                    "tests_passed == true && coverage >= 80"),
          make_rule("R-DOCS", RuleCategory::documentation, ViolationSeverity::low, "docs_updated")};
}

// Returns a verdict with a fixed confidence; the phase seals it.
class FixedConfidenceGenerator : public VerdictGenerator {
 public:
  explicit FixedConfidenceGenerator(double confidence) : confidence_(confidence) {}

  VerdictGenerationResult generate_verdict(const ArbitrationSession& session,
                                           const std::string& issued_by) override {
    VerdictGenerationResult r;
    r.verdict.session_id    = session.id;
    r.verdict.outcome       = VerdictOutcome::confirmed;
    r.verdict.confidence    = confidence_;
    r.verdict.issued_by     = issued_by;
    r.verdict.evidence      = session.evidence;
    r.verdict.rules_applied = {session.violation.rule_id};
    r.verdict.reasoning     = {ReasoningStep{1, "fixed confidence", confidence_}};
    return r;
  }

 private:
  double confidence_;
};

ArbitrationConfig test_config() {
  ArbitrationConfig c;
  c.max_concurrent_sessions = 16;
  return c;
}

OrchestratorComponents fixed_components(double confidence) {
  OrchestratorComponents c;
  c.verdict_generator = std::make_shared<FixedConfidenceGenerator>(confidence);
  return c;
}

// Start, evaluate and generate a verdict; leaves the session in VERDICT_GENERATION.
std::string session_with_verdict(ArbitrationOrchestrator& orch) {
  const auto s = orch.start_session(make_violation(), make_rules(), {"agent-7", "maintainer"});
  orch.evaluate_rules(s.id);
  orch.generate_verdict(s.id, "arbiter");
  return s.id;
}

WaiverRequest make_waiver_request(const std::string& rule_id, size_t evidence_count,
                                  int64_t duration_ms = 24LL * 60 * 60 * 1000) {
  WaiverRequest w;
  w.id            = "WAIVER-" + rule_id;
  w.rule_id       = rule_id;
  w.requested_by  = "agent-7";
  w.justification = "Hotfix for a production outage, tests follow tomorrow";
  for (size_t i = 0; i < evidence_count; ++i) w.evidence.push_back("incident-" + std::to_string(i));
  w.requested_duration_ms = duration_ms;
  return w;
}

std::string temp_path(const std::string& name) {
  return (fs::temp_directory_path() / name).string();
}

// ============================================================================
// Hashing, JSON and versioning
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "{\"id\":\"x\"}";
  expect(hash_domain("verdict:", payload) != hash_domain("precedent:", payload),
         "domains must separate digests");
  expect(hash_domain("verdict:", payload) != blake3_hex(payload), "domain prefix must change digest");
  expect(is_hex_digest(verdict_hash(payload)), "verdict hash is 64 hex chars");
  expect(!is_hex_digest("ABC"), "short string is not a digest");
}

void test_json_strict_parse() {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse("{\"b\":1,\"a\":\"x\",\"c\":[true,null]}", &err);
  expect(!err, "valid document parses");
  expect(jsonlite::get_u64(obj, "b") == 1, "integer extracted");
  expect(jsonlite::get_string(obj, "a") == "x", "string extracted");

  jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");

  jsonlite::parse("{\"a\":", &err);
  expect(err.has_value(), "truncated document rejected");

  auto pair = jsonlite::parse("{\"s\":\"\\ud83d\\ude00\"}", &err);
  expect(!err && jsonlite::get_string(pair, "s") == "\xF0\x9F\x98\x80", "surrogate pair decodes to one code point");
  jsonlite::parse("{\"s\":\"\\ud83d\"}", &err);
  expect(err.has_value(), "lone high surrogate rejected");
  jsonlite::parse("{\"s\":\"\\ude00\"}", &err);
  expect(err.has_value(), "lone low surrogate rejected");

  auto nums = jsonlite::parse("{\"huge\":1e300,\"neg\":-42}", &err);
  expect(!err, "numbers parse");
  expect(jsonlite::get_i64(nums, "huge", 7) == 7, "out-of-range number falls back to the default");
  expect(jsonlite::get_i64(nums, "neg", 0) == -42, "negative integer");
}

void test_version_manifest() {
  const auto m = version::current_manifest();
  expect(m.hash_primitive == "blake3", "hash primitive is blake3");
  expect(m.config_schema == version::CONFIG_SCHEMA_VERSION, "config schema version reported");
  expect(contains(version::manifest_to_json(m), "\"engine_abi\""), "manifest JSON carries ABI");
  expect(version::check_config_version(1).ok, "config version 1 accepted");
  expect(!version::check_config_version(2).ok, "config version 2 rejected");
}

// ============================================================================
// Domain types
// ============================================================================

void test_enum_strings() {
  expect(to_string(ErrorCode::session_limit_exceeded) == "SESSION_LIMIT_EXCEEDED", "error code string");
  expect(to_string(ArbitrationState::appeal_review) == "APPEAL_REVIEW", "state string");
  expect(state_from_string("VERDICT_GENERATION") == ArbitrationState::verdict_generation,
         "state round trip");
  expect(severity_from_string("major") == ViolationSeverity::high, "major alias");
  expect(severity_from_string("minor") == ViolationSeverity::low, "minor alias");
  expect(severity_from_string("moderate") == ViolationSeverity::medium, "moderate alias");
  expect(!severity_from_string("catastrophic"), "unknown severity rejected");
  expect(category_from_string("resource_usage") == RuleCategory::resource_usage, "category parse");
  expect(ViolationSeverity::low < ViolationSeverity::critical, "severity ordering");
  expect(severity_distance(ViolationSeverity::low, ViolationSeverity::high) == 2, "severity distance");
}

void test_session_accessors() {
  ArbitrationSession s;
  s.rules_evaluated = make_rules();
  s.violation       = make_violation();
  expect(s.primary_rule() && s.primary_rule()->id == "R-TEST", "primary rule is the reported rule");

  s.violation.rule_id = "R-UNKNOWN";
  expect(s.primary_rule() && s.primary_rule()->id == "R-TEST", "primary rule falls back to first");

  s.history.emplace_back(StateTransition{ArbitrationState::initialized, ArbitrationState::rule_evaluation, 1});
  s.history.emplace_back(ErrorRecord{"boom", "INVALID_STATE", ArbitrationState::rule_evaluation, 2});
  expect(s.transitions().size() == 1, "one transition recorded");
  expect(s.error() && s.error()->message == "boom", "error accessor");
  expect(!s.appeal_decision(), "no appeal decision yet");
}

// ============================================================================
// Rule engine
// ============================================================================

void test_condition_parsing() {
  const auto clauses = parse_condition("env === \"prod\" && coverage >= 80 && reviewed");
  expect(clauses.size() == 3, "three clauses");
  expect(clauses[0].key == "env" && clauses[0].op == "===" && clauses[0].literal == "prod",
         "strict equality clause with quotes removed");
  expect(clauses[1].op == ">=", "comparison operator");
  expect(clauses[2].key == "reviewed" && clauses[2].op.empty(), "bare key clause");
  expect(parse_condition("").empty(), "empty condition has no clauses");
}

void test_clause_evaluation() {
  const auto ge = parse_condition("coverage >= 80")[0];
  expect(evaluate_clause(ge, {{"coverage", "100"}}) == ClauseOutcome::holds,
         "numeric comparison, not lexicographic");
  expect(evaluate_clause(ge, {{"coverage", "79.5"}}) == ClauseOutcome::fails, "below threshold fails");
  expect(evaluate_clause(ge, {}) == ClauseOutcome::indeterminate, "missing key is indeterminate");

  const auto bare = parse_condition("reviewed")[0];
  expect(evaluate_clause(bare, {{"reviewed", "true"}}) == ClauseOutcome::holds, "truthy bare key");
  expect(evaluate_clause(bare, {{"reviewed", "0"}}) == ClauseOutcome::fails, "0 is falsy");
  expect(evaluate_clause(bare, {{"reviewed", ""}}) == ClauseOutcome::fails, "empty is falsy");
}

void test_rule_evaluation_results() {
  ConstitutionalRuleEngine engine;
  auto rules = make_rules();
  rules[0].required_evidence = {"coverage-report", "security-scan"};
  ConstitutionalRule future = make_rule("R-FUTURE", RuleCategory::security, ViolationSeverity::high, "x");
  future.effective_from_unix_ms = now_unix_ms() + 3600 * 1000;
  rules.push_back(future);
  for (const auto& r : rules) engine.load_rule(r);

  const auto results = engine.evaluate_action(action_context_from(make_violation()),
                                              {"R-TEST", "R-DOCS", "R-FUTURE", "R-MISSING"});
  expect(results.size() == 4, "one result per requested id");

  expect(results[0].applicable && results[0].violated, "reported rule violated");
  expect(results[0].failed_clauses.size() == 2, "both clauses failed");
  expect(near(results[0].strength, 1.0), "all clauses failed -> strength 1");
  expect(results[0].missing_evidence.size() == 1 && results[0].missing_evidence[0] == "security-scan",
         "evidence matched by substring; security-scan missing");

  expect(results[1].applicable && !results[1].violated, "indeterminate non-reported rule not violated");
  expect(results[1].indeterminate_clauses.size() == 1, "docs clause indeterminate");
  expect(near(results[1].strength, 0.0), "non-violated strength is 0");

  expect(results[2].loaded && !results[2].applicable, "future rule not in effect");
  expect(!results[3].loaded && !results[3].applicable, "unknown rule reported as not loaded");
}

void test_reported_rule_indeterminate() {
  ConstitutionalRuleEngine engine;
  engine.load_rule(make_rule("R-DOCS", RuleCategory::documentation, ViolationSeverity::low,
                             "docs_updated && changelog"));
  ActionContext ctx;
  ctx.action            = "R-DOCS";
  ctx.parameters        = {{"changelog", "yes"}};
  ctx.timestamp_unix_ms = now_unix_ms();
  const auto r = engine.evaluate_action(ctx, {"R-DOCS"})[0];
  expect(r.violated, "reported rule with indeterminate clause is violated");
  expect(near(r.strength, 0.25), "strength = (0 + 0.5 * 1) / 2");
}

void test_rule_registration_first_wins() {
  ConstitutionalRuleEngine engine;
  auto r = make_rule("R-1", RuleCategory::security, ViolationSeverity::high, "a");
  expect(engine.load_rule(r), "first load registers");
  r.condition = "b";
  expect(!engine.load_rule(r), "second load is ignored");
  expect(engine.get_rule("R-1")->condition == "a", "first registration wins");
  expect(engine.rule_count() == 1 && engine.has_rule("R-1"), "registry size");
  engine.clear();
  expect(engine.rule_count() == 0, "clear empties registry");
}

// ============================================================================
// Precedents
// ============================================================================

Verdict sample_verdict(const std::string& id, std::vector<std::string> rules) {
  Verdict v;
  v.id            = id;
  v.session_id    = "S-PREC";
  v.confidence    = 0.9;
  v.rules_applied = std::move(rules);
  return v;
}

PrecedentAttributes attrs(RuleCategory c, ViolationSeverity s) {
  PrecedentAttributes a;
  a.category = c;
  a.severity = s;
  return a;
}

void test_precedent_creation_and_snapshot() {
  PrecedentManager pm;
  const auto before = pm.snapshot();
  auto p1 = pm.create_precedent(sample_verdict("VERDICT-A-1", {"R-SEC"}), "Secret in repository",
                                {"credential leaked in commit"}, "confirmed leak",
                                attrs(RuleCategory::security, ViolationSeverity::high));
  expect(p1->id == "PREC-1" && p1->sequence == 1, "first precedent id");
  expect(is_hex_digest(p1->digest), "precedent digest");
  expect(p1->source_verdict_id == "VERDICT-A-1", "source verdict recorded");
  expect(before->empty(), "earlier snapshot never sees later precedents");
  expect(pm.snapshot()->size() == 1, "new snapshot sees the precedent");
  expect(pm.get_precedent("PREC-1").has_value(), "lookup by id");
  expect(!pm.get_precedent("PREC-9").has_value(), "unknown id");
}

void test_precedent_similarity() {
  PrecedentManager pm;
  pm.create_precedent(sample_verdict("VERDICT-A-1", {"R-SEC"}), "Secret in repository",
                      {"credential leaked in commit"}, "leak",
                      attrs(RuleCategory::security, ViolationSeverity::high));
  pm.create_precedent(sample_verdict("VERDICT-B-1", {"R-PERF"}), "Slow endpoint",
                      {"latency regression"}, "slow",
                      attrs(RuleCategory::performance, ViolationSeverity::low));

  const auto matches = pm.find_similar_precedents(RuleCategory::security, ViolationSeverity::high,
                                                  {"credential leaked"}, {"R-SEC"}, 5);
  expect(matches.size() == 1, "dissimilar precedent filtered by threshold");
  expect(matches[0].precedent->id == "PREC-1", "matching precedent returned");
  expect(matches[0].similarity > 0.8 && matches[0].similarity <= 1.0, "high similarity score");
  expect(!matches[0].matching_factors.empty(), "matching factors listed");

  expect(pm.overrule_precedent("PREC-1", "PREC-2", "superseded"), "overrule known precedent");
  expect(!pm.is_valid("PREC-1"), "overruled precedent invalid");
  expect(pm.overruled_by("PREC-1") == std::optional<std::string>("PREC-2"), "overruled_by recorded");
  expect(pm.find_similar_precedents(RuleCategory::security, ViolationSeverity::high, {"credential"},
                                    {"R-SEC"}, 5)
             .empty(),
         "overruled precedents excluded from search");
  expect(pm.get_precedent("PREC-1")->title == "Secret in repository", "record itself never mutated");
}

void test_precedent_applicability() {
  PrecedentManager pm;
  auto p = pm.create_precedent(sample_verdict("VERDICT-A-1", {"R-SEC"}), "Leak", {"leak"}, "r",
                               attrs(RuleCategory::security, ViolationSeverity::high));
  auto exact = pm.assess_applicability(*p, RuleCategory::security, ViolationSeverity::high);
  expect(exact.applicable && near(exact.confidence, 0.9), "exact match confidence 0.9");

  auto step = pm.assess_applicability(*p, RuleCategory::security, ViolationSeverity::medium);
  expect(step.applicable && near(step.confidence, 0.65), "one severity step costs 0.25");
  expect(contains(step.reasoning, "Severity mismatch"), "mismatch explained");

  auto other = pm.assess_applicability(*p, RuleCategory::testing, ViolationSeverity::high);
  expect(!other.applicable, "category mismatch not applicable");
}

void test_precedent_search_and_citations() {
  PrecedentManager pm;
  pm.create_precedent(sample_verdict("V-1", {"R-1"}), "First", {"alpha"}, "r",
                      attrs(RuleCategory::testing, ViolationSeverity::low));
  pm.create_precedent(sample_verdict("V-2", {"R-2"}), "Second", {"beta"}, "r",
                      attrs(RuleCategory::testing, ViolationSeverity::low));
  pm.create_precedent(sample_verdict("V-3", {"R-3"}), "Third", {"gamma"}, "r",
                      attrs(RuleCategory::security, ViolationSeverity::low));

  expect(pm.cite_precedent("PREC-1", "PREC-3"), "cite known precedent");
  expect(pm.cite_precedent("PREC-1", "PREC-2"), "second citation");
  expect(!pm.cite_precedent("PREC-42", "PREC-1"), "cite unknown fails");
  expect(pm.citation_count("PREC-1") == 2, "citation count");

  PrecedentQuery q;
  q.categories = {RuleCategory::testing};
  auto recent = pm.search_precedents(q);
  expect(recent.size() == 2 && recent[0].id == "PREC-2", "recency sort, newest first");

  q.sort_by = PrecedentSort::citations;
  auto cited = pm.search_precedents(q);
  expect(cited[0].id == "PREC-1", "citation sort");

  PrecedentQuery kw;
  kw.keywords = {"gamma"};
  expect(pm.search_precedents(kw).size() == 1, "keyword search");

  const auto stats = pm.statistics();
  expect(stats.total == 3 && stats.valid == 3, "statistics totals");
  expect(stats.most_cited_id == "PREC-1", "most cited");
  expect(stats.by_category.at("testing") == 2, "per-category count");
}

// ============================================================================
// Verdicts
// ============================================================================

ArbitrationSession evaluated_session(const std::string& id, std::vector<ConstitutionalRule> rules,
                                     ConstitutionalViolation violation) {
  ArbitrationSession s;
  s.id              = id;
  s.violation       = std::move(violation);
  s.rules_evaluated = std::move(rules);
  s.evidence        = s.violation.evidence;
  ConstitutionalRuleEngine engine;
  run_rule_evaluation(s, engine);
  return s;
}

void test_verdict_confidence_and_outcome() {
  auto s = evaluated_session("S-1", make_rules(), make_violation());
  WeightedVerdictGenerator gen;
  const auto v = gen.generate_verdict(s, "arbiter").verdict;
  // R = 1, P = 0.5 (no precedents), E = 1
  expect(near(v.confidence, 0.9), "0.5*1 + 0.2*0.5 + 0.3*1");
  expect(v.outcome == VerdictOutcome::confirmed, "confirmed outcome");
  expect(v.id == "VERDICT-S-1-1", "verdict id");
  expect(v.rules_applied.size() == 1 && v.rules_applied[0] == "R-TEST", "violated rule applied");
  expect(v.reasoning.size() == 2 + 3, "one step per rule plus three synthesis steps");
  expect(contains(v.reasoning.back().description, "Confidence synthesis"), "synthesis step last");
}

void test_verdict_determinism() {
  auto s = evaluated_session("S-DET", make_rules(), make_violation());
  WeightedVerdictGenerator gen;
  const auto a = gen.generate_verdict(s, "arbiter").verdict;
  const auto b = gen.generate_verdict(s, "arbiter").verdict;
  expect(a.id == b.id, "same id for same state");
  expect(a.digest == b.digest && is_hex_digest(a.digest), "same digest for same state");
  expect(a.canonical_json() == b.canonical_json(), "canonical form stable");
  expect(!contains(a.canonical_json(), "issued_at"), "issued_at excluded from canonical form");
}

void test_verdict_conditional_and_dismissed() {
  auto rules = make_rules();
  rules[0].required_evidence = {"security-scan"};
  auto s = evaluated_session("S-COND", rules, make_violation(ViolationSeverity::critical));
  WeightedVerdictGenerator gen;
  const auto v = gen.generate_verdict(s, "arbiter").verdict;
  expect(v.outcome == VerdictOutcome::conditional, "missing evidence -> conditional");
  expect(has_item(v.conditions, "Submit missing evidence: security-scan"), "missing evidence condition");
  expect(has_item(v.conditions, "Escalate to governance review"), "critical escalation condition");

  auto clean = make_violation();
  clean.context = {{"tests_passed", "true"}, {"coverage", "92"}};
  auto d = gen.generate_verdict(evaluated_session("S-OK", make_rules(), clean), "arbiter").verdict;
  expect(d.outcome == VerdictOutcome::dismissed, "no violated rule -> dismissed");
  expect(d.conditions.empty(), "dismissed verdicts carry no conditions");
}

void test_verdict_weights_validation() {
  VerdictWeights w;
  expect(w.sums_to_one(), "default weights sum to one");
  w.rule = 0.7;
  expect(!w.sums_to_one(), "bad weights detected");
  expect(near(normalize_confidence(1.7), 1.0) && near(normalize_confidence(-0.2), 0.0), "clamped");
  expect(near(normalize_confidence(0.123456), 0.1235), "rounded to 4 decimals");
}

// ============================================================================
// Phase functions
// ============================================================================

void test_phase_precedent_threshold() {
  auto s = evaluated_session("S-PH", make_rules(), make_violation());
  FixedConfidenceGenerator exact(0.8);
  auto at = run_verdict_generation(s, exact, "arbiter");
  expect(at.precedent_effects().empty(), "confidence exactly 0.8 creates no precedent");
  expect(at.metric() && at.metric()->duration_ms >= 1, "verdict metric at least 1ms");

  auto s2 = evaluated_session("S-PH2", make_rules(), make_violation());
  FixedConfidenceGenerator above(0.8001);
  auto over = run_verdict_generation(s2, above, "arbiter");
  const auto effects = over.precedent_effects();
  expect(effects.size() == 1, "confidence above 0.8 requests a precedent");
  expect(effects[0].title == "R-TEST Violation", "precedent title");
  expect(effects[0].attributes.category == RuleCategory::testing, "category from first rule");
  expect(s2.verdict && s2.verdict->id == "VERDICT-S-PH2-1", "phase seals the verdict");
}

void test_phase_rule_evaluation_records() {
  ArbitrationSession s;
  s.id              = "S-RE";
  s.violation       = make_violation();
  s.rules_evaluated = make_rules();
  ConstitutionalRuleEngine engine;
  auto r = run_rule_evaluation(s, engine);
  expect(engine.rule_count() == 2, "phase loads candidate rules");
  expect(s.rule_evaluation_results() && s.rule_evaluation_results()->results.size() == 2,
         "evaluation record stored");
  expect(r.metric() && r.metric()->count == 2, "rules evaluated count");
  expect(s.state == ArbitrationState::initialized, "phases never change state");
}

void test_phase_waiver_rule_selection() {
  ArbitrationSession s;
  s.violation       = make_violation();
  s.rules_evaluated = make_rules();
  expect(waiver_rule_for(s, make_waiver_request("R-DOCS", 2))->id == "R-DOCS", "named rule");
  expect(waiver_rule_for(s, make_waiver_request("R-NONE", 2))->id == "R-TEST", "falls back to reported");
  s.rules_evaluated.clear();
  expect(waiver_rule_for(s, make_waiver_request("R-DOCS", 2)) == nullptr, "no rules -> null");
}

// ============================================================================
// Waivers
// ============================================================================

constexpr uint64_t kNow = 1'700'000'000'000ULL;
constexpr int64_t kDay  = 24LL * 60 * 60 * 1000;

void test_waiver_rejections() {
  WaiverInterpreter wi;
  auto rule = make_rule("R-SEC", RuleCategory::security, ViolationSeverity::high, "");
  rule.waivable = false;
  auto d = wi.process_waiver(make_waiver_request("R-SEC", 3), rule, "board", kNow);
  expect(d.status == WaiverStatus::rejected && near(d.confidence, 1.0), "non-waivable rejected");
  expect(contains(d.reasoning, "not waivable"), "non-waivable reasoning");

  rule.waivable = true;
  auto req = make_waiver_request("R-SEC", 3);
  req.justification = "because";
  d = wi.process_waiver(req, rule, "board", kNow);
  expect(d.status == WaiverStatus::rejected, "short justification rejected");
  expect(contains(d.reasoning, "Insufficient justification"), "justification reasoning");
  expect(!d.expires_at_unix_ms, "rejected waivers never expire");

  WaiverInterpreterConfig strict;
  strict.allow_conditional_waivers = false;
  WaiverInterpreter wi2(strict);
  d = wi2.process_waiver(make_waiver_request("R-SEC", 1), rule, "board", kNow);
  expect(d.status == WaiverStatus::rejected && contains(d.reasoning, "Insufficient evidence"),
         "insufficient evidence rejected when conditionals disabled");
}

void test_waiver_approvals() {
  WaiverInterpreter wi;
  auto rule = make_rule("R-PERF", RuleCategory::performance, ViolationSeverity::medium, "");
  auto partial = wi.process_waiver(make_waiver_request("R-PERF", 1), rule, "board", kNow);
  expect(partial.status == WaiverStatus::partially_approved, "too little evidence -> partial");
  expect(contains(partial.reasoning, "Conditional approval"), "conditional reasoning");
  expect(has_item(partial.conditions, "Provide 1 additional supporting evidence item(s)"),
         "evidence condition");
  expect(partial.expires_at_unix_ms == static_cast<int64_t>(kNow) + kDay, "expiry from duration");

  auto critical = make_rule("R-CRIT", RuleCategory::security, ViolationSeverity::critical, "");
  auto long_req = make_waiver_request("R-CRIT", 2, 30 * kDay);
  auto d = wi.process_waiver(long_req, critical, "board", kNow);
  expect(d.status == WaiverStatus::approved, "long waiver still approved");
  expect(d.approved_duration_ms == 7 * kDay, "duration cut to maximum");
  expect(contains(d.reasoning, "reduced duration"), "reduced duration reasoning");
  expect(near(d.confidence, 0.8), "reduced duration lowers confidence");
  expect(has_item(d.conditions, "Submit daily progress reports"), "critical rules report daily");

  auto dup = wi.process_waiver(make_waiver_request("R-CRIT", 3), critical, "board", kNow + 1);
  expect(dup.status == WaiverStatus::rejected && contains(dup.reasoning, "Active waiver already exists"),
         "second waiver for an active rule rejected");
  expect(wi.statistics().approved_count == 2 && wi.statistics().rejected_count == 1, "statistics");
}

void test_waiver_ledger() {
  WaiverInterpreter wi;
  auto rule = make_rule("R-PERF", RuleCategory::performance, ViolationSeverity::medium, "");
  wi.process_waiver(make_waiver_request("R-PERF", 2, kDay), rule, "board", kNow);
  expect(wi.is_waiver_active("R-PERF", kNow + 1), "active within duration");
  expect(!wi.is_waiver_active("R-PERF", kNow + kDay), "expired at expiry time");
  expect(wi.active_waivers(kNow + 1).size() == 1, "active list");

  auto ext = wi.extend_waiver("R-PERF", kDay, "lead", "more time", kNow + 1);
  expect(ext && ext->approved_duration_ms == 2 * kDay, "extension applied");
  expect(!wi.extend_waiver("R-PERF", 10 * kDay, "lead", "too long", kNow + 1), "extension over max refused");
  expect(!wi.extend_waiver("R-NONE", kDay, "lead", "none", kNow), "extension of unknown refused");

  expect(wi.revoke_waiver("R-PERF", "lead", "fixed early"), "revoke active waiver");
  expect(!wi.is_waiver_active("R-PERF", kNow + 1), "revoked waiver inactive");
  expect(!wi.revoke_waiver("R-PERF", "lead", "again"), "revoke twice fails");
  expect(wi.statistics().revoked_count == 1, "revocation in history");

  wi.process_waiver(make_waiver_request("R-PERF", 2, 1000), rule, "board", kNow);
  expect(wi.cleanup_expired(kNow + 5000) == 1, "cleanup removes expired waiver");
  wi.clear();
  expect(wi.history().empty(), "clear empties history");
}

void test_waiver_negative_duration() {
  WaiverInterpreter wi;
  auto rule = make_rule("R-PERF", RuleCategory::performance, ViolationSeverity::medium, "");
  auto d = wi.process_waiver(make_waiver_request("R-PERF", 3, -60000), rule, "board", kNow);
  expect(d.status == WaiverStatus::rejected, "negative duration rejected");
  expect(contains(d.reasoning, "Invalid duration"), "invalid duration reasoning");
  expect(!d.expires_at_unix_ms && d.approved_duration_ms == 0, "nothing granted");
  expect(!wi.is_waiver_active("R-PERF", kNow), "no active waiver");

  auto unbounded = wi.process_waiver(make_waiver_request("R-PERF", 3, 0), rule, "board", kNow);
  expect(unbounded.status == WaiverStatus::approved && unbounded.approved_duration_ms == 7 * kDay,
         "zero duration means the maximum");
  expect(!wi.extend_waiver("R-PERF", -kDay, "lead", "shrink", kNow + 1), "negative extension refused");
  expect(wi.active_waiver("R-PERF", kNow + 1)->approved_duration_ms == 7 * kDay, "ledger unchanged");
}

void test_waiver_auto_revoke() {
  WaiverInterpreterConfig c;
  c.auto_revoke_on_expiration = true;
  WaiverInterpreter wi(c);
  auto rule = make_rule("R-PERF", RuleCategory::performance, ViolationSeverity::medium, "");
  auto d = wi.process_waiver(make_waiver_request("R-PERF", 2, 1000), rule, "board", kNow);
  expect(d.auto_revoke_at_unix_ms == d.expires_at_unix_ms, "auto revoke time set");
  expect(!wi.active_waiver("R-PERF", kNow + 2000), "expired waiver removed on lookup");
  const auto h = wi.history();
  expect(h.size() == 1 && h[0].status == WaiverStatus::revoked, "auto revocation recorded");
}

// ============================================================================
// Appeals
// ============================================================================

ArbitrationSession appeal_session() {
  ArbitrationSession s;
  s.id           = "S-APP";
  s.participants = {"alice", "bob"};
  s.violation    = make_violation();
  s.rules_evaluated = make_rules();
  Verdict v;
  v.id         = "VERDICT-S-APP-1";
  v.session_id = s.id;
  v.outcome    = VerdictOutcome::confirmed;
  v.confidence = 0.9;
  v.evidence   = {"e0"};
  s.verdict    = v;
  s.history.emplace_back(VerdictRecord{v.id, v.digest, v.outcome, v.confidence, 1});
  return s;
}

const std::string kGrounds = "The coverage report was generated from a stale branch";

void test_appeal_submission_rules() {
  AppealArbitrator arb;
  const auto s = appeal_session();
  auto a = arb.submit_appeal(s, *s.verdict, "alice", kGrounds, {"e1"});
  expect(a.id == "APPEAL-1" && a.status == AppealStatus::submitted, "appeal id and status");
  expect(a.original_verdict_id == "VERDICT-S-APP-1", "original verdict recorded");
  expect(error_code_of([&] { arb.submit_appeal(s, *s.verdict, "alice", kGrounds, {}); }) ==
             ErrorCode::appeal_limit_exceeded,
         "one active appeal per appellant");
  expect(arb.submit_appeal(s, *s.verdict, "bob", kGrounds, {}).id == "APPEAL-2", "other appellant ok");
  expect(error_code_of([&] { arb.submit_appeal(s, *s.verdict, "", kGrounds, {}); }) ==
             ErrorCode::invalid_argument,
         "empty appellant rejected");

  AppealArbitratorConfig c;
  c.require_participant_appellant = true;
  AppealArbitrator strict(c);
  expect(error_code_of([&] { strict.submit_appeal(s, *s.verdict, "mallory", kGrounds, {}); }) ==
             ErrorCode::invalid_argument,
         "non-participant rejected");

  expect(arb.appeals_for_session("S-APP").size() == 2, "appeals listed per session");
  expect(arb.withdraw_appeal("APPEAL-2"), "withdraw pending appeal");
  expect(!arb.withdraw_appeal("APPEAL-2"), "withdraw twice fails");
  expect(error_code_of([&] { arb.review_appeal("APPEAL-2", {"r1"}, s, *s.verdict); }) ==
             ErrorCode::appeal_already_decided,
         "withdrawn appeal cannot be reviewed");
}

void test_appeal_derived_overturn() {
  AppealArbitrator arb;
  const auto s = appeal_session();
  auto a = arb.submit_appeal(s, *s.verdict, "alice", kGrounds, {"e1", "e2"});
  auto d = arb.review_appeal(a.id, {"r1", "r2", "r1"}, s, *s.verdict);
  expect(d.decision == AppealOutcome::overturned && near(d.confidence, 1.0), "unanimous derived overturn");
  expect(d.votes.size() == 2, "duplicate reviewers counted once");
  expect(contains(d.reasoning, "Unanimous"), "unanimous reasoning");
  expect(d.new_verdict.has_value(), "overturn carries a new verdict");
  expect(d.new_verdict->outcome == VerdictOutcome::dismissed, "outcome flipped");
  expect(d.new_verdict->issued_by == "appeal-panel", "synthesized by the panel");
  expect(d.new_verdict->evidence == std::vector<std::string>({"e0", "e1", "e2"}), "evidence merged");
  expect(d.new_verdict->reasoning.size() == 3, "three reasoning steps");
  expect(d.new_verdict->id == "VERDICT-S-APP-2" && is_hex_digest(d.new_verdict->digest),
         "new verdict sealed");

  expect(arb.get_appeal(a.id)->status == AppealStatus::decided, "appeal decided");
  expect(arb.decision_for(a.id).has_value(), "decision retrievable");
  expect(error_code_of([&] { arb.review_appeal(a.id, {"r1"}, s, *s.verdict); }) ==
             ErrorCode::appeal_already_decided,
         "decided appeal cannot be reviewed again");
}

void test_proposed_verdict_resealed() {
  AppealArbitrator arb;
  const auto s = appeal_session();
  auto a = arb.submit_appeal(s, *s.verdict, "alice", kGrounds, {"e1"});

  Verdict proposed;
  proposed.id         = "VERDICT-FORGED";
  proposed.session_id = "S-OTHER";
  proposed.digest     = std::string(64, 'a');
  proposed.outcome    = VerdictOutcome::dismissed;
  proposed.confidence = 7.5;
  arb.cast_vote(a.id, ReviewerVote{"r1", AppealRecommendation::overturn, "stale", proposed});
  arb.cast_vote(a.id, ReviewerVote{"r2", AppealRecommendation::overturn, "agree", std::nullopt});
  auto d = arb.review_appeal(a.id, {"r1", "r2"}, s, *s.verdict);
  expect(d.decision == AppealOutcome::overturned && d.new_verdict, "proposal adopted");

  const Verdict& nv = *d.new_verdict;
  expect(near(nv.confidence, 1.0), "proposed confidence clamped to [0,1]");
  expect(nv.session_id == s.id, "bound to the appealed session");
  expect(nv.id == "VERDICT-S-APP-2", "id assigned by sealing");
  expect(nv.digest == verdict_hash(nv.canonical_json()), "digest matches content");
  expect(nv.issued_by == "r1", "proposing reviewer is the issuer");
}

void test_appeal_majority_and_remand() {
  const auto s = appeal_session();
  AppealArbitrator arb;

  auto a = arb.submit_appeal(s, *s.verdict, "alice", "short", {});
  arb.cast_vote(a.id, ReviewerVote{"r1", AppealRecommendation::overturn, "stale data", std::nullopt});
  arb.cast_vote(a.id, ReviewerVote{"r2", AppealRecommendation::overturn, "agree", std::nullopt});
  auto d = arb.review_appeal(a.id, {"r1", "r2", "r3"}, s, *s.verdict);
  expect(d.decision == AppealOutcome::overturned, "2 of 3 meets the 0.66 majority");
  expect(std::fabs(d.confidence - 2.0 / 3.0) < 1e-3, "confidence is the majority fraction");
  expect(contains(d.reasoning, "Majority"), "majority reasoning");

  auto b = arb.submit_appeal(s, *s.verdict, "bob", "short", {});
  arb.cast_vote(b.id, ReviewerVote{"r1", AppealRecommendation::overturn, "", std::nullopt});
  auto tie = arb.review_appeal(b.id, {"r1", "r2"}, s, *s.verdict);
  expect(tie.decision == AppealOutcome::remanded, "tie at the top remands");
  expect(near(tie.confidence, 0.5), "remand confidence is the top fraction");
  expect(!tie.new_verdict, "only overturns carry a verdict");

  const auto st = arb.statistics();
  expect(st.total == 2 && st.overturned == 1 && st.remanded == 1, "appeal statistics");
}

void test_appeal_review_errors() {
  AppealArbitratorConfig c;
  c.min_reviewers = 2;
  AppealArbitrator arb(c);
  const auto s = appeal_session();
  auto a = arb.submit_appeal(s, *s.verdict, "alice", kGrounds, {});
  expect(error_code_of([&] { arb.review_appeal(a.id, {"r1"}, s, *s.verdict); }) ==
             ErrorCode::insufficient_reviewers,
         "panel below minimum");
  expect(error_code_of([&] { arb.review_appeal(a.id, {}, s, *s.verdict); }) ==
             ErrorCode::insufficient_reviewers,
         "empty panel");
  expect(error_code_of([&] { arb.review_appeal("APPEAL-99", {"r1", "r2"}, s, *s.verdict); }) ==
             ErrorCode::appeal_not_found,
         "unknown appeal");
  expect(error_code_of([&] { arb.cast_vote("APPEAL-99", ReviewerVote{"r1", {}, "", {}}); }) ==
             ErrorCode::appeal_not_found,
         "vote on unknown appeal");

  auto other = s;
  other.id = "S-OTHER";
  expect(error_code_of([&] { arb.review_appeal(a.id, {"r1", "r2"}, other, *s.verdict); }) ==
             ErrorCode::appeal_not_found,
         "appeal from another session not found");
}

// ============================================================================
// State machine
// ============================================================================

void test_transition_table() {
  using S = ArbitrationState;
  expect(can_transition(S::initialized, S::rule_evaluation), "init -> rule evaluation");
  expect(can_transition(S::rule_evaluation, S::evidence_collection), "rule evaluation -> evidence");
  expect(can_transition(S::verdict_generation, S::appeal_review), "verdict -> appeal");
  expect(can_transition(S::completed, S::appeal_review), "reopen for appeal");
  expect(can_transition(S::waiver_evaluation, S::failed), "waiver evaluation can fail");
  expect(can_transition(S::debate_in_progress, S::verdict_generation), "debate -> verdict");
  expect(!can_transition(S::waiver_evaluation, S::appeal_review), "waiver cannot go to appeal");
  expect(!can_transition(S::completed, S::failed), "completed cannot fail");
  expect(!can_transition(S::verdict_generation, S::verdict_generation), "no self transitions");
  expect(allowed_transitions(S::failed).empty(), "failed is absorbing");
  expect(error_code_of([] { validate_transition(S::initialized, S::completed, "S"); }) ==
             ErrorCode::none,
         "any non-terminal may complete");
  expect(error_code_of([] { validate_transition(S::failed, S::completed, "S"); }) ==
             ErrorCode::invalid_state_transition,
         "validate rejects missing edge");
}

// ============================================================================
// Orchestrator
// ============================================================================

void expect_valid_walk(const ArbitrationSession& s) {
  const auto ts = s.transitions();
  expect(!ts.empty() && ts.front().from == ArbitrationState::initialized, "walk starts at INITIALIZED");
  for (size_t i = 0; i < ts.size(); ++i) {
    expect(can_transition(ts[i].from, ts[i].to),
           "transition " + to_string(ts[i].from) + " -> " + to_string(ts[i].to) + " is in the table");
    if (i + 1 < ts.size()) expect(ts[i].to == ts[i + 1].from, "transitions chain");
  }
  expect(ts.back().to == s.state, "last transition ends in current state");
}

void test_evaluate_with_auto_precedents() {
  ArbitrationOrchestrator orch(test_config());
  const auto s = orch.start_session(make_violation(), make_rules(), {"agent-7"});
  expect(s.state == ArbitrationState::rule_evaluation, "session starts in RULE_EVALUATION");
  expect(s.id.rfind("ARB-", 0) == 0, "session id prefix");

  const auto after = orch.evaluate_rules(s.id);
  expect(after.state == ArbitrationState::verdict_generation, "ends in VERDICT_GENERATION");
  const auto ts = after.transitions();
  expect(ts.size() == 3, "three transitions");
  expect(ts[1].to == ArbitrationState::evidence_collection, "passes through EVIDENCE_COLLECTION");
  expect(after.history.size() >= 5, "evaluation and lookup recorded");
  const auto m = orch.get_session_metrics(s.id);
  expect(m && m->rules_evaluated == 2, "rules evaluated metric");
  expect_valid_walk(after);
}

void test_evaluate_without_auto_precedents() {
  auto cfg = test_config();
  cfg.auto_apply_precedents = false;
  ArbitrationOrchestrator orch(cfg);
  const auto s = orch.start_session(make_violation(), make_rules(), {});
  const auto after = orch.evaluate_rules(s.id);
  expect(after.transitions().size() == 2, "skips EVIDENCE_COLLECTION");
  const auto refreshed = orch.find_precedents(s.id);
  expect(refreshed.state == ArbitrationState::verdict_generation, "refresh keeps state");
  orch.generate_verdict(s.id, "arbiter");
  expect(error_code_of([&] { orch.find_precedents(s.id); }) == ErrorCode::invalid_state,
         "no refresh once a verdict exists");
}

void test_precedent_from_confident_verdict() {
  ArbitrationOrchestrator orch(test_config(), fixed_components(0.85));
  const auto before = orch.components().precedent_manager->size();
  const auto id = session_with_verdict(orch);
  const auto& pm = *orch.components().precedent_manager;
  expect(pm.size() == before + 1, "exactly one precedent created");
  const auto snap = pm.snapshot();
  expect(snap->back()->category == RuleCategory::testing, "category from first evaluated rule");
  expect(snap->back()->source_verdict_id == orch.get_session(id).verdict->id, "links to verdict");
  expect(orch.get_statistics().total_precedents == 1, "statistics count precedents");
}

void test_precedent_threshold_is_strict() {
  ArbitrationOrchestrator orch(test_config(), fixed_components(0.8));
  session_with_verdict(orch);
  expect(orch.components().precedent_manager->size() == 0, "confidence 0.8 creates no precedent");
}

void test_default_generator_creates_precedent() {
  ArbitrationOrchestrator orch(test_config());
  const auto first = session_with_verdict(orch);
  expect(near(orch.get_session(first).verdict->confidence, 0.9), "first verdict 0.9");
  expect(orch.components().precedent_manager->size() == 1, "high confidence verdict is precedent");

  const auto second = session_with_verdict(orch);
  const auto s = orch.get_session(second);
  expect(s.precedents.size() == 1, "second session finds the precedent");
  expect(s.verdict->precedents.size() == 1, "verdict cites the precedent");
  expect(near(s.verdict->confidence, 1.0), "agreeing precedent raises confidence");
}

void test_waivers_disabled() {
  auto cfg = test_config();
  cfg.enable_waivers = false;
  ArbitrationOrchestrator orch(cfg);
  const auto id = session_with_verdict(orch);
  const auto before = orch.get_session(id);
  expect(error_code_of([&] { orch.evaluate_waiver(id, make_waiver_request("R-TEST", 2), "board"); }) ==
             ErrorCode::waivers_disabled,
         "waivers disabled");
  const auto after = orch.get_session(id);
  expect(after.state == before.state && after.history.size() == before.history.size(),
         "session unchanged");
  expect(error_code_of([&] { orch.evaluate_waiver("ARB-missing", make_waiver_request("R", 2), "b"); }) ==
             ErrorCode::waivers_disabled,
         "raised for any session id");
}

void test_unanimous_appeal_overturn() {
  ArbitrationOrchestrator orch(test_config(), fixed_components(0.85));
  const auto id = session_with_verdict(orch);
  const auto original = *orch.get_session(id).verdict;

  const auto appeal = orch.submit_appeal(id, "agent-7", kGrounds, {"rerun-1", "rerun-2"});
  expect(orch.get_session(id).state == ArbitrationState::appeal_review, "session in APPEAL_REVIEW");

  Verdict proposed;
  proposed.outcome    = VerdictOutcome::dismissed;
  proposed.confidence = 0.95;
  proposed.issued_by  = "panel-chair";
  proposed.evidence   = {"rerun-1", "rerun-2"};
  auto& arb = *orch.components().appeal_arbitrator;
  arb.cast_vote(appeal.id, ReviewerVote{"r1", AppealRecommendation::overturn, "stale", proposed});
  arb.cast_vote(appeal.id, ReviewerVote{"r2", AppealRecommendation::overturn, "agree", std::nullopt});

  const auto d = orch.review_appeal(id, appeal.id, {"r1", "r2"});
  expect(d.decision == AppealOutcome::overturned, "unanimous overturn");

  const auto s = orch.get_session(id);
  expect(s.state == ArbitrationState::completed, "session COMPLETED");
  expect(s.verdict->issued_by == "panel-chair" && s.verdict->outcome == VerdictOutcome::dismissed,
         "verdict replaced by the proposed verdict");
  expect(s.verdict->id != original.id, "new verdict id");

  const auto snap = orch.components().precedent_manager->snapshot();
  expect(snap->size() == 2, "second precedent created");
  expect(contains(snap->back()->title, "Appeal Overturn"), "overturn precedent title");

  bool superseded = false;
  for (const auto& ev : s.history) {
    if (const auto* r = std::get_if<VerdictSupersededRecord>(&ev)) {
      superseded = r->superseded.id == original.id && r->replaced_by == s.verdict->id;
    }
  }
  expect(superseded, "old verdict retained as superseded");
  expect(s.appeal_decision() && s.appeal_decision()->appeal_id == appeal.id, "decision recorded");
  expect(orch.get_statistics().overturned_appeals == 1, "overturn counted");
  expect_valid_walk(s);
}

void test_fail_session_from_active_states() {
  ArbitrationOrchestrator orch(test_config());

  const auto a = orch.start_session(make_violation(), make_rules(), {});
  const auto fa = orch.fail_session(a.id, std::runtime_error("detector crashed"));
  expect(fa.state == ArbitrationState::failed, "failed from RULE_EVALUATION");
  expect(fa.end_time_unix_ms.has_value(), "end time set");
  expect(fa.error() && fa.error()->message == "detector crashed", "error message recorded");
  expect(fa.error()->state_at_failure == ArbitrationState::rule_evaluation, "state at failure");

  const auto b = orch.start_session(make_violation(), make_rules(), {});
  orch.evaluate_rules(b.id);
  const auto fb = orch.fail_session(b.id, ArbitrationError(ErrorCode::invalid_argument, "bad input"));
  expect(fb.state == ArbitrationState::failed, "failed from VERDICT_GENERATION");
  expect(fb.error()->code == "INVALID_ARGUMENT", "error code recorded");
  expect(orch.get_session_metrics(b.id)->final_state == ArbitrationState::failed, "metrics finalized");

  expect(error_code_of([&] { orch.complete_session(a.id); }) == ErrorCode::invalid_state_transition,
         "failed session cannot complete");
  expect(orch.get_session(a.id).state == ArbitrationState::failed, "invalid transition leaves state");
  expect(orch.get_statistics().failed_sessions == 2, "failures counted");
}

class UnavailableWaiverInterpreter : public WaiverInterpreter {
 public:
  WaiverDecision process_waiver(const WaiverRequest&, const ConstitutionalRule&, const std::string&,
                                uint64_t) override {
    throw std::runtime_error("waiver review service unavailable");
  }
};

void test_fail_session_during_waiver_evaluation() {
  OrchestratorComponents comps;
  comps.waiver_interpreter = std::make_shared<UnavailableWaiverInterpreter>();
  ArbitrationOrchestrator orch(test_config(), comps);
  const auto id = session_with_verdict(orch);

  std::string message;
  try {
    orch.evaluate_waiver(id, make_waiver_request("R-TEST", 2), "board");
  } catch (const std::runtime_error& e) {
    message = e.what();
  }
  expect(message == "waiver review service unavailable", "interpreter failure propagates");
  const auto pending = orch.get_session(id);
  expect(pending.state == ArbitrationState::waiver_evaluation, "session left in WAIVER_EVALUATION");
  expect(!pending.end_time_unix_ms && !pending.waiver_decision, "no decision, still open");

  const auto ended = orch.fail_session(id, std::runtime_error(message));
  expect(ended.state == ArbitrationState::failed, "failed from WAIVER_EVALUATION");
  expect(ended.end_time_unix_ms.has_value(), "end time set");
  expect(ended.error() && ended.error()->message == message, "error message recorded");
  expect(ended.error()->state_at_failure == ArbitrationState::waiver_evaluation, "state at failure");
  expect(orch.get_active_sessions().empty(), "capacity released");
  expect_valid_walk(ended);
}

void test_overturn_normalizes_proposed_verdict() {
  ArbitrationOrchestrator orch(test_config(), fixed_components(0.85));
  const auto id = session_with_verdict(orch);
  const auto appeal = orch.submit_appeal(id, "agent-7", kGrounds, {"rerun-1"});

  Verdict proposed;
  proposed.outcome    = VerdictOutcome::dismissed;
  proposed.confidence = 7.5;
  proposed.issued_by  = "panel-chair";
  auto& arb = *orch.components().appeal_arbitrator;
  arb.cast_vote(appeal.id, ReviewerVote{"r1", AppealRecommendation::overturn, "stale", proposed});
  arb.cast_vote(appeal.id, ReviewerVote{"r2", AppealRecommendation::overturn, "agree", std::nullopt});
  orch.review_appeal(id, appeal.id, {"r1", "r2"});

  const auto s = orch.get_session(id);
  expect(near(s.verdict->confidence, 1.0), "session verdict confidence within [0,1]");
  expect(s.verdict->session_id == id, "verdict bound to the session");
  expect(s.verdict->digest == verdict_hash(s.verdict->canonical_json()), "verdict digest matches");
  for (const auto& ev : s.history) {
    if (const auto* r = std::get_if<VerdictRecord>(&ev)) {
      expect(r->confidence >= 0.0 && r->confidence <= 1.0, "recorded confidences within [0,1]");
    }
  }
}

void test_capacity_invariant() {
  auto cfg = test_config();
  cfg.max_concurrent_sessions = 2;
  ArbitrationOrchestrator orch(cfg);
  const auto a = orch.start_session(make_violation(), make_rules(), {});
  orch.start_session(make_violation(), make_rules(), {});
  expect(error_code_of([&] { orch.start_session(make_violation(), make_rules(), {}); }) ==
             ErrorCode::session_limit_exceeded,
         "N+1th session rejected");
  orch.complete_session(a.id);
  orch.start_session(make_violation(), make_rules(), {});
  expect(orch.get_active_sessions().size() == 2, "completion frees capacity");
  expect(error_code_of([&] { orch.start_session(make_violation(), {}, {}); }) ==
             ErrorCode::invalid_argument,
         "empty rule list rejected");
}

void test_verdict_required_for_appeal() {
  ArbitrationOrchestrator orch(test_config());
  const auto s = orch.start_session(make_violation(), make_rules(), {});
  expect(error_code_of([&] { orch.submit_appeal(s.id, "agent-7", kGrounds, {}); }) ==
             ErrorCode::no_verdict,
         "submit without verdict");
  expect(error_code_of([&] { orch.review_appeal(s.id, "APPEAL-1", {"r1"}); }) == ErrorCode::no_verdict,
         "review without verdict");
  expect(error_code_of([&] { orch.evaluate_waiver(s.id, make_waiver_request("R-TEST", 2), "b"); }) ==
             ErrorCode::no_verdict,
         "waiver without verdict");
  orch.fail_session(s.id, "aborted");
  expect(error_code_of([&] { orch.submit_appeal(s.id, "agent-7", kGrounds, {}); }) ==
             ErrorCode::no_verdict,
         "NO_VERDICT regardless of state");
}

void test_idempotent_completion() {
  ArbitrationOrchestrator orch(test_config());
  const auto id = session_with_verdict(orch);
  const auto first = orch.complete_session(id);
  const auto second = orch.complete_session(id);
  expect(second.state == ArbitrationState::completed, "still completed");
  expect(first.end_time_unix_ms == second.end_time_unix_ms, "end time unchanged");
  expect(first.history.size() == second.history.size(), "no new history");
  expect_valid_walk(second);
}

void test_waiver_through_orchestrator() {
  ArbitrationOrchestrator orch(test_config());
  const auto id = session_with_verdict(orch);
  const auto d = orch.evaluate_waiver(id, make_waiver_request("R-TEST", 2), "board");
  expect(d.status == WaiverStatus::approved && d.decided_by == "board", "waiver approved");
  const auto s = orch.get_session(id);
  expect(s.state == ArbitrationState::completed, "waiver completes the session");
  expect(s.waiver_decision && s.waiver_request, "waiver stored on the session");
  expect(orch.get_session_metrics(id)->waiver_evaluation_ms.has_value(), "waiver timing recorded");
  expect(orch.get_statistics().total_waivers == 1, "waiver counted");
  expect(error_code_of([&] { orch.evaluate_waiver(id, make_waiver_request("R-DOCS", 2), "b"); }) ==
             ErrorCode::invalid_state,
         "no waiver on a completed session");
  expect_valid_walk(s);
}

void test_reopen_for_appeal() {
  ArbitrationOrchestrator orch(test_config());
  const auto id = session_with_verdict(orch);
  const auto done = orch.complete_session(id);
  const auto verdict_id = done.verdict->id;

  const auto appeal = orch.submit_appeal(id, "agent-7", "late", {});
  auto reopened = orch.get_session(id);
  expect(reopened.state == ArbitrationState::appeal_review, "reopened for appeal");
  expect(!reopened.end_time_unix_ms, "end time cleared while open");
  expect(reopened.first_completed_at_unix_ms == done.end_time_unix_ms, "first completion kept");
  expect(reopened.reopen_count == 1 && reopened.reopened_at_unix_ms, "reopen stamped");
  expect(orch.get_active_sessions().size() == 1, "reopened session is active");

  const auto d = orch.review_appeal(id, appeal.id, {"r1"});
  expect(d.decision == AppealOutcome::upheld, "weak appeal upheld");
  const auto s = orch.get_session(id);
  expect(s.state == ArbitrationState::completed && s.end_time_unix_ms, "completed again");
  expect(s.verdict->id == verdict_id, "upheld verdict unchanged");
  const auto m = orch.get_session_metrics(id);
  expect(m->reopen_count == 1, "reopen counted in metrics");
  expect(m->total_duration_ms == *s.end_time_unix_ms - s.start_time_unix_ms, "total duration");
  expect_valid_walk(s);
}

void test_reopen_respects_capacity() {
  auto cfg = test_config();
  cfg.max_concurrent_sessions = 1;
  ArbitrationOrchestrator orch(cfg);
  const auto id = session_with_verdict(orch);
  orch.complete_session(id);
  orch.start_session(make_violation(), make_rules(), {});
  expect(error_code_of([&] { orch.submit_appeal(id, "agent-7", kGrounds, {}); }) ==
             ErrorCode::session_limit_exceeded,
         "reopen needs capacity");
  const auto s = orch.get_session(id);
  expect(s.state == ArbitrationState::completed && s.end_time_unix_ms, "session left completed");
}

void test_failed_operation_is_transactional() {
  ArbitrationOrchestrator orch(test_config());
  const auto id = session_with_verdict(orch);
  const auto appeal = orch.submit_appeal(id, "agent-7", kGrounds, {});
  const auto before = orch.get_session(id);
  expect(error_code_of([&] { orch.review_appeal(id, appeal.id, {}); }) ==
             ErrorCode::insufficient_reviewers,
         "empty panel rejected");
  const auto after = orch.get_session(id);
  expect(after.state == ArbitrationState::appeal_review, "state unchanged");
  expect(after.history.size() == before.history.size(), "history unchanged");
  expect(error_code_of([&] { orch.generate_verdict(id, "arbiter"); }) == ErrorCode::invalid_state,
         "verdict generation outside VERDICT_GENERATION");
}

void test_appeals_disabled() {
  auto cfg = test_config();
  cfg.enable_appeals = false;
  ArbitrationOrchestrator orch(cfg);
  const auto id = session_with_verdict(orch);
  expect(error_code_of([&] { orch.submit_appeal(id, "agent-7", kGrounds, {}); }) ==
             ErrorCode::appeals_disabled,
         "appeals disabled");
}

void test_session_timeout_supervisor() {
  auto cfg = test_config();
  cfg.session_timeout_ms = 1000;
  ArbitrationOrchestrator orch(cfg);
  const auto stale = orch.start_session(make_violation(), make_rules(), {});
  const auto done = session_with_verdict(orch);
  orch.complete_session(done);

  const auto failed = orch.fail_expired_sessions(now_unix_ms() + 60 * 1000);
  expect(failed.size() == 1 && failed[0] == stale.id, "only the open session times out");
  const auto s = orch.get_session(stale.id);
  expect(s.state == ArbitrationState::failed && s.error()->code == "SESSION_TIMEOUT", "timeout recorded");
  expect(orch.get_session(done).state == ArbitrationState::completed, "completed session untouched");
}

void test_queries_and_clear() {
  auto cfg = test_config();
  cfg.track_performance = false;
  ArbitrationOrchestrator orch(cfg);
  const auto s = orch.start_session(make_violation(), make_rules(), {});
  expect(!orch.get_session_metrics(s.id), "metrics disabled");
  expect(orch.get_all_metrics().empty(), "no metrics listed");
  expect(error_code_of([&] { orch.get_session("ARB-0-0"); }) == ErrorCode::session_not_found,
         "unknown session");

  auto snapshot = orch.get_session(s.id);
  snapshot.state = ArbitrationState::failed;
  expect(orch.get_session(s.id).state == ArbitrationState::rule_evaluation, "queries return copies");

  orch.clear();
  expect(orch.get_statistics().total_sessions == 0, "clear drops sessions");
  const auto next = orch.start_session(make_violation(), make_rules(), {});
  expect(next.id.size() > 2 && next.id.substr(next.id.size() - 2) == "-1", "id counter reset");

  ArbitrationConfig bad;
  bad.max_concurrent_sessions = 0;
  expect(error_code_of([&] { ArbitrationOrchestrator o(bad); }) == ErrorCode::config_invalid,
         "zero capacity rejected");
}

// ============================================================================
// Observability and audit
// ============================================================================

std::atomic<int> g_hook_events{0};
std::atomic<int> g_hook_rejections{0};

void count_event(const ArbitrationEvent& ev) {
  g_hook_events.fetch_add(1);
  if (ev.kind == EventKind::transition_rejected) g_hook_rejections.fetch_add(1);
}

void test_event_emission() {
  auto& stats = global_arbitration_stats();
  const auto started_before = stats.sessions_started.load();
  const auto verdicts_before = stats.verdicts_issued.load();
  set_arbitration_event_hook(&count_event);
  {
    ArbitrationOrchestrator orch(test_config());
    const auto id = session_with_verdict(orch);
    orch.fail_session(id, "stop");
    error_code_of([&] { orch.complete_session(id); });
  }
  set_arbitration_event_hook(nullptr);
  expect(g_hook_events.load() >= 8, "lifecycle events reach the hook");
  expect(g_hook_rejections.load() == 1, "rejected transition emitted");
  expect(stats.sessions_started.load() == started_before + 1, "session start counted");
  expect(stats.verdicts_issued.load() == verdicts_before + 1, "verdict counted");
  expect(stats.phase_latency[static_cast<size_t>(Phase::verdict_generation)].count() > 0,
         "phase latency recorded");
  expect(contains(stats.to_json(), "\"sessions_started\""), "stats JSON");
}

ArbitrationOrchestrator* g_hook_orchestrator = nullptr;
std::atomic<int> g_hook_session_reads{0};

void read_session_on_verdict(const ArbitrationEvent& ev) {
  if (ev.kind != EventKind::verdict_issued || !g_hook_orchestrator) return;
  const auto s = g_hook_orchestrator->get_session(ev.session_id);
  if (s.verdict && s.verdict->id == ev.detail) g_hook_session_reads.fetch_add(1);
}

void test_hook_reads_session() {
  ArbitrationOrchestrator orch(test_config());
  const auto s = orch.start_session(make_violation(), make_rules(), {});
  orch.evaluate_rules(s.id);

  g_hook_orchestrator = &orch;
  set_arbitration_event_hook(&read_session_on_verdict);
  std::promise<void> done;
  auto finished = done.get_future();
  std::thread worker([&orch, &done, id = s.id] {
    orch.generate_verdict(id, "arbiter");
    done.set_value();
  });
  const bool returned = finished.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
  if (!returned) worker.detach();
  expect(returned, "generate_verdict returns while the hook reads the session");
  worker.join();
  set_arbitration_event_hook(nullptr);
  g_hook_orchestrator = nullptr;
  expect(g_hook_session_reads.load() == 1, "hook sees the committed verdict");
}

void test_latency_histogram() {
  LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 99; ++i) h.record(1000);     // 1us
  h.record(1000ULL * 1000 * 10);                   // 10ms
  expect(h.count() == 100, "sample count");
  expect(h.percentile(0.5) <= 2.0, "p50 in the fast bucket");
  expect(h.percentile(1.0) >= 8000.0, "p100 in the slow bucket");
  h.reset();
  expect(h.count() == 0, "reset");
}

void test_audit_chain() {
  const std::string path = temp_path("tribunal_audit_chain_test.ndjson");
  fs::remove(path);
  {
    ImmutableAuditLog log(path);
    OrchestratorComponents comps;
    comps.audit_log = &log;
    ArbitrationOrchestrator orch(test_config(), comps);
    const auto id = session_with_verdict(orch);
    orch.evaluate_waiver(id, make_waiver_request("R-TEST", 2), "board");
    expect(log.entry_count() == 3, "verdict, waiver and completion audited");
    expect(is_hex_digest(log.head_digest()), "chain head is a digest");
    expect(orch.get_statistics().audit_write_failures == 0, "no write failures");
  }

  auto ok = verify_audit_log(path);
  expect(ok.ok && ok.entries == 3, "untouched chain verifies");

  std::vector<std::string> lines;
  {
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
  }
  expect(lines.size() == 3, "three NDJSON lines");
  expect(contains(lines[0], "\"kind\":\"verdict\""), "first entry is the verdict");
  const auto pos = lines[1].find("\"session_id\":\"");
  expect(pos != std::string::npos, "entry carries the session id");
  lines[1].insert(pos + 14, "X");
  {
    std::ofstream out(path, std::ios::trunc);
    for (const auto& l : lines) out << l << "\n";
  }
  auto bad = verify_audit_log(path);
  expect(!bad.ok, "tampered chain fails verification");
  expect(bad.first_bad_sequence == 3, "break detected at the next link");
  fs::remove(path);
}

DecisionRecord audit_entry(DecisionKind kind, const std::string& subject) {
  DecisionRecord r;
  r.kind       = kind;
  r.session_id = "S-AUDIT";
  r.subject_id = subject;
  r.outcome    = "confirmed";
  return r;
}

void test_audit_reopen_continues_chain() {
  const std::string path = temp_path("tribunal_audit_reopen_test.ndjson");
  fs::remove(path);

  std::string head;
  {
    ImmutableAuditLog log(path);
    auto first = audit_entry(DecisionKind::verdict, "VERDICT-S-AUDIT-1");
    expect(log.append(first) && first.sequence == 1, "first run starts at 1");
    head = log.head_digest();
  }
  {
    ImmutableAuditLog log(path);
    expect(log.head_digest() == head, "chain head restored on open");
    auto second = audit_entry(DecisionKind::session_completed, "VERDICT-S-AUDIT-1");
    expect(log.append(second), "second run appends");
    expect(second.sequence == 2, "sequence continues across runs");
    expect(second.previous_digest == head, "second run links to the first");
    expect(log.entry_count() == 1, "entry count is per instance");
  }
  auto r = verify_audit_log(path);
  expect(r.ok && r.entries == 2, "reopened chain verifies");

  {
    std::ofstream out(path, std::ios::app);
    out << "{\"seq\":3,\"prev\":\"ab";
  }
  ImmutableAuditLog damaged(path);
  auto third = audit_entry(DecisionKind::session_failed, "");
  expect(!damaged.append(third), "log with a torn last line is not extended");
  expect(damaged.failure_count() >= 1, "torn log counted as a failure");
  fs::remove(path);
}

void test_audit_disabled_and_unwritable() {
  ImmutableAuditLog off;
  DecisionRecord r;
  expect(!off.enabled() && off.append(r), "disabled log accepts appends");

  ImmutableAuditLog broken("/nonexistent-dir/tribunal/audit.ndjson");
  OrchestratorComponents comps;
  comps.audit_log = &broken;
  ArbitrationOrchestrator orch(test_config(), comps);
  const auto id = session_with_verdict(orch);
  expect(orch.get_session(id).verdict.has_value(), "audit failure never aborts arbitration");
  expect(orch.get_statistics().audit_write_failures == 1, "audit failure counted");
}

// ============================================================================
// Concurrency
// ============================================================================

void test_parallel_sessions() {
  auto cfg = test_config();
  cfg.max_concurrent_sessions = 64;
  ArbitrationOrchestrator orch(cfg);
  std::atomic<int> errors{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 4; ++i) {
        try {
          const auto id = session_with_verdict(orch);
          orch.complete_session(id);
        } catch (const ArbitrationError&) {
          errors.fetch_add(1);
        }
      }
    });
  }
  for (auto& t : threads) t.join();
  expect(errors.load() == 0, "no errors across parallel sessions");
  const auto st = orch.get_statistics();
  expect(st.completed_sessions == 32 && st.active_sessions == 0, "all sessions completed");
  expect(st.verdicts_generated == 32, "every verdict counted");
  expect(orch.get_all_metrics().size() == 32, "metrics per session");
}

void test_concurrent_calls_on_one_session() {
  ArbitrationOrchestrator orch(test_config());
  const auto s = orch.start_session(make_violation(), make_rules(), {});
  std::atomic<int> ok{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      const auto code = error_code_of([&] { orch.evaluate_rules(s.id); });
      if (code == ErrorCode::none) ok.fetch_add(1);
      if (code == ErrorCode::invalid_state) rejected.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();
  expect(ok.load() == 1 && rejected.load() == 7, "exactly one evaluation wins");
  expect(orch.get_session(s.id).transitions().size() == 3, "one evaluation recorded");
}

void test_capacity_race() {
  auto cfg = test_config();
  cfg.max_concurrent_sessions = 4;
  ArbitrationOrchestrator orch(cfg);
  std::atomic<int> started{0};
  std::atomic<int> limited{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 16; ++t) {
    threads.emplace_back([&] {
      const auto code = error_code_of([&] { orch.start_session(make_violation(), make_rules(), {}); });
      if (code == ErrorCode::none) started.fetch_add(1);
      if (code == ErrorCode::session_limit_exceeded) limited.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();
  expect(started.load() == 4 && limited.load() == 12, "capacity never exceeded");
  expect(orch.get_active_sessions().size() == 4, "four active sessions");
}

void test_precedent_reads_during_writes() {
  PrecedentManager pm;
  std::atomic<bool> done{false};
  std::atomic<int> violations{0};
  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      size_t last = 0;
      while (!done.load()) {
        const auto snap = pm.snapshot();
        if (snap->size() < last) violations.fetch_add(1);
        last = snap->size();
        for (size_t i = 0; i < snap->size(); ++i) {
          if ((*snap)[i]->sequence != i + 1) violations.fetch_add(1);
        }
        pm.find_similar_precedents(RuleCategory::testing, ViolationSeverity::medium, {"flaky"}, {"R-1"}, 3);
      }
    });
  }
  for (int i = 0; i < 200; ++i) {
    pm.create_precedent(sample_verdict("V-" + std::to_string(i), {"R-1"}), "Flaky test " + std::to_string(i),
                        {"flaky test"}, "r", attrs(RuleCategory::testing, ViolationSeverity::medium));
  }
  done.store(true);
  for (auto& t : readers) t.join();
  expect(violations.load() == 0, "snapshots are consistent and monotonic");
  expect(pm.size() == 200, "all precedents published");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults_and_parse() {
  auto r = validate_config("{}");
  expect(r.ok && !r.warnings.empty(), "empty config ok with missing-version warning");

  ConfigValidationResult vr;
  auto c = config_from_json(
      "{\"config_version\":\"1\",\"max_concurrent_sessions\":3,\"enable_waivers\":false,"
      "\"session_timeout_ms\":5000,\"precedents\":{\"min_similarity_score\":0.5,\"default_limit\":2},"
      "\"appeals\":{\"majority_threshold\":0.75,\"min_reviewers\":2},"
      "\"waivers\":{\"max_waiver_duration_ms\":3600000},"
      "\"verdict_weights\":{\"rule\":0.6,\"precedent\":0.1,\"evidence\":0.3}}",
      &vr);
  expect(c.has_value() && vr.ok, "valid config parses");
  expect(c->max_concurrent_sessions == 3 && !c->enable_waivers, "orchestrator options");
  expect(c->session_timeout_ms == 5000, "timeout");
  expect(near(c->precedents.min_similarity_score, 0.5) && c->precedents.default_limit == 2, "precedents");
  expect(near(c->appeals.majority_threshold, 0.75) && c->appeals.min_reviewers == 2, "appeals");
  expect(c->waivers.max_waiver_duration_ms == 3600000, "waivers");
  expect(near(c->verdict_weights.rule, 0.6), "weights");
  expect(contains(c->to_json(), "\"max_concurrent_sessions\":3"), "config serializes");
}

void test_config_errors() {
  auto weights = validate_config("{\"verdict_weights\":{\"rule\":0.9,\"precedent\":0.2,\"evidence\":0.3}}");
  expect(!weights.ok, "weights must sum to one");

  auto threshold = validate_config("{\"appeals\":{\"majority_threshold\":1.5}}");
  expect(!threshold.ok, "threshold outside (0,1]");

  auto zero = validate_config("{\"max_concurrent_sessions\":0}");
  expect(!zero.ok, "non-positive limit");

  auto huge = validate_config("{\"waivers\":{\"max_waiver_duration_ms\":1e300}}");
  expect(!huge.ok, "duration beyond int64 rejected");

  auto type = validate_config("{\"enable_appeals\":\"yes\"}");
  expect(!type.ok, "wrong type");

  auto version = validate_config("{\"config_version\":\"2\"}");
  expect(!version.ok, "unsupported config version");

  auto unknown = validate_config("{\"config_version\":\"1\",\"bogus\":1}");
  bool warned = false;
  for (const auto& w : unknown.warnings) warned = warned || contains(w, "bogus");
  expect(unknown.ok && warned, "unknown keys warn");

  ConfigValidationResult vr;
  expect(!config_from_json("{not json", &vr) && !vr.ok, "malformed JSON rejected");
}

void test_config_env_overrides() {
  setenv("TRIBUNAL_MAX_CONCURRENT_SESSIONS", "7", 1);
  setenv("TRIBUNAL_ENABLE_APPEALS", "off", 1);
  setenv("TRIBUNAL_SESSION_TIMEOUT_MS", "soon", 1);
  ArbitrationConfig c;
  std::vector<std::string> warnings;
  apply_env_overrides(c, &warnings);
  unsetenv("TRIBUNAL_MAX_CONCURRENT_SESSIONS");
  unsetenv("TRIBUNAL_ENABLE_APPEALS");
  unsetenv("TRIBUNAL_SESSION_TIMEOUT_MS");

  expect(c.max_concurrent_sessions == 7, "capacity override");
  expect(!c.enable_appeals, "flag override");
  expect(c.session_timeout_ms == 300000, "malformed override ignored");
  expect(warnings.size() == 1 && contains(warnings[0], "TRIBUNAL_SESSION_TIMEOUT_MS"), "warning issued");
}

// ============================================================================
// Case files and serialization
// ============================================================================

void test_case_file_parse() {
  const std::string doc =
      "{\"violation\":{\"id\":\"V-9\",\"rule_id\":\"R-TEST\",\"severity\":\"major\","
      "\"description\":\"Skipped tests\",\"context\":{\"tests_passed\":\"false\"},"
      "\"evidence\":[\"log\"]},"
      "\"rules\":[{\"id\":\"R-TEST\",\"category\":\"testing\",\"condition\":\"tests_passed == true\","
      "\"required_evidence\":[\"log\"],\"waivable\":false}],"
      "\"participants\":[\"dev\"],"
      "\"waiver\":{\"justification\":\"Release blocker with signed-off risk\",\"evidence\":[\"a\",\"b\"]},"
      "\"appeal\":{\"appellant_id\":\"dev\",\"grounds\":\"flaky\",\"reviewers\":[\"r1\"],"
      "\"votes\":[{\"reviewer_id\":\"r1\",\"recommendation\":\"remand\"}]}}";
  std::string error;
  auto c = parse_case_file(doc, &error);
  expect(c.has_value(), "case file parses: " + error);
  expect(c->violation.severity == ViolationSeverity::high, "severity alias");
  expect(c->violation.violator == "unknown", "violator default");
  expect(c->rules.size() == 1 && !c->rules[0].waivable, "rule fields");
  expect(c->rules[0].category == RuleCategory::testing, "rule category");
  expect(c->waiver && c->waiver->rule_id == "R-TEST", "waiver defaults to reported rule");
  expect(c->appeal && c->appeal->votes.size() == 1, "appeal votes");
  expect(c->appeal->votes[0].recommendation == AppealRecommendation::remand, "vote recommendation");

  expect(!parse_case_file("{\"rules\":[]}", &error) && contains(error, "violation"), "violation required");
  expect(!parse_case_file("{\"violation\":{},\"rules\":[]}", &error) && contains(error, "rules"),
         "rules required");
  expect(!parse_case_file("{\"violation\":{\"severity\":\"huge\"},\"rules\":[{\"id\":\"R\"}]}", &error),
         "unknown severity rejected");
}

void test_session_json() {
  ArbitrationOrchestrator orch(test_config());
  const auto id = session_with_verdict(orch);
  orch.complete_session(id);
  const auto s = orch.get_session(id);

  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(s.to_json(), &err);
  expect(!err, "session JSON is strict JSON");
  expect(jsonlite::get_string(obj, "state") == "COMPLETED", "state serialized");
  expect(jsonlite::get_string(obj, "id") == id, "id serialized");
  const auto* verdict = jsonlite::get_object(obj, "verdict");
  expect(verdict && jsonlite::get_string(*verdict, "digest") == s.verdict->digest, "verdict nested");

  auto m = jsonlite::parse(orch.get_session_metrics(id)->to_json(), &err);
  expect(!err && jsonlite::get_string(m, "final_state") == "COMPLETED", "metrics JSON");
  auto st = jsonlite::parse(orch.get_statistics().to_json(), &err);
  expect(!err && jsonlite::get_u64(st, "completed_sessions") == 1, "statistics JSON");
}

}  // namespace

int main() {
  std::cout << "=== tribunal tests ===\n";

  std::cout << "\n[Hashing, JSON, versioning]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("strict JSON parse", test_json_strict_parse);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Domain types]\n";
  run_test("enum strings and aliases", test_enum_strings);
  run_test("session accessors", test_session_accessors);

  std::cout << "\n[Rule engine]\n";
  run_test("condition parsing", test_condition_parsing);
  run_test("clause evaluation", test_clause_evaluation);
  run_test("rule evaluation results", test_rule_evaluation_results);
  run_test("reported rule with indeterminate clause", test_reported_rule_indeterminate);
  run_test("first registration wins", test_rule_registration_first_wins);

  std::cout << "\n[Precedents]\n";
  run_test("creation and copy-on-write snapshots", test_precedent_creation_and_snapshot);
  run_test("similarity search and overruling", test_precedent_similarity);
  run_test("applicability assessment", test_precedent_applicability);
  run_test("search and citations", test_precedent_search_and_citations);

  std::cout << "\n[Verdicts]\n";
  run_test("confidence and outcome", test_verdict_confidence_and_outcome);
  run_test("determinism", test_verdict_determinism);
  run_test("conditional and dismissed outcomes", test_verdict_conditional_and_dismissed);
  run_test("weights and normalization", test_verdict_weights_validation);

  std::cout << "\n[Phase functions]\n";
  run_test("precedent threshold effect", test_phase_precedent_threshold);
  run_test("rule evaluation records", test_phase_rule_evaluation_records);
  run_test("waiver rule selection", test_phase_waiver_rule_selection);

  std::cout << "\n[Waivers]\n";
  run_test("rejections", test_waiver_rejections);
  run_test("approvals", test_waiver_approvals);
  run_test("active ledger", test_waiver_ledger);
  run_test("negative and zero durations", test_waiver_negative_duration);
  run_test("auto revoke on expiration", test_waiver_auto_revoke);

  std::cout << "\n[Appeals]\n";
  run_test("submission rules", test_appeal_submission_rules);
  run_test("derived overturn", test_appeal_derived_overturn);
  run_test("proposed verdict re-sealed", test_proposed_verdict_resealed);
  run_test("majority and remand", test_appeal_majority_and_remand);
  run_test("review errors", test_appeal_review_errors);

  std::cout << "\n[State machine]\n";
  run_test("transition table", test_transition_table);

  std::cout << "\n[Orchestrator]\n";
  run_test("evaluation with auto-applied precedents", test_evaluate_with_auto_precedents);
  run_test("evaluation without auto precedents", test_evaluate_without_auto_precedents);
  run_test("precedent created from confident verdict", test_precedent_from_confident_verdict);
  run_test("precedent threshold is strict", test_precedent_threshold_is_strict);
  run_test("default generator creates precedent", test_default_generator_creates_precedent);
  run_test("waivers disabled", test_waivers_disabled);
  run_test("unanimous appeal overturn", test_unanimous_appeal_overturn);
  run_test("fail session from active states", test_fail_session_from_active_states);
  run_test("fail session during waiver evaluation", test_fail_session_during_waiver_evaluation);
  run_test("overturn normalizes proposed verdict", test_overturn_normalizes_proposed_verdict);
  run_test("capacity invariant", test_capacity_invariant);
  run_test("verdict required for appeal", test_verdict_required_for_appeal);
  run_test("idempotent completion", test_idempotent_completion);
  run_test("waiver through orchestrator", test_waiver_through_orchestrator);
  run_test("reopen for appeal", test_reopen_for_appeal);
  run_test("reopen respects capacity", test_reopen_respects_capacity);
  run_test("failed operation is transactional", test_failed_operation_is_transactional);
  run_test("appeals disabled", test_appeals_disabled);
  run_test("session timeout supervisor", test_session_timeout_supervisor);
  run_test("queries and clear", test_queries_and_clear);

  std::cout << "\n[Observability and audit]\n";
  run_test("event emission", test_event_emission);
  run_test("hook may read the session", test_hook_reads_session);
  run_test("latency histogram", test_latency_histogram);
  run_test("audit chain and tamper detection", test_audit_chain);
  run_test("audit reopen continues the chain", test_audit_reopen_continues_chain);
  run_test("audit disabled and unwritable", test_audit_disabled_and_unwritable);

  std::cout << "\n[Concurrency]\n";
  run_test("parallel sessions", test_parallel_sessions);
  run_test("concurrent calls on one session", test_concurrent_calls_on_one_session);
  run_test("capacity race", test_capacity_race);
  run_test("precedent reads during writes", test_precedent_reads_during_writes);

  std::cout << "\n[Configuration]\n";
  run_test("defaults and parse", test_config_defaults_and_parse);
  run_test("validation errors", test_config_errors);
  run_test("environment overrides", test_config_env_overrides);

  std::cout << "\n[Case files and serialization]\n";
  run_test("case file parse", test_case_file_parse);
  run_test("session JSON", test_session_json);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
