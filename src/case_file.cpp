#include "tribunal/case_file.hpp"

#include "tribunal/jsonlite.hpp"

namespace tribunal {

namespace {

using jsonlite::Object;

bool set_error(std::string* error, const std::string& msg) {
  if (error) *error = msg;
  return false;
}

bool read_severity(const Object& obj, const std::string& where, ViolationSeverity& out,
                   std::string* error) {
  if (!jsonlite::has_key(obj, "severity")) return true;
  const std::string s = jsonlite::get_string(obj, "severity");
  const auto sev = severity_from_string(s);
  if (!sev) return set_error(error, where + ": unknown severity '" + s + "'");
  out = *sev;
  return true;
}

bool read_violation(const Object& obj, ConstitutionalViolation& v, std::string* error) {
  v.id          = jsonlite::get_string(obj, "id");
  v.rule_id     = jsonlite::get_string(obj, "rule_id");
  v.violator    = jsonlite::get_string(obj, "violator", "unknown");
  v.description = jsonlite::get_string(obj, "description");
  v.context     = jsonlite::get_string_map(obj, "context");
  v.evidence    = jsonlite::get_string_array(obj, "evidence");
  v.detected_at_unix_ms = jsonlite::get_u64(obj, "detected_at_unix_ms", 0);
  if (v.violator.empty()) v.violator = "unknown";
  return read_severity(obj, "violation", v.severity, error);
}

bool read_rule(const Object& obj, size_t index, ConstitutionalRule& r, std::string* error) {
  const std::string where = "rules[" + std::to_string(index) + "]";
  r.id = jsonlite::get_string(obj, "id");
  if (r.id.empty()) return set_error(error, where + ": id is required");
  r.version     = jsonlite::get_string(obj, "version", "1.0.0");
  r.title       = jsonlite::get_string(obj, "title", r.id);
  r.description = jsonlite::get_string(obj, "description");
  r.condition   = jsonlite::get_string(obj, "condition");
  r.waivable    = jsonlite::get_bool(obj, "waivable", true);
  r.required_evidence      = jsonlite::get_string_array(obj, "required_evidence");
  r.effective_from_unix_ms = jsonlite::get_u64(obj, "effective_from_unix_ms", 0);
  r.expires_at_unix_ms     = jsonlite::get_u64(obj, "expires_at_unix_ms", 0);
  r.metadata               = jsonlite::get_string_map(obj, "metadata");
  if (jsonlite::has_key(obj, "category")) {
    const std::string c = jsonlite::get_string(obj, "category");
    const auto cat = category_from_string(c);
    if (!cat) return set_error(error, where + ": unknown category '" + c + "'");
    r.category = *cat;
  }
  return read_severity(obj, where, r.severity, error);
}

bool read_appeal(const Object& obj, CaseAppeal& a, std::string* error) {
  a.appellant_id = jsonlite::get_string(obj, "appellant_id");
  a.grounds      = jsonlite::get_string(obj, "grounds");
  a.new_evidence = jsonlite::get_string_array(obj, "new_evidence");
  a.reviewers    = jsonlite::get_string_array(obj, "reviewers");
  if (a.appellant_id.empty()) return set_error(error, "appeal: appellant_id is required");

  if (const auto* votes = jsonlite::get_array(obj, "votes")) {
    for (size_t i = 0; i < votes->size(); ++i) {
      const auto* vo = std::get_if<Object>(&(*votes)[i].v);
      if (!vo) return set_error(error, "appeal.votes[" + std::to_string(i) + "] must be an object");
      ReviewerVote vote;
      vote.reviewer_id = jsonlite::get_string(*vo, "reviewer_id");
      vote.rationale   = jsonlite::get_string(*vo, "rationale");
      if (jsonlite::has_key(*vo, "recommendation")) {
        const std::string rec = jsonlite::get_string(*vo, "recommendation");
        vote.recommendation = recommendation_from_string(rec);
        if (!vote.recommendation) {
          return set_error(error, "appeal.votes[" + std::to_string(i) + "]: unknown recommendation '" +
                                      rec + "'");
        }
      }
      a.votes.push_back(std::move(vote));
    }
  }
  return true;
}

}  // namespace

std::optional<CaseFile> parse_case_file(const std::string& json, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const Object root = jsonlite::parse(json, &err);
  if (err) {
    set_error(error, err->code + ": " + err->message);
    return std::nullopt;
  }

  CaseFile c;
  const Object* violation = jsonlite::get_object(root, "violation");
  if (!violation) {
    set_error(error, "violation object is required");
    return std::nullopt;
  }
  if (!read_violation(*violation, c.violation, error)) return std::nullopt;

  const auto* rules = jsonlite::get_array(root, "rules");
  if (!rules || rules->empty()) {
    set_error(error, "rules must be a non-empty array");
    return std::nullopt;
  }
  for (size_t i = 0; i < rules->size(); ++i) {
    const auto* ro = std::get_if<Object>(&(*rules)[i].v);
    if (!ro) {
      set_error(error, "rules[" + std::to_string(i) + "] must be an object");
      return std::nullopt;
    }
    ConstitutionalRule rule;
    if (!read_rule(*ro, i, rule, error)) return std::nullopt;
    c.rules.push_back(std::move(rule));
  }

  c.participants = jsonlite::get_string_array(root, "participants");
  c.issued_by    = jsonlite::get_string(root, "issued_by", "arbiter");

  if (const Object* w = jsonlite::get_object(root, "waiver")) {
    WaiverRequest req;
    req.id                    = jsonlite::get_string(*w, "id", "WAIVER-1");
    req.rule_id               = jsonlite::get_string(*w, "rule_id", c.violation.rule_id);
    req.requested_by          = jsonlite::get_string(*w, "requested_by", c.violation.violator);
    req.justification         = jsonlite::get_string(*w, "justification");
    req.evidence              = jsonlite::get_string_array(*w, "evidence");
    req.requested_duration_ms = jsonlite::get_i64(*w, "requested_duration_ms", 0);
    req.requested_at_unix_ms  = now_unix_ms();
    req.context               = jsonlite::get_string_map(*w, "context");
    c.waiver_decided_by       = jsonlite::get_string(*w, "decided_by", "waiver-board");
    c.waiver = std::move(req);
  }

  if (const Object* a = jsonlite::get_object(root, "appeal")) {
    CaseAppeal appeal;
    if (!read_appeal(*a, appeal, error)) return std::nullopt;
    c.appeal = std::move(appeal);
  }
  return c;
}

}  // namespace tribunal
