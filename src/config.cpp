#include "tribunal/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <set>
#include <sstream>

#include "tribunal/jsonlite.hpp"
#include "tribunal/version.hpp"

namespace tribunal {

namespace {

using jsonlite::Object;
using jsonlite::Value;

// Walks one JSON object, type-checks the keys it is asked for and remembers
// them so the rest can be reported as unknown.
class ConfigReader {
 public:
  ConfigReader(const Object& obj, std::string prefix, ConfigValidationResult& result)
      : obj_(obj), prefix_(std::move(prefix)), result_(result) {}

  void read_bool(const std::string& key, bool& out) {
    const Value* v = find(key);
    if (!v) return;
    if (const auto* b = std::get_if<bool>(&v->v)) {
      out = *b;
    } else {
      error(key, "must be a boolean");
    }
  }

  template <typename T>
  void read_count(const std::string& key, T& out, bool positive) {
    const Value* v = find(key);
    if (!v) return;
    const auto* n = std::get_if<std::uint64_t>(&v->v);
    if (!n) {
      error(key, "must be a non-negative integer");
      return;
    }
    if (positive && *n == 0) {
      error(key, "must be positive");
      return;
    }
    if (*n > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
      error(key, "is out of range");
      return;
    }
    out = static_cast<T>(*n);
  }

  void read_duration(const std::string& key, int64_t& out) {
    const Value* v = find(key);
    if (!v) return;
    double d = 0.0;
    if (const auto* n = std::get_if<std::uint64_t>(&v->v)) {
      d = static_cast<double>(*n);
    } else if (const auto* f = std::get_if<double>(&v->v)) {
      d = *f;
    } else {
      error(key, "must be a number");
      return;
    }
    if (d <= 0.0) {
      error(key, "must be positive");
      return;
    }
    if (!(d < 9223372036854775808.0)) {
      error(key, "is out of range");
      return;
    }
    out = static_cast<int64_t>(d);
  }

  void read_double(const std::string& key, double& out) {
    const Value* v = find(key);
    if (!v) return;
    if (const auto* f = std::get_if<double>(&v->v)) {
      out = *f;
    } else if (const auto* n = std::get_if<std::uint64_t>(&v->v)) {
      out = static_cast<double>(*n);
    } else {
      error(key, "must be a number");
    }
  }

  const Object* section(const std::string& key) {
    const Value* v = find(key);
    if (!v) return nullptr;
    const auto* o = std::get_if<Object>(&v->v);
    if (!o) error(key, "must be an object");
    return o;
  }

  void mark(const std::string& key) { known_.insert(key); }

  void warn_unknown() const {
    for (const auto& [key, v] : obj_) {
      if (!known_.contains(key)) result_.warnings.push_back("unknown key: " + prefix_ + key);
    }
  }

  void error(const std::string& key, const std::string& what) {
    result_.errors.push_back(prefix_ + key + " " + what);
  }

 private:
  const Value* find(const std::string& key) {
    known_.insert(key);
    auto it = obj_.find(key);
    return it == obj_.end() ? nullptr : &it->second;
  }

  const Object&           obj_;
  std::string             prefix_;
  ConfigValidationResult& result_;
  std::set<std::string>   known_;
};

bool in_unit_interval(double d) { return d > 0.0 && d <= 1.0; }

ArbitrationConfig read_config(const Object& root, ConfigValidationResult& r) {
  ArbitrationConfig c;
  ConfigReader top(root, "", r);

  top.mark("config_version");
  auto vit = root.find("config_version");
  if (vit == root.end()) {
    r.warnings.push_back("config_version missing, assuming \"1\"");
    r.config_version = "1";
  } else if (const auto* s = std::get_if<std::string>(&vit->second.v)) {
    r.config_version = *s;
  } else if (const auto* n = std::get_if<std::uint64_t>(&vit->second.v)) {
    r.config_version = std::to_string(*n);
  } else {
    top.error("config_version", "must be a string");
  }
  if (!r.config_version.empty()) {
    char* end = nullptr;
    const unsigned long found = std::strtoul(r.config_version.c_str(), &end, 10);
    if (end == r.config_version.c_str() || *end != '\0') {
      top.error("config_version", "is not a number: " + r.config_version);
    } else {
      const auto compat = version::check_config_version(static_cast<uint32_t>(found));
      if (!compat.ok) r.errors.push_back(compat.description);
    }
  }

  top.read_bool("auto_apply_precedents", c.auto_apply_precedents);
  top.read_bool("enable_waivers", c.enable_waivers);
  top.read_bool("enable_appeals", c.enable_appeals);
  top.read_bool("track_performance", c.track_performance);
  top.read_count("max_concurrent_sessions", c.max_concurrent_sessions, true);
  top.read_count("session_timeout_ms", c.session_timeout_ms, true);

  if (const Object* p = top.section("precedents")) {
    ConfigReader s(*p, "precedents.", r);
    s.read_double("min_similarity_score", c.precedents.min_similarity_score);
    s.read_count("default_limit", c.precedents.default_limit, true);
    if (!in_unit_interval(c.precedents.min_similarity_score)) {
      s.error("min_similarity_score", "must be in (0,1]");
    }
    s.warn_unknown();
  }

  if (const Object* w = top.section("waivers")) {
    ConfigReader s(*w, "waivers.", r);
    s.read_count("min_justification_length", c.waivers.min_justification_length, false);
    s.read_count("min_evidence_for_approval", c.waivers.min_evidence_for_approval, false);
    s.read_bool("allow_conditional_waivers", c.waivers.allow_conditional_waivers);
    s.read_duration("max_waiver_duration_ms", c.waivers.max_waiver_duration_ms);
    s.read_bool("auto_revoke_on_expiration", c.waivers.auto_revoke_on_expiration);
    s.warn_unknown();
  }

  if (const Object* a = top.section("appeals")) {
    ConfigReader s(*a, "appeals.", r);
    s.read_count("max_active_appeals_per_appellant", c.appeals.max_active_appeals_per_appellant, false);
    s.read_double("majority_threshold", c.appeals.majority_threshold);
    s.read_count("min_reviewers", c.appeals.min_reviewers, true);
    s.read_count("min_new_evidence_for_overturn", c.appeals.min_new_evidence_for_overturn, false);
    s.read_count("min_grounds_length", c.appeals.min_grounds_length, false);
    s.read_bool("require_participant_appellant", c.appeals.require_participant_appellant);
    if (!in_unit_interval(c.appeals.majority_threshold)) {
      s.error("majority_threshold", "must be in (0,1]");
    }
    s.warn_unknown();
  }

  if (const Object* vw = top.section("verdict_weights")) {
    ConfigReader s(*vw, "verdict_weights.", r);
    s.read_double("rule", c.verdict_weights.rule);
    s.read_double("precedent", c.verdict_weights.precedent);
    s.read_double("evidence", c.verdict_weights.evidence);
    if (c.verdict_weights.rule < 0.0 || c.verdict_weights.precedent < 0.0 ||
        c.verdict_weights.evidence < 0.0) {
      r.errors.push_back("verdict_weights must be non-negative");
    } else if (!c.verdict_weights.sums_to_one()) {
      r.errors.push_back("verdict_weights must sum to 1");
    }
    s.warn_unknown();
  }

  top.warn_unknown();
  return c;
}

std::optional<bool> parse_flag(const std::string& s) {
  if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
  if (s == "0" || s == "false" || s == "no" || s == "off") return false;
  return std::nullopt;
}

std::optional<uint64_t> parse_positive(const std::string& s) {
  if (s.empty() || s[0] == '-') return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || v == 0) return std::nullopt;
  return static_cast<uint64_t>(v);
}

}  // namespace

std::string ArbitrationConfig::to_json() const {
  auto b = [](bool v) { return v ? "true" : "false"; };
  std::ostringstream o;
  o << "{\"config_version\":\"" << version::CONFIG_SCHEMA_VERSION << "\""
    << ",\"auto_apply_precedents\":" << b(auto_apply_precedents)
    << ",\"enable_waivers\":" << b(enable_waivers)
    << ",\"enable_appeals\":" << b(enable_appeals)
    << ",\"track_performance\":" << b(track_performance)
    << ",\"max_concurrent_sessions\":" << max_concurrent_sessions
    << ",\"session_timeout_ms\":" << session_timeout_ms
    << ",\"precedents\":{\"min_similarity_score\":" << jsonlite::format_double(precedents.min_similarity_score)
    << ",\"default_limit\":" << precedents.default_limit << "}"
    << ",\"waivers\":{\"min_justification_length\":" << waivers.min_justification_length
    << ",\"min_evidence_for_approval\":" << waivers.min_evidence_for_approval
    << ",\"allow_conditional_waivers\":" << b(waivers.allow_conditional_waivers)
    << ",\"max_waiver_duration_ms\":" << waivers.max_waiver_duration_ms
    << ",\"auto_revoke_on_expiration\":" << b(waivers.auto_revoke_on_expiration) << "}"
    << ",\"appeals\":{\"max_active_appeals_per_appellant\":" << appeals.max_active_appeals_per_appellant
    << ",\"majority_threshold\":" << jsonlite::format_double(appeals.majority_threshold)
    << ",\"min_reviewers\":" << appeals.min_reviewers
    << ",\"min_new_evidence_for_overturn\":" << appeals.min_new_evidence_for_overturn
    << ",\"min_grounds_length\":" << appeals.min_grounds_length
    << ",\"require_participant_appellant\":" << b(appeals.require_participant_appellant) << "}"
    << ",\"verdict_weights\":{\"rule\":" << jsonlite::format_double(verdict_weights.rule)
    << ",\"precedent\":" << jsonlite::format_double(verdict_weights.precedent)
    << ",\"evidence\":" << jsonlite::format_double(verdict_weights.evidence) << "}"
    << "}";
  return o.str();
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  config_from_json(config_json, &r);
  return r;
}

std::optional<ArbitrationConfig> config_from_json(const std::string& config_json,
                                                  ConfigValidationResult* result) {
  ConfigValidationResult local;
  ConfigValidationResult& r = result ? *result : local;
  r = ConfigValidationResult{};

  std::optional<jsonlite::JsonError> err;
  const Object root = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return std::nullopt;
  }

  ArbitrationConfig c = read_config(root, r);
  r.ok = r.errors.empty();
  if (!r.ok) return std::nullopt;
  return c;
}

void apply_env_overrides(ArbitrationConfig& config, std::vector<std::string>* warnings) {
  auto warn = [&](const std::string& msg) {
    if (warnings) warnings->push_back(msg);
  };

  if (const char* e = std::getenv("TRIBUNAL_MAX_CONCURRENT_SESSIONS")) {
    const auto v = parse_positive(e);
    if (v && *v <= std::numeric_limits<uint32_t>::max()) {
      config.max_concurrent_sessions = static_cast<uint32_t>(*v);
    } else {
      warn(std::string("ignoring TRIBUNAL_MAX_CONCURRENT_SESSIONS=") + e);
    }
  }
  if (const char* e = std::getenv("TRIBUNAL_SESSION_TIMEOUT_MS")) {
    if (const auto v = parse_positive(e)) {
      config.session_timeout_ms = *v;
    } else {
      warn(std::string("ignoring TRIBUNAL_SESSION_TIMEOUT_MS=") + e);
    }
  }
  if (const char* e = std::getenv("TRIBUNAL_ENABLE_WAIVERS")) {
    if (const auto v = parse_flag(e)) {
      config.enable_waivers = *v;
    } else {
      warn(std::string("ignoring TRIBUNAL_ENABLE_WAIVERS=") + e);
    }
  }
  if (const char* e = std::getenv("TRIBUNAL_ENABLE_APPEALS")) {
    if (const auto v = parse_flag(e)) {
      config.enable_appeals = *v;
    } else {
      warn(std::string("ignoring TRIBUNAL_ENABLE_APPEALS=") + e);
    }
  }
}

}  // namespace tribunal
