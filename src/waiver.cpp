#include "tribunal/waiver.hpp"

#include <sstream>

#include "tribunal/jsonlite.hpp"

namespace tribunal {

std::string WaiverStatistics::to_json() const {
  std::ostringstream o;
  o << "{\"total_waivers\":" << total_waivers
    << ",\"approved_count\":" << approved_count
    << ",\"rejected_count\":" << rejected_count
    << ",\"revoked_count\":" << revoked_count
    << ",\"average_duration_ms\":" << jsonlite::format_double(average_duration_ms)
    << "}";
  return o.str();
}

WaiverInterpreter::WaiverInterpreter(WaiverInterpreterConfig config) : config_(config) {}

const WaiverDecision* WaiverInterpreter::find_active_locked(const std::string& rule_id, uint64_t now_ms) {
  auto it = active_.find(rule_id);
  if (it == active_.end()) return nullptr;
  const auto& d = it->second;
  const bool expired = d.expires_at_unix_ms && *d.expires_at_unix_ms <= static_cast<int64_t>(now_ms);
  if (!expired) return &d;
  if (config_.auto_revoke_on_expiration) {
    WaiverDecision revoked = d;
    revoked.status = WaiverStatus::revoked;
    revoked.reasoning += "; auto-revoked on expiration";
    update_history_locked(revoked);
    active_.erase(it);
  }
  return nullptr;
}

void WaiverInterpreter::update_history_locked(const WaiverDecision& d) {
  for (auto& h : history_) {
    if (h.request_id == d.request_id && h.rule_id == d.rule_id) {
      h = d;
      return;
    }
  }
  history_.push_back(d);
}

WaiverEvaluation WaiverInterpreter::evaluate_waiver(const WaiverRequest& request,
                                                    const ConstitutionalRule& rule, uint64_t now_ms) {
  WaiverEvaluation e;
  const int64_t requested =
      request.requested_duration_ms == 0 ? config_.max_waiver_duration_ms : request.requested_duration_ms;

  if (request.requested_duration_ms < 0) {
    e.reasoning  = "Invalid duration: " + std::to_string(request.requested_duration_ms) + "ms requested";
    e.confidence = 1.0;
    return e;
  }

  if (!rule.waivable) {
    e.reasoning  = "Rule " + rule.id + " is not waivable";
    e.confidence = 1.0;
    return e;
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (find_active_locked(rule.id, now_ms)) {
      e.reasoning  = "Active waiver already exists for rule " + rule.id;
      e.confidence = 1.0;
      return e;
    }
  }

  if (request.justification.size() < config_.min_justification_length) {
    e.reasoning = "Insufficient justification: " + std::to_string(request.justification.size()) +
                  " characters, at least " + std::to_string(config_.min_justification_length) +
                  " required";
    e.confidence = 0.9;
    return e;
  }

  std::ostringstream reasoning;
  if (request.evidence.size() < config_.min_evidence_for_approval) {
    if (!config_.allow_conditional_waivers) {
      e.reasoning = "Insufficient evidence: " + std::to_string(request.evidence.size()) + " of " +
                    std::to_string(config_.min_evidence_for_approval) + " required item(s)";
      e.confidence = 0.8;
      return e;
    }
    e.conditional = true;
    e.confidence  = 0.6;
    e.conditions.push_back("Provide " +
                           std::to_string(config_.min_evidence_for_approval - request.evidence.size()) +
                           " additional supporting evidence item(s)");
    reasoning << "Conditional approval: insufficient evidence (" << request.evidence.size() << " of "
              << config_.min_evidence_for_approval << ")";
  } else {
    e.confidence = 0.9;
    reasoning << "Approved";
  }

  e.should_approve          = true;
  e.recommended_duration_ms = requested;
  if (requested > config_.max_waiver_duration_ms) {
    e.recommended_duration_ms = config_.max_waiver_duration_ms;
    e.confidence -= 0.1;
    reasoning << " with reduced duration (" << config_.max_waiver_duration_ms << "ms maximum)";
  }

  if (rule.severity == ViolationSeverity::critical) {
    e.conditions.push_back("Submit daily progress reports");
  }
  e.reasoning = reasoning.str();
  return e;
}

WaiverDecision WaiverInterpreter::process_waiver(const WaiverRequest& request,
                                                 const ConstitutionalRule& rule,
                                                 const std::string& decided_by, uint64_t now_ms) {
  const WaiverEvaluation e = evaluate_waiver(request, rule, now_ms);

  WaiverDecision d;
  d.request_id         = request.id;
  d.rule_id            = rule.id;
  d.reasoning          = e.reasoning;
  d.conditions         = e.conditions;
  d.confidence         = e.confidence;
  d.decided_by         = decided_by;
  d.decided_at_unix_ms = now_ms;

  if (!e.should_approve) {
    d.status = WaiverStatus::rejected;
  } else {
    d.status               = e.conditional ? WaiverStatus::partially_approved : WaiverStatus::approved;
    d.approved_duration_ms = e.recommended_duration_ms;
    d.expires_at_unix_ms   = static_cast<int64_t>(now_ms) + e.recommended_duration_ms;
    if (config_.auto_revoke_on_expiration) d.auto_revoke_at_unix_ms = d.expires_at_unix_ms;
  }

  std::lock_guard<std::mutex> lk(mu_);
  if (d.grants_waiver()) active_[rule.id] = d;
  history_.push_back(d);
  return d;
}

bool WaiverInterpreter::is_waiver_active(const std::string& rule_id, uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  return find_active_locked(rule_id, now_ms) != nullptr;
}

std::optional<WaiverDecision> WaiverInterpreter::active_waiver(const std::string& rule_id, uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  const WaiverDecision* d = find_active_locked(rule_id, now_ms);
  if (!d) return std::nullopt;
  return *d;
}

std::vector<WaiverDecision> WaiverInterpreter::active_waivers(uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> ids;
  for (const auto& [rule_id, d] : active_) ids.push_back(rule_id);
  std::vector<WaiverDecision> out;
  for (const auto& id : ids) {
    if (const WaiverDecision* d = find_active_locked(id, now_ms)) out.push_back(*d);
  }
  return out;
}

bool WaiverInterpreter::revoke_waiver(const std::string& rule_id, const std::string& revoked_by,
                                      const std::string& reason) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = active_.find(rule_id);
  if (it == active_.end()) return false;
  WaiverDecision revoked = it->second;
  revoked.status = WaiverStatus::revoked;
  revoked.reasoning += "; revoked by " + revoked_by + ": " + reason;
  update_history_locked(revoked);
  active_.erase(it);
  return true;
}

std::optional<WaiverDecision> WaiverInterpreter::extend_waiver(const std::string& rule_id,
                                                               int64_t extension_ms,
                                                               const std::string& extended_by,
                                                               const std::string& reason,
                                                               uint64_t now_ms) {
  if (extension_ms <= 0) return std::nullopt;
  std::lock_guard<std::mutex> lk(mu_);
  if (!find_active_locked(rule_id, now_ms)) return std::nullopt;
  WaiverDecision& d = active_[rule_id];
  const int64_t total = d.approved_duration_ms + extension_ms;
  if (total > config_.max_waiver_duration_ms) return std::nullopt;

  d.approved_duration_ms = total;
  d.expires_at_unix_ms   = static_cast<int64_t>(d.decided_at_unix_ms) + total;
  if (d.auto_revoke_at_unix_ms) d.auto_revoke_at_unix_ms = d.expires_at_unix_ms;
  d.reasoning += "; extended by " + extended_by + ": " + reason;
  update_history_locked(d);
  return d;
}

std::vector<WaiverDecision> WaiverInterpreter::history() const {
  std::lock_guard<std::mutex> lk(mu_);
  return history_;
}

size_t WaiverInterpreter::cleanup_expired(uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  size_t removed = 0;
  for (auto it = active_.begin(); it != active_.end();) {
    const auto& d = it->second;
    if (d.expires_at_unix_ms && *d.expires_at_unix_ms <= static_cast<int64_t>(now_ms)) {
      it = active_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

WaiverStatistics WaiverInterpreter::statistics() const {
  std::lock_guard<std::mutex> lk(mu_);
  WaiverStatistics s;
  s.total_waivers = history_.size();
  int64_t duration_sum = 0;
  uint64_t granted = 0;
  for (const auto& d : history_) {
    switch (d.status) {
      case WaiverStatus::approved:
      case WaiverStatus::partially_approved: ++s.approved_count; break;
      case WaiverStatus::rejected: ++s.rejected_count; break;
      case WaiverStatus::revoked: ++s.revoked_count; break;
    }
    if (d.status != WaiverStatus::rejected) {
      duration_sum += d.approved_duration_ms;
      ++granted;
    }
  }
  s.average_duration_ms = granted ? static_cast<double>(duration_sum) / static_cast<double>(granted) : 0.0;
  return s;
}

void WaiverInterpreter::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  active_.clear();
  history_.clear();
}

}  // namespace tribunal
