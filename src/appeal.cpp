#include "tribunal/appeal.hpp"

#include <algorithm>
#include <array>
#include <sstream>

#include "tribunal/jsonlite.hpp"
#include "tribunal/verdict.hpp"

namespace tribunal {

namespace {

constexpr std::array<AppealRecommendation, 3> kRecommendations = {
    AppealRecommendation::uphold, AppealRecommendation::overturn, AppealRecommendation::remand};

VerdictOutcome flipped(VerdictOutcome o) {
  return o == VerdictOutcome::dismissed ? VerdictOutcome::confirmed : VerdictOutcome::dismissed;
}

size_t recorded_verdicts(const ArbitrationSession& session) {
  return static_cast<size_t>(std::count_if(session.history.begin(), session.history.end(),
                                           [](const SessionEvent& ev) {
                                             return std::holds_alternative<VerdictRecord>(ev);
                                           }));
}

}  // namespace

AppealOutcome outcome_for(AppealRecommendation r) {
  switch (r) {
    case AppealRecommendation::uphold: return AppealOutcome::upheld;
    case AppealRecommendation::overturn: return AppealOutcome::overturned;
    case AppealRecommendation::remand: return AppealOutcome::remanded;
  }
  return AppealOutcome::remanded;
}

std::string AppealStatistics::to_json() const {
  std::ostringstream o;
  o << "{\"total\":" << total << ",\"decided\":" << decided << ",\"upheld\":" << upheld
    << ",\"overturned\":" << overturned << ",\"remanded\":" << remanded
    << ",\"withdrawn\":" << withdrawn << "}";
  return o.str();
}

AppealArbitrator::AppealArbitrator(AppealArbitratorConfig config) : config_(config) {}

Appeal AppealArbitrator::submit_appeal(const ArbitrationSession& session, const Verdict& verdict,
                                       const std::string& appellant_id, const std::string& grounds,
                                       const std::vector<std::string>& new_evidence) {
  if (appellant_id.empty()) {
    throw ArbitrationError(ErrorCode::invalid_argument, "appellant id is empty", session.id);
  }
  if (config_.require_participant_appellant &&
      std::find(session.participants.begin(), session.participants.end(), appellant_id) ==
          session.participants.end()) {
    throw ArbitrationError(ErrorCode::invalid_argument,
                           "appellant " + appellant_id + " is not a session participant", session.id);
  }

  std::lock_guard<std::mutex> lk(mu_);
  if (config_.max_active_appeals_per_appellant > 0) {
    uint32_t active = 0;
    for (const auto& [id, a] : appeals_) {
      if (a.session_id == session.id && a.appellant_id == appellant_id &&
          (a.status == AppealStatus::submitted || a.status == AppealStatus::under_review)) {
        ++active;
      }
    }
    if (active >= config_.max_active_appeals_per_appellant) {
      throw ArbitrationError(ErrorCode::appeal_limit_exceeded,
                             "appellant " + appellant_id + " already has " + std::to_string(active) +
                                 " active appeal(s) on this session",
                             session.id);
    }
  }

  Appeal a;
  a.id                   = "APPEAL-" + std::to_string(next_id_++);
  a.session_id           = session.id;
  a.original_verdict_id  = verdict.id;
  a.appellant_id         = appellant_id;
  a.grounds              = grounds;
  a.new_evidence         = new_evidence;
  a.status               = AppealStatus::submitted;
  a.submitted_at_unix_ms = now_unix_ms();
  appeals_[a.id] = a;
  order_.push_back(a.id);
  return a;
}

void AppealArbitrator::cast_vote(const std::string& appeal_id, const ReviewerVote& vote) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = appeals_.find(appeal_id);
  if (it == appeals_.end()) {
    throw ArbitrationError(ErrorCode::appeal_not_found, "Appeal not found: " + appeal_id);
  }
  if (it->second.status == AppealStatus::decided || it->second.status == AppealStatus::withdrawn) {
    throw ArbitrationError(ErrorCode::appeal_already_decided,
                           "appeal " + appeal_id + " is " + to_string(it->second.status),
                           it->second.session_id);
  }
  auto& votes = votes_[appeal_id];
  for (auto& v : votes) {
    if (v.reviewer_id == vote.reviewer_id) {
      v = vote;
      return;
    }
  }
  votes.push_back(vote);
}

AppealRecommendation AppealArbitrator::derived_recommendation(const Appeal& appeal) const {
  if (appeal.new_evidence.size() >= config_.min_new_evidence_for_overturn &&
      appeal.grounds.size() >= config_.min_grounds_length) {
    return AppealRecommendation::overturn;
  }
  return AppealRecommendation::uphold;
}

Verdict AppealArbitrator::synthesize_verdict(const Appeal& appeal, const ArbitrationSession& session,
                                             const Verdict& original, double confidence) const {
  Verdict v;
  v.session_id    = session.id;
  v.outcome       = flipped(original.outcome);
  v.rules_applied = original.rules_applied;
  v.precedents    = original.precedents;
  v.evidence      = original.evidence;
  for (const auto& e : appeal.new_evidence) {
    if (std::find(v.evidence.begin(), v.evidence.end(), e) == v.evidence.end()) v.evidence.push_back(e);
  }
  v.confidence = normalize_confidence(confidence);
  v.issued_by  = "appeal-panel";
  v.reasoning.push_back(ReasoningStep{1, "Appeal " + appeal.id + " overturned verdict " + original.id +
                                             " (" + to_string(original.outcome) + ")",
                                      0.0});
  v.reasoning.push_back(ReasoningStep{2, "Grounds: " + appeal.grounds, 0.0});
  v.reasoning.push_back(ReasoningStep{3,
                                      "New evidence: " + std::to_string(appeal.new_evidence.size()) +
                                          " item(s), outcome " + to_string(v.outcome),
                                      v.confidence});
  seal_verdict(v, recorded_verdicts(session));
  v.issued_at_unix_ms = now_unix_ms();
  return v;
}

// A reviewer's proposal is bound to this session and re-sealed; its id and
// digest are never taken from the reviewer.
Verdict AppealArbitrator::adopt_proposed_verdict(Verdict proposed, const ArbitrationSession& session,
                                                 const std::string& reviewer_id) const {
  proposed.session_id = session.id;
  proposed.confidence = normalize_confidence(proposed.confidence);
  if (proposed.issued_by.empty()) proposed.issued_by = reviewer_id;
  seal_verdict(proposed, recorded_verdicts(session));
  proposed.issued_at_unix_ms = now_unix_ms();
  return proposed;
}

AppealDecision AppealArbitrator::review_appeal(const std::string& appeal_id,
                                               const std::vector<std::string>& reviewers,
                                               const ArbitrationSession& session,
                                               const Verdict& verdict) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = appeals_.find(appeal_id);
  if (it == appeals_.end()) {
    throw ArbitrationError(ErrorCode::appeal_not_found, "Appeal not found: " + appeal_id, session.id);
  }
  Appeal& appeal = it->second;
  if (appeal.session_id != session.id) {
    throw ArbitrationError(ErrorCode::appeal_not_found,
                           "Appeal not found: " + appeal_id + " does not belong to " + session.id,
                           session.id);
  }
  if (appeal.status == AppealStatus::decided || appeal.status == AppealStatus::withdrawn) {
    throw ArbitrationError(ErrorCode::appeal_already_decided,
                           "appeal " + appeal_id + " is " + to_string(appeal.status), session.id);
  }

  std::vector<std::string> panel;
  for (const auto& r : reviewers) {
    if (!r.empty() && std::find(panel.begin(), panel.end(), r) == panel.end()) panel.push_back(r);
  }
  if (panel.empty() || panel.size() < config_.min_reviewers) {
    throw ArbitrationError(ErrorCode::insufficient_reviewers,
                           "appeal " + appeal_id + " needs " +
                               std::to_string(std::max<uint32_t>(1, config_.min_reviewers)) +
                               " reviewer(s), got " + std::to_string(panel.size()),
                           session.id);
  }
  appeal.status = AppealStatus::under_review;

  const auto& cast = votes_[appeal_id];
  AppealDecision d;
  d.appeal_id = appeal_id;
  std::map<AppealRecommendation, size_t> tally;
  for (const auto& reviewer : panel) {
    ReviewerVote vote;
    vote.reviewer_id = reviewer;
    for (const auto& c : cast) {
      if (c.reviewer_id == reviewer) vote = c;
    }
    if (!vote.recommendation) {
      vote.recommendation = derived_recommendation(appeal);
      if (vote.rationale.empty()) vote.rationale = "derived from appeal grounds and new evidence";
    }
    ++tally[*vote.recommendation];
    d.votes.push_back(std::move(vote));
  }

  AppealRecommendation top = AppealRecommendation::remand;
  size_t top_count = 0;
  bool tied = false;
  for (auto r : kRecommendations) {
    const size_t n = tally[r];
    if (n > top_count) {
      top = r;
      top_count = n;
      tied = false;
    } else if (n == top_count && n > 0) {
      tied = true;
    }
  }
  const double fraction = static_cast<double>(top_count) / static_cast<double>(panel.size());

  std::ostringstream reasoning;
  if (top_count == panel.size()) {
    d.decision   = outcome_for(top);
    d.confidence = 1.0;
    reasoning << "Unanimous decision: " << top_count << " of " << panel.size()
              << " reviewer(s) recommend " << to_string(top);
  } else if (!tied && fraction >= config_.majority_threshold) {
    d.decision   = outcome_for(top);
    d.confidence = normalize_confidence(fraction);
    reasoning << "Majority decision: " << top_count << " of " << panel.size() << " reviewer(s) ("
              << jsonlite::format_double(fraction) << ") recommend " << to_string(top);
  } else {
    d.decision   = AppealOutcome::remanded;
    d.confidence = normalize_confidence(fraction);
    reasoning << "No majority: top recommendation " << to_string(top) << " at "
              << jsonlite::format_double(fraction) << " below threshold "
              << jsonlite::format_double(config_.majority_threshold)
              << "; remanded for further review";
  }
  d.reasoning = reasoning.str();

  if (d.decision == AppealOutcome::overturned) {
    for (const auto& v : d.votes) {
      if (v.recommendation == AppealRecommendation::overturn && v.proposed_verdict) {
        d.new_verdict = adopt_proposed_verdict(*v.proposed_verdict, session, v.reviewer_id);
        break;
      }
    }
    if (!d.new_verdict) d.new_verdict = synthesize_verdict(appeal, session, verdict, d.confidence);
  }

  d.decided_at_unix_ms = now_unix_ms();
  appeal.status = AppealStatus::decided;
  decisions_[appeal_id] = d;
  return d;
}

std::optional<Appeal> AppealArbitrator::get_appeal(const std::string& appeal_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = appeals_.find(appeal_id);
  if (it == appeals_.end()) return std::nullopt;
  return it->second;
}

std::vector<Appeal> AppealArbitrator::appeals_for_session(const std::string& session_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Appeal> out;
  for (const auto& id : order_) {
    const Appeal& a = appeals_.at(id);
    if (a.session_id == session_id) out.push_back(a);
  }
  return out;
}

std::optional<AppealDecision> AppealArbitrator::decision_for(const std::string& appeal_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = decisions_.find(appeal_id);
  if (it == decisions_.end()) return std::nullopt;
  return it->second;
}

bool AppealArbitrator::withdraw_appeal(const std::string& appeal_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = appeals_.find(appeal_id);
  if (it == appeals_.end()) return false;
  if (it->second.status == AppealStatus::decided || it->second.status == AppealStatus::withdrawn) {
    return false;
  }
  it->second.status = AppealStatus::withdrawn;
  votes_.erase(appeal_id);
  return true;
}

AppealStatistics AppealArbitrator::statistics() const {
  std::lock_guard<std::mutex> lk(mu_);
  AppealStatistics s;
  s.total = appeals_.size();
  for (const auto& [id, a] : appeals_) {
    if (a.status == AppealStatus::withdrawn) ++s.withdrawn;
  }
  for (const auto& [id, d] : decisions_) {
    ++s.decided;
    switch (d.decision) {
      case AppealOutcome::upheld: ++s.upheld; break;
      case AppealOutcome::overturned: ++s.overturned; break;
      case AppealOutcome::remanded: ++s.remanded; break;
    }
  }
  return s;
}

void AppealArbitrator::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  appeals_.clear();
  order_.clear();
  votes_.clear();
  decisions_.clear();
  next_id_ = 1;
}

}  // namespace tribunal
