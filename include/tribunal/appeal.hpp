#pragma once

// tribunal/appeal.hpp: Appeal submission and panel review.
//
// DESIGN:
//   The arbitrator keeps every appeal it has seen, keyed by id, plus the
//   explicit votes cast ahead of review. It never touches a session; the
//   orchestrator passes the session and verdict in and applies the decision.
//
// AGGREGATION:
//   Each listed reviewer contributes one recommendation: the vote it cast via
//   cast_vote() if it carries one, else a recommendation derived from the
//   appeal (overturn when new evidence and grounds both meet their minimums,
//   uphold otherwise).
//     unanimous                       -> that outcome, confidence 1.0
//     top fraction >= majority        -> that outcome, confidence = fraction
//     otherwise (or tied at the top)  -> remanded, confidence = top fraction
//   An overturned decision always carries new_verdict.

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tribunal/types.hpp"

namespace tribunal {

struct AppealArbitratorConfig {
  uint32_t max_active_appeals_per_appellant{1};   // per session; 0 = unlimited
  double   majority_threshold{0.66};
  uint32_t min_reviewers{1};
  uint32_t min_new_evidence_for_overturn{2};
  size_t   min_grounds_length{20};
  bool     require_participant_appellant{false};
};

struct AppealStatistics {
  uint64_t total{0};
  uint64_t decided{0};
  uint64_t upheld{0};
  uint64_t overturned{0};
  uint64_t remanded{0};
  uint64_t withdrawn{0};

  std::string to_json() const;
};

class AppealArbitrator {
 public:
  explicit AppealArbitrator(AppealArbitratorConfig config = {});

  // Throws ArbitrationError: APPEAL_LIMIT_EXCEEDED, INVALID_ARGUMENT.
  Appeal submit_appeal(const ArbitrationSession& session, const Verdict& verdict,
                       const std::string& appellant_id, const std::string& grounds,
                       const std::vector<std::string>& new_evidence);

  // Records or replaces the reviewer's vote. Throws APPEAL_NOT_FOUND,
  // APPEAL_ALREADY_DECIDED.
  void cast_vote(const std::string& appeal_id, const ReviewerVote& vote);

  // Throws APPEAL_NOT_FOUND, APPEAL_ALREADY_DECIDED, INSUFFICIENT_REVIEWERS.
  AppealDecision review_appeal(const std::string& appeal_id,
                               const std::vector<std::string>& reviewers,
                               const ArbitrationSession& session, const Verdict& verdict);

  std::optional<Appeal> get_appeal(const std::string& appeal_id) const;
  std::vector<Appeal> appeals_for_session(const std::string& session_id) const;
  std::optional<AppealDecision> decision_for(const std::string& appeal_id) const;

  // False when unknown or already decided.
  bool withdraw_appeal(const std::string& appeal_id);

  AppealStatistics statistics() const;
  void clear();

  const AppealArbitratorConfig& config() const { return config_; }

 private:
  AppealRecommendation derived_recommendation(const Appeal& appeal) const;
  Verdict synthesize_verdict(const Appeal& appeal, const ArbitrationSession& session,
                             const Verdict& original, double confidence) const;
  Verdict adopt_proposed_verdict(Verdict proposed, const ArbitrationSession& session,
                                 const std::string& reviewer_id) const;

  AppealArbitratorConfig config_;
  mutable std::mutex mu_;
  uint64_t next_id_{1};
  std::map<std::string, Appeal> appeals_;
  std::vector<std::string> order_;   // submission order
  std::map<std::string, std::vector<ReviewerVote>> votes_;
  std::map<std::string, AppealDecision> decisions_;
};

AppealOutcome outcome_for(AppealRecommendation r);

}  // namespace tribunal
