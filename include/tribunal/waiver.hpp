#pragma once

// tribunal/waiver.hpp: Waiver interpretation and the active-waiver ledger.
//
// Evaluation order (first match decides):
//   1. negative requested duration   -> reject ("Invalid duration"), confidence 1.0
//   2. rule not waivable             -> reject, confidence 1.0
//   3. active waiver for the rule    -> reject
//   4. justification too short       -> reject
//   5. too little evidence           -> conditional approval, or reject when
//                                       conditional waivers are disabled
//   6. otherwise                     -> approve
// A requested duration of 0 means the maximum. Approvals longer than
// max_waiver_duration_ms are cut to the maximum.
// Approvals of critical rules always carry "Submit daily progress reports".

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tribunal/types.hpp"

namespace tribunal {

struct WaiverInterpreterConfig {
  size_t  min_justification_length{20};
  size_t  min_evidence_for_approval{2};
  bool    allow_conditional_waivers{true};
  int64_t max_waiver_duration_ms{7LL * 24 * 60 * 60 * 1000};
  bool    auto_revoke_on_expiration{false};
};

struct WaiverEvaluation {
  bool        should_approve{false};
  bool        conditional{false};
  std::string reasoning;
  double      confidence{0.0};
  std::vector<std::string> conditions;
  int64_t     recommended_duration_ms{0};
};

struct WaiverStatistics {
  uint64_t total_waivers{0};
  uint64_t approved_count{0};      // approved + partially_approved
  uint64_t rejected_count{0};
  uint64_t revoked_count{0};
  double   average_duration_ms{0.0};  // over granted waivers

  std::string to_json() const;
};

class WaiverInterpreter {
 public:
  explicit WaiverInterpreter(WaiverInterpreterConfig config = {});
  virtual ~WaiverInterpreter() = default;

  WaiverEvaluation evaluate_waiver(const WaiverRequest& request, const ConstitutionalRule& rule,
                                   uint64_t now_ms = now_unix_ms());

  // Evaluates, records and returns the decision. Virtual so a host can put a
  // review service behind it.
  virtual WaiverDecision process_waiver(const WaiverRequest& request, const ConstitutionalRule& rule,
                                        const std::string& decided_by,
                                        uint64_t now_ms = now_unix_ms());

  bool is_waiver_active(const std::string& rule_id, uint64_t now_ms = now_unix_ms());
  std::optional<WaiverDecision> active_waiver(const std::string& rule_id,
                                              uint64_t now_ms = now_unix_ms());
  std::vector<WaiverDecision> active_waivers(uint64_t now_ms = now_unix_ms());

  bool revoke_waiver(const std::string& rule_id, const std::string& revoked_by,
                     const std::string& reason);

  // Null when no waiver is active, the extension is not positive, or the
  // extended total exceeds the maximum.
  std::optional<WaiverDecision> extend_waiver(const std::string& rule_id, int64_t extension_ms,
                                              const std::string& extended_by,
                                              const std::string& reason,
                                              uint64_t now_ms = now_unix_ms());

  std::vector<WaiverDecision> history() const;
  size_t cleanup_expired(uint64_t now_ms = now_unix_ms());
  WaiverStatistics statistics() const;
  void clear();

  const WaiverInterpreterConfig& config() const { return config_; }

 private:
  // Requires mu_. Applies auto-revoke when configured.
  const WaiverDecision* find_active_locked(const std::string& rule_id, uint64_t now_ms);
  void update_history_locked(const WaiverDecision& d);

  WaiverInterpreterConfig config_;
  mutable std::mutex mu_;
  std::map<std::string, WaiverDecision> active_;   // rule_id -> granted decision
  std::vector<WaiverDecision> history_;
};

}  // namespace tribunal
