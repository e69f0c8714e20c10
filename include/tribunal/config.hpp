#pragma once

// tribunal/config.hpp: Engine configuration.
//
// JSON layout (config_version "1"; every key optional):
//   {
//     "config_version": "1",
//     "auto_apply_precedents": true,  "enable_waivers": true,
//     "enable_appeals": true,         "track_performance": true,
//     "max_concurrent_sessions": 10,  "session_timeout_ms": 300000,
//     "precedents":      { "min_similarity_score", "default_limit" },
//     "waivers":         { "min_justification_length", "min_evidence_for_approval",
//                          "allow_conditional_waivers", "max_waiver_duration_ms",
//                          "auto_revoke_on_expiration" },
//     "appeals":         { "max_active_appeals_per_appellant", "majority_threshold",
//                          "min_reviewers", "min_new_evidence_for_overturn",
//                          "min_grounds_length", "require_participant_appellant" },
//     "verdict_weights": { "rule", "precedent", "evidence" }
//   }
//
// Unknown keys are warnings. Wrong types, non-positive limits, thresholds
// outside (0,1] and weights that do not sum to 1 are errors.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tribunal/appeal.hpp"
#include "tribunal/precedent.hpp"
#include "tribunal/verdict.hpp"
#include "tribunal/waiver.hpp"

namespace tribunal {

struct ArbitrationConfig {
  bool     auto_apply_precedents{true};
  bool     enable_waivers{true};
  bool     enable_appeals{true};
  uint32_t max_concurrent_sessions{10};
  uint64_t session_timeout_ms{300000};
  bool     track_performance{true};

  PrecedentManagerConfig  precedents;
  WaiverInterpreterConfig waivers;
  AppealArbitratorConfig  appeals;
  VerdictWeights          verdict_weights;

  std::string to_json() const;
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const std::string& config_json);

// Parses and validates. Returns nullopt and fills *result (when given) if the
// document has errors; warnings alone do not fail the parse.
std::optional<ArbitrationConfig> config_from_json(const std::string& config_json,
                                                  ConfigValidationResult* result = nullptr);

// Applies TRIBUNAL_MAX_CONCURRENT_SESSIONS, TRIBUNAL_SESSION_TIMEOUT_MS,
// TRIBUNAL_ENABLE_WAIVERS and TRIBUNAL_ENABLE_APPEALS. Malformed values are
// reported in *warnings and ignored.
void apply_env_overrides(ArbitrationConfig& config, std::vector<std::string>* warnings = nullptr);

}  // namespace tribunal
