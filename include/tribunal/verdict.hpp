#pragma once

// tribunal/verdict.hpp: Verdict synthesis.
//
// CONFIDENCE:
//   confidence = w_rule * R + w_precedent * P + w_evidence * E, clamped to
//   [0,1] and rounded to 4 decimals, where
//     R = mean strength of the applicable, violated rules (0 if none)
//     P = 0.5 + 0.5 * mean(agreement) over the session's precedents, 0.5 if none.
//         agreement: +1 same category and severity, +0.5 same category and one
//         severity step apart, 0 same category further apart, -1 other category.
//     E = min(1, evidence / 3) * (1 - 0.5 * missing_ratio)
//
// OUTCOME:
//   dismissed    no applicable rule is violated
//   conditional  violated, and confidence < 0.6 or required evidence is missing
//   confirmed    otherwise
//
// INVARIANT: generation depends only on the session passed in. Two calls over
//   the same session state produce verdicts that differ only in
//   issued_at_unix_ms; id and digest are identical.
//
// EXTENSION_POINT: alternative generators
//   VerdictGenerator is the seam. The orchestrator accepts any implementation
//   through OrchestratorComponents.

#include <cstdint>
#include <string>

#include "tribunal/types.hpp"

namespace tribunal {

struct VerdictWeights {
  double rule{0.5};
  double precedent{0.2};
  double evidence{0.3};

  bool sums_to_one() const;
};

struct VerdictGenerationResult {
  Verdict  verdict;
  uint64_t generation_time_ms{0};
};

class VerdictGenerator {
 public:
  virtual ~VerdictGenerator() = default;
  virtual VerdictGenerationResult generate_verdict(const ArbitrationSession& session,
                                                   const std::string& issued_by) = 0;
};

class WeightedVerdictGenerator : public VerdictGenerator {
 public:
  explicit WeightedVerdictGenerator(VerdictWeights weights = {});

  VerdictGenerationResult generate_verdict(const ArbitrationSession& session,
                                           const std::string& issued_by) override;

  const VerdictWeights& weights() const { return weights_; }

 private:
  VerdictWeights weights_;
};

// Round to 4 decimals and clamp to [0,1].
double normalize_confidence(double c);

// Assigns the id and digest fields of a verdict about to be stored on a
// session that has already recorded `prior_verdicts` verdicts.
void seal_verdict(Verdict& verdict, size_t prior_verdicts);

}  // namespace tribunal
