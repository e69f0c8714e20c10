#pragma once

// tribunal/case_file.hpp: JSON case documents consumed by `tribunal arbitrate`.
//
//   {
//     "violation":    { "id", "rule_id", "violator", "severity", "description",
//                       "context": {..}, "detected_at_unix_ms", "evidence": [..] },
//     "rules":        [ { "id", "version", "category", "title", "description",
//                         "condition", "severity", "waivable", "required_evidence",
//                         "effective_from_unix_ms", "expires_at_unix_ms",
//                         "metadata": {..} } ],
//     "participants": [ .. ],
//     "issued_by":    "arbiter",
//     "waiver":       { "id", "rule_id", "requested_by", "justification",
//                       "evidence", "requested_duration_ms", "decided_by" },
//     "appeal":       { "appellant_id", "grounds", "new_evidence", "reviewers",
//                       "votes": [ { "reviewer_id", "recommendation", "rationale" } ] }
//   }
//
// "waiver" and "appeal" are optional; when both are present the appeal runs
// first, since a waiver completes the session.

#include <optional>
#include <string>
#include <vector>

#include "tribunal/types.hpp"

namespace tribunal {

struct CaseAppeal {
  std::string appellant_id;
  std::string grounds;
  std::vector<std::string>  new_evidence;
  std::vector<std::string>  reviewers;
  std::vector<ReviewerVote> votes;
};

struct CaseFile {
  ConstitutionalViolation         violation;
  std::vector<ConstitutionalRule> rules;
  std::vector<std::string>        participants;
  std::string                     issued_by{"arbiter"};
  std::optional<WaiverRequest>    waiver;
  std::string                     waiver_decided_by{"waiver-board"};
  std::optional<CaseAppeal>       appeal;
};

// Returns nullopt and sets *error on malformed input.
std::optional<CaseFile> parse_case_file(const std::string& json, std::string* error);

}  // namespace tribunal
