#pragma once

// tribunal/state_machine.hpp: Session lifecycle transition table.
//
//   INITIALIZED         -> RULE_EVALUATION
//   RULE_EVALUATION     -> EVIDENCE_COLLECTION | VERDICT_GENERATION
//   EVIDENCE_COLLECTION -> VERDICT_GENERATION
//   VERDICT_GENERATION  -> WAIVER_EVALUATION | APPEAL_REVIEW | COMPLETED
//   WAIVER_EVALUATION   -> COMPLETED
//   APPEAL_REVIEW       -> COMPLETED
//   DEBATE_IN_PROGRESS  -> VERDICT_GENERATION
//   COMPLETED           -> APPEAL_REVIEW          (reopen for a late appeal)
//   any non-terminal    -> COMPLETED | FAILED
//   FAILED              -> (none)
//
// Self-transitions are not in the table.

#include <string>
#include <vector>

#include "tribunal/types.hpp"

namespace tribunal {

bool can_transition(ArbitrationState from, ArbitrationState to);

// Every state reachable from `from` in one step, in enum order.
std::vector<ArbitrationState> allowed_transitions(ArbitrationState from);

// Throws ArbitrationError(INVALID_STATE_TRANSITION) when the edge is absent.
void validate_transition(ArbitrationState from, ArbitrationState to,
                         const std::string& session_id = "");

// True for every state in which a session counts against capacity.
inline bool is_active(ArbitrationState s) { return !is_terminal(s); }

}  // namespace tribunal
