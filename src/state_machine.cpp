#include "tribunal/state_machine.hpp"

#include <array>

namespace tribunal {

namespace {

using S = ArbitrationState;

constexpr std::array<S, 9> kAllStates = {
    S::initialized,        S::rule_evaluation,   S::evidence_collection,
    S::verdict_generation, S::waiver_evaluation, S::appeal_review,
    S::debate_in_progress, S::completed,         S::failed,
};

bool explicit_edge(S from, S to) {
  switch (from) {
    case S::initialized:         return to == S::rule_evaluation;
    case S::rule_evaluation:     return to == S::evidence_collection || to == S::verdict_generation;
    case S::evidence_collection: return to == S::verdict_generation;
    case S::verdict_generation:
      return to == S::waiver_evaluation || to == S::appeal_review || to == S::completed;
    case S::waiver_evaluation:   return to == S::completed;
    case S::appeal_review:       return to == S::completed;
    case S::debate_in_progress:  return to == S::verdict_generation;
    case S::completed:           return to == S::appeal_review;
    case S::failed:              return false;
  }
  return false;
}

}  // namespace

bool can_transition(ArbitrationState from, ArbitrationState to) {
  if (from == to) return false;
  if (explicit_edge(from, to)) return true;
  return !is_terminal(from) && (to == S::completed || to == S::failed);
}

std::vector<ArbitrationState> allowed_transitions(ArbitrationState from) {
  std::vector<ArbitrationState> out;
  for (auto to : kAllStates) {
    if (can_transition(from, to)) out.push_back(to);
  }
  return out;
}

void validate_transition(ArbitrationState from, ArbitrationState to, const std::string& session_id) {
  if (can_transition(from, to)) return;
  throw ArbitrationError(ErrorCode::invalid_state_transition,
                         "Invalid state transition: " + to_string(from) + " -> " + to_string(to),
                         session_id);
}

}  // namespace tribunal
