#pragma once

// tribunal/precedent.hpp: Precedent store and similarity search.
//
// DESIGN:
//   The store is an append-only, copy-on-write list. Readers grab the current
//   snapshot (a shared_ptr to an immutable vector of immutable precedents) and
//   search it without holding any lock. create_precedent() builds the next
//   snapshot from the current one plus the new precedent and publishes it under
//   write_mu_. A precedent therefore becomes visible atomically, and a snapshot
//   taken before a creation never contains it.
//
//   Citations and overrulings live in side ledgers keyed by precedent id.
//   The Precedent record itself is never mutated after publication.
//
// SIMILARITY (each factor in [0,1]):
//   0.4 * category match
//   0.2 * severity proximity   (1 - |delta| / 3)
//   0.2 * keyword overlap      (Jaccard over lowercase tokens of >= 3 chars)
//   0.2 * rule-id overlap      (Jaccard)

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tribunal/types.hpp"

namespace tribunal {

struct PrecedentManagerConfig {
  double min_similarity_score{0.3};
  size_t default_limit{5};
};

struct PrecedentMatch {
  std::shared_ptr<const Precedent> precedent;
  double similarity{0.0};
  std::vector<std::string> matching_factors;
};

struct PrecedentAttributes {
  RuleCategory      category{RuleCategory::code_quality};
  ViolationSeverity severity{ViolationSeverity::medium};
  std::vector<std::string> conditions;
};

enum class PrecedentSort { recency, citations };

struct PrecedentQuery {
  std::vector<RuleCategory>        categories;   // empty = any
  std::optional<ViolationSeverity> severity;
  std::vector<std::string>         keywords;     // any token match
  uint64_t                         min_citations{0};
  PrecedentSort                    sort_by{PrecedentSort::recency};
  size_t                           limit{0};     // 0 = unlimited
};

struct ApplicabilityAssessment {
  bool        applicable{false};
  double      confidence{0.0};
  std::string reasoning;
};

struct PrecedentStatistics {
  uint64_t    total{0};
  uint64_t    valid{0};
  uint64_t    overruled{0};
  double      average_citations{0.0};
  std::string most_cited_id;
  std::map<std::string, uint64_t> by_category;

  std::string to_json() const;
};

// Lowercase alphanumeric tokens of at least three characters, deduplicated.
std::vector<std::string> tokenize_keywords(const std::vector<std::string>& texts);

class PrecedentManager {
 public:
  using Snapshot = std::shared_ptr<const std::vector<std::shared_ptr<const Precedent>>>;

  explicit PrecedentManager(PrecedentManagerConfig config = {});

  Snapshot snapshot() const;

  std::vector<PrecedentMatch> find_similar_precedents(RuleCategory category,
                                                      ViolationSeverity severity,
                                                      const std::vector<std::string>& description_keywords,
                                                      const std::vector<std::string>& rule_ids,
                                                      size_t limit) const;

  std::shared_ptr<const Precedent> create_precedent(const Verdict& verdict,
                                                    const std::string& title,
                                                    const std::vector<std::string>& evidence_keywords,
                                                    const std::string& reasoning,
                                                    const PrecedentAttributes& attributes);

  std::optional<Precedent> get_precedent(const std::string& id) const;
  std::vector<Precedent> search_precedents(const PrecedentQuery& query) const;

  bool cite_precedent(const std::string& id, const std::string& citing_id);
  bool overrule_precedent(const std::string& id, const std::string& overruled_by,
                          const std::string& reason);
  bool is_valid(const std::string& id) const;
  uint64_t citation_count(const std::string& id) const;
  std::vector<std::string> citing_precedents(const std::string& id) const;
  std::optional<std::string> overruled_by(const std::string& id) const;
  std::optional<std::string> overruling_reason(const std::string& id) const;

  ApplicabilityAssessment assess_applicability(const Precedent& precedent,
                                               RuleCategory category,
                                               ViolationSeverity severity) const;

  PrecedentStatistics statistics() const;
  size_t size() const;
  void clear();

  const PrecedentManagerConfig& config() const { return config_; }

 private:
  struct Overruling {
    std::string by;
    std::string reason;
    uint64_t    at_unix_ms{0};
  };

  PrecedentManagerConfig config_;

  mutable std::mutex write_mu_;   // serializes writers and guards snapshot_ swaps
  Snapshot snapshot_;
  uint64_t next_sequence_{1};

  mutable std::mutex ledger_mu_;
  std::map<std::string, std::vector<std::string>> citations_;
  std::map<std::string, Overruling> overrulings_;
};

}  // namespace tribunal
