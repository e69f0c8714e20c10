#include "tribunal/precedent.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

#include "tribunal/hash.hpp"
#include "tribunal/jsonlite.hpp"

namespace tribunal {

namespace {

double jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b,
               std::vector<std::string>* shared) {
  if (a.empty() || b.empty()) return 0.0;
  const std::set<std::string> sa(a.begin(), a.end());
  const std::set<std::string> sb(b.begin(), b.end());
  size_t inter = 0;
  for (const auto& x : sa) {
    if (sb.contains(x)) {
      ++inter;
      if (shared) shared->push_back(x);
    }
  }
  const size_t uni = sa.size() + sb.size() - inter;
  return uni == 0 ? 0.0 : static_cast<double>(inter) / static_cast<double>(uni);
}

std::vector<std::string> precedent_tokens(const Precedent& p) {
  std::vector<std::string> texts = p.key_facts;
  texts.push_back(p.title);
  return tokenize_keywords(texts);
}

}  // namespace

std::vector<std::string> tokenize_keywords(const std::vector<std::string>& texts) {
  std::set<std::string> seen;
  std::vector<std::string> out;
  for (const auto& text : texts) {
    std::string cur;
    auto flush = [&]() {
      if (cur.size() >= 3 && seen.insert(cur).second) out.push_back(cur);
      cur.clear();
    };
    for (char c : text) {
      if (std::isalnum(static_cast<unsigned char>(c))) {
        cur += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      } else {
        flush();
      }
    }
    flush();
  }
  return out;
}

std::string PrecedentStatistics::to_json() const {
  std::ostringstream o;
  o << "{\"total\":" << total
    << ",\"valid\":" << valid
    << ",\"overruled\":" << overruled
    << ",\"average_citations\":" << jsonlite::format_double(average_citations)
    << ",\"most_cited_id\":\"" << jsonlite::escape(most_cited_id) << "\""
    << ",\"by_category\":{";
  bool first = true;
  for (const auto& [cat, n] : by_category) {
    if (!first) o << ",";
    first = false;
    o << "\"" << cat << "\":" << n;
  }
  o << "}}";
  return o.str();
}

// ---------------------------------------------------------------------------
// PrecedentManager
// ---------------------------------------------------------------------------

PrecedentManager::PrecedentManager(PrecedentManagerConfig config)
    : config_(config),
      snapshot_(std::make_shared<const std::vector<std::shared_ptr<const Precedent>>>()) {}

PrecedentManager::Snapshot PrecedentManager::snapshot() const {
  std::lock_guard<std::mutex> lk(write_mu_);
  return snapshot_;
}

std::vector<PrecedentMatch> PrecedentManager::find_similar_precedents(
    RuleCategory category, ViolationSeverity severity,
    const std::vector<std::string>& description_keywords,
    const std::vector<std::string>& rule_ids, size_t limit) const {
  const Snapshot snap = snapshot();
  const auto query_tokens = tokenize_keywords(description_keywords);

  std::vector<PrecedentMatch> matches;
  for (const auto& p : *snap) {
    if (!is_valid(p->id)) continue;

    PrecedentMatch m;
    m.precedent = p;
    double score = 0.0;

    if (p->category == category) {
      score += 0.4;
      m.matching_factors.push_back("category:" + to_string(category));
    }

    const double proximity = 1.0 - static_cast<double>(severity_distance(p->severity, severity)) / 3.0;
    score += 0.2 * proximity;
    if (p->severity == severity) {
      m.matching_factors.push_back("severity:" + to_string(severity));
    } else if (proximity > 0.0) {
      m.matching_factors.push_back("severity_proximity:" + jsonlite::format_double(proximity));
    }

    std::vector<std::string> shared_kw;
    const double kw = jaccard(query_tokens, precedent_tokens(*p), &shared_kw);
    score += 0.2 * kw;
    for (const auto& k : shared_kw) m.matching_factors.push_back("keyword:" + k);

    std::vector<std::string> shared_rules;
    const double rules = jaccard(rule_ids, p->rules_involved, &shared_rules);
    score += 0.2 * rules;
    for (const auto& r : shared_rules) m.matching_factors.push_back("rule:" + r);

    m.similarity = std::clamp(score, 0.0, 1.0);
    if (m.similarity < config_.min_similarity_score) continue;
    matches.push_back(std::move(m));
  }

  std::sort(matches.begin(), matches.end(), [](const PrecedentMatch& a, const PrecedentMatch& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    return a.precedent->sequence > b.precedent->sequence;
  });
  if (limit > 0 && matches.size() > limit) matches.resize(limit);
  return matches;
}

std::shared_ptr<const Precedent> PrecedentManager::create_precedent(
    const Verdict& verdict, const std::string& title,
    const std::vector<std::string>& evidence_keywords, const std::string& reasoning,
    const PrecedentAttributes& attributes) {
  std::lock_guard<std::mutex> lk(write_mu_);

  auto p = std::make_shared<Precedent>();
  p->sequence           = next_sequence_++;
  p->id                 = "PREC-" + std::to_string(p->sequence);
  p->title              = title;
  p->description        = title + " (" + to_string(verdict.outcome) + ", verdict " + verdict.id + ")";
  p->key_facts          = evidence_keywords;
  p->reasoning          = reasoning;
  p->category           = attributes.category;
  p->severity           = attributes.severity;
  p->conditions         = attributes.conditions;
  p->rules_involved     = verdict.rules_applied;
  p->source_verdict_id  = verdict.id;
  p->outcome            = verdict.outcome;
  p->created_at_unix_ms = now_unix_ms();
  p->digest             = precedent_hash(p->to_json());

  auto next = std::make_shared<std::vector<std::shared_ptr<const Precedent>>>(*snapshot_);
  next->push_back(p);
  snapshot_ = std::move(next);
  return p;
}

std::optional<Precedent> PrecedentManager::get_precedent(const std::string& id) const {
  const Snapshot snap = snapshot();
  for (const auto& p : *snap) {
    if (p->id == id) return *p;
  }
  return std::nullopt;
}

std::vector<Precedent> PrecedentManager::search_precedents(const PrecedentQuery& query) const {
  const Snapshot snap = snapshot();
  const auto query_tokens = tokenize_keywords(query.keywords);

  std::vector<std::pair<std::shared_ptr<const Precedent>, uint64_t>> hits;
  for (const auto& p : *snap) {
    if (!query.categories.empty() &&
        std::find(query.categories.begin(), query.categories.end(), p->category) == query.categories.end()) {
      continue;
    }
    if (query.severity && p->severity != *query.severity) continue;
    if (!query_tokens.empty()) {
      const auto tokens = precedent_tokens(*p);
      const bool any = std::any_of(query_tokens.begin(), query_tokens.end(), [&](const std::string& t) {
        return std::find(tokens.begin(), tokens.end(), t) != tokens.end();
      });
      if (!any) continue;
    }
    const uint64_t cites = citation_count(p->id);
    if (cites < query.min_citations) continue;
    hits.emplace_back(p, cites);
  }

  std::sort(hits.begin(), hits.end(), [&](const auto& a, const auto& b) {
    if (query.sort_by == PrecedentSort::citations && a.second != b.second) return a.second > b.second;
    return a.first->sequence > b.first->sequence;
  });
  if (query.limit > 0 && hits.size() > query.limit) hits.resize(query.limit);

  std::vector<Precedent> out;
  out.reserve(hits.size());
  for (const auto& h : hits) out.push_back(*h.first);
  return out;
}

bool PrecedentManager::cite_precedent(const std::string& id, const std::string& citing_id) {
  if (!get_precedent(id)) return false;
  std::lock_guard<std::mutex> lk(ledger_mu_);
  citations_[id].push_back(citing_id);
  return true;
}

bool PrecedentManager::overrule_precedent(const std::string& id, const std::string& overruled_by,
                                          const std::string& reason) {
  if (!get_precedent(id)) return false;
  std::lock_guard<std::mutex> lk(ledger_mu_);
  if (overrulings_.contains(id)) return false;
  overrulings_[id] = Overruling{overruled_by, reason, now_unix_ms()};
  return true;
}

bool PrecedentManager::is_valid(const std::string& id) const {
  std::lock_guard<std::mutex> lk(ledger_mu_);
  return !overrulings_.contains(id);
}

uint64_t PrecedentManager::citation_count(const std::string& id) const {
  std::lock_guard<std::mutex> lk(ledger_mu_);
  auto it = citations_.find(id);
  return it == citations_.end() ? 0 : it->second.size();
}

std::vector<std::string> PrecedentManager::citing_precedents(const std::string& id) const {
  std::lock_guard<std::mutex> lk(ledger_mu_);
  auto it = citations_.find(id);
  return it == citations_.end() ? std::vector<std::string>{} : it->second;
}

std::optional<std::string> PrecedentManager::overruled_by(const std::string& id) const {
  std::lock_guard<std::mutex> lk(ledger_mu_);
  auto it = overrulings_.find(id);
  if (it == overrulings_.end()) return std::nullopt;
  return it->second.by;
}

std::optional<std::string> PrecedentManager::overruling_reason(const std::string& id) const {
  std::lock_guard<std::mutex> lk(ledger_mu_);
  auto it = overrulings_.find(id);
  if (it == overrulings_.end()) return std::nullopt;
  return it->second.reason;
}

ApplicabilityAssessment PrecedentManager::assess_applicability(const Precedent& precedent,
                                                               RuleCategory category,
                                                               ViolationSeverity severity) const {
  ApplicabilityAssessment a;
  if (!is_valid(precedent.id)) {
    a.reasoning = "Precedent " + precedent.id + " has been overruled";
    return a;
  }
  if (precedent.category != category) {
    a.reasoning = "Category mismatch: precedent is " + to_string(precedent.category) +
                  ", case is " + to_string(category);
    return a;
  }
  a.applicable = true;
  const int delta = severity_distance(precedent.severity, severity);
  a.confidence = std::max(0.0, 0.9 - 0.25 * static_cast<double>(delta));
  if (delta == 0) {
    a.reasoning = "Category and severity match";
  } else {
    a.reasoning = "Severity mismatch: precedent is " + to_string(precedent.severity) +
                  ", case is " + to_string(severity);
  }
  return a;
}

PrecedentStatistics PrecedentManager::statistics() const {
  const Snapshot snap = snapshot();
  PrecedentStatistics s;
  s.total = snap->size();
  uint64_t total_citations = 0;
  uint64_t best = 0;
  for (const auto& p : *snap) {
    ++s.by_category[to_string(p->category)];
    if (is_valid(p->id)) ++s.valid; else ++s.overruled;
    const uint64_t c = citation_count(p->id);
    total_citations += c;
    if (c > best) {
      best = c;
      s.most_cited_id = p->id;
    }
  }
  s.average_citations = s.total ? static_cast<double>(total_citations) / static_cast<double>(s.total) : 0.0;
  return s;
}

size_t PrecedentManager::size() const {
  return snapshot()->size();
}

void PrecedentManager::clear() {
  {
    std::lock_guard<std::mutex> lk(write_mu_);
    snapshot_ = std::make_shared<const std::vector<std::shared_ptr<const Precedent>>>();
    next_sequence_ = 1;
  }
  std::lock_guard<std::mutex> lk(ledger_mu_);
  citations_.clear();
  overrulings_.clear();
}

}  // namespace tribunal
