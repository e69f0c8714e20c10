#include "tribunal/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "tribunal/jsonlite.hpp"

namespace tribunal {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<ArbitrationEventHook> g_event_hook{nullptr};

}  // namespace

std::string to_string(EventKind k) {
  switch (k) {
    case EventKind::session_started: return "session_started";
    case EventKind::transition: return "transition";
    case EventKind::transition_rejected: return "transition_rejected";
    case EventKind::phase_completed: return "phase_completed";
    case EventKind::verdict_issued: return "verdict_issued";
    case EventKind::precedent_created: return "precedent_created";
    case EventKind::waiver_decided: return "waiver_decided";
    case EventKind::appeal_submitted: return "appeal_submitted";
    case EventKind::appeal_decided: return "appeal_decided";
    case EventKind::session_completed: return "session_completed";
    case EventKind::session_failed: return "session_failed";
  }
  return "";
}

std::string to_string(Phase p) {
  switch (p) {
    case Phase::rule_evaluation: return "rule_evaluation";
    case Phase::precedent_lookup: return "precedent_lookup";
    case Phase::verdict_generation: return "verdict_generation";
    case Phase::waiver_evaluation: return "waiver_evaluation";
    case Phase::appeal_review: return "appeal_review";
  }
  return "";
}

std::string ArbitrationEvent::to_json() const {
  std::ostringstream o;
  o << "{\"kind\":\"" << to_string(kind) << "\""
    << ",\"session_id\":\"" << jsonlite::escape(session_id) << "\"";
  if (kind == EventKind::transition || kind == EventKind::transition_rejected) {
    o << ",\"from\":\"" << from_state << "\",\"to\":\"" << to_state << "\"";
  }
  if (kind == EventKind::phase_completed) {
    o << ",\"phase\":\"" << to_string(phase) << "\",\"duration_ns\":" << duration_ns;
  }
  o << ",\"ok\":" << (ok ? "true" : "false");
  if (!error_code.empty()) o << ",\"error_code\":\"" << error_code << "\"";
  if (!detail.empty()) o << ",\"detail\":\"" << jsonlite::escape(detail) << "\"";
  o << ",\"timestamp_unix_ms\":" << timestamp_unix_ms << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  const size_t b = bucket_for_us(us);
  buckets_[b].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      const double bucket_lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double bucket_hi = static_cast<double>(1ULL << i);
      return (bucket_lo + bucket_hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

void LatencyHistogram::reset() {
  for (auto& b : buckets_) b.store(0, std::memory_order_relaxed);
  count_.store(0, std::memory_order_relaxed);
  sum_us_.store(0, std::memory_order_relaxed);
}

std::string LatencyHistogram::to_json() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  std::string out;
  out.reserve(256);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(n);
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  const double p50_us = percentile(0.50);
  const double p95_us = percentile(0.95);
  const double p99_us = percentile(0.99);
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", p50_us / 1000.0);
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", p95_us / 1000.0);
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", p99_us / 1000.0);
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// ArbitrationStats
// ---------------------------------------------------------------------------

void ArbitrationStats::record(const ArbitrationEvent& ev) {
  switch (ev.kind) {
    case EventKind::session_started: sessions_started.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::transition: transitions.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::transition_rejected: transitions_rejected.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::phase_completed:
      phase_latency[static_cast<size_t>(ev.phase)].record(ev.duration_ns);
      break;
    case EventKind::verdict_issued: verdicts_issued.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::precedent_created: precedents_created.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::waiver_decided: waivers_decided.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::appeal_submitted: appeals_submitted.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::appeal_decided: appeals_decided.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::session_completed: sessions_completed.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::session_failed: sessions_failed.fetch_add(1, std::memory_order_relaxed); break;
  }

  if (!ev.ok && !ev.error_code.empty()) {
    std::lock_guard<std::mutex> lk(failure_mu_);
    ++failures_by_code_[ev.error_code];
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::map<std::string, uint64_t> ArbitrationStats::failure_counts() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failures_by_code_;
}

std::vector<ArbitrationEvent> ArbitrationStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  std::vector<ArbitrationEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

void ArbitrationStats::reset() {
  for (auto* c : {&sessions_started, &sessions_completed, &sessions_failed, &transitions,
                  &transitions_rejected, &verdicts_issued, &precedents_created,
                  &waivers_decided, &appeals_submitted, &appeals_decided}) {
    c->store(0, std::memory_order_relaxed);
  }
  for (auto& h : phase_latency) h.reset();
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    failures_by_code_.clear();
  }
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_buffer_.clear();
  ring_head_ = 0;
}

std::string ArbitrationStats::to_json() const {
  std::ostringstream o;
  o << "{\"sessions_started\":" << sessions_started.load(std::memory_order_relaxed)
    << ",\"sessions_completed\":" << sessions_completed.load(std::memory_order_relaxed)
    << ",\"sessions_failed\":" << sessions_failed.load(std::memory_order_relaxed)
    << ",\"transitions\":" << transitions.load(std::memory_order_relaxed)
    << ",\"transitions_rejected\":" << transitions_rejected.load(std::memory_order_relaxed)
    << ",\"verdicts_issued\":" << verdicts_issued.load(std::memory_order_relaxed)
    << ",\"precedents_created\":" << precedents_created.load(std::memory_order_relaxed)
    << ",\"waivers_decided\":" << waivers_decided.load(std::memory_order_relaxed)
    << ",\"appeals_submitted\":" << appeals_submitted.load(std::memory_order_relaxed)
    << ",\"appeals_decided\":" << appeals_decided.load(std::memory_order_relaxed);

  o << ",\"phase_latency\":{";
  for (size_t i = 0; i < kPhaseCount; ++i) {
    if (i) o << ",";
    o << "\"" << to_string(static_cast<Phase>(i)) << "\":" << phase_latency[i].to_json();
  }
  o << "}";

  o << ",\"failures\":{";
  bool first = true;
  for (const auto& [code, n] : failure_counts()) {
    if (!first) o << ",";
    first = false;
    o << "\"" << code << "\":" << n;
  }
  o << "}}";
  return o.str();
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

ArbitrationStats& global_arbitration_stats() {
  static ArbitrationStats inst;
  return inst;
}

void set_arbitration_event_hook(ArbitrationEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_arbitration_event(const ArbitrationEvent& ev) {
  global_arbitration_stats().record(ev);

  ArbitrationEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: TRIBUNAL_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("TRIBUNAL_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = ev.to_json() + "\n";
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace tribunal
