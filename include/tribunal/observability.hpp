#pragma once

// tribunal/observability.hpp: Structured arbitration observability layer.
//
// DESIGN:
//   ArbitrationEvent is the canonical observable unit. Every lifecycle step of
//   the orchestrator emits one event, which is:
//     1. recorded in global_arbitration_stats() (always),
//     2. forwarded to the registered hook, if any, otherwise
//     3. appended as one JSON line to $TRIBUNAL_EVENT_LOG when that is set.
//
// INVARIANT: event emission never throws. Hooks run on the emitting thread,
//   possibly while a session slot is locked, and must not call back into the
//   orchestrator.
//
// EXTENSION_POINT: external_exporter
//   Register a hook via set_arbitration_event_hook() to forward events to a
//   tracing or metrics pipeline. Hooks must be thread-safe.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "tribunal/types.hpp"

namespace tribunal {

enum class EventKind : uint8_t {
  session_started,
  transition,
  transition_rejected,
  phase_completed,
  verdict_issued,
  precedent_created,
  waiver_decided,
  appeal_submitted,
  appeal_decided,
  session_completed,
  session_failed,
};

std::string to_string(EventKind k);

// Phases timed by the orchestrator. Index into ArbitrationStats::phase_latency.
enum class Phase : uint8_t {
  rule_evaluation = 0,
  precedent_lookup,
  verdict_generation,
  waiver_evaluation,
  appeal_review,
};
constexpr size_t kPhaseCount = 5;

std::string to_string(Phase p);

// ---------------------------------------------------------------------------
// ArbitrationEvent: per-step observable unit
// ---------------------------------------------------------------------------
struct ArbitrationEvent {
  EventKind   kind{EventKind::transition};
  std::string session_id;
  std::string from_state;       // transitions only
  std::string to_state;
  Phase       phase{Phase::rule_evaluation};  // phase_completed only
  uint64_t    duration_ns{0};
  bool        ok{true};
  std::string error_code;       // failures and rejected transitions
  std::string detail;           // verdict id, precedent id, appeal id, ...
  uint64_t    timestamp_unix_ms{0};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us). Bucket 0 is [0, 1us).
// Bucket boundaries are fixed; dashboards read the serialized form.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 if no samples were recorded.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;
  void reset();

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// ArbitrationStats: process-wide aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the failure map and ring buffer use mutexes.
// Counters are cumulative for the process and are NOT reset by
// ArbitrationOrchestrator::clear(); call reset() for that.
class ArbitrationStats {
 public:
  void record(const ArbitrationEvent& ev);
  std::string to_json() const;
  void reset();

  alignas(64) std::atomic<uint64_t> sessions_started{0};
  alignas(64) std::atomic<uint64_t> sessions_completed{0};
  alignas(64) std::atomic<uint64_t> sessions_failed{0};
  alignas(64) std::atomic<uint64_t> transitions{0};
  alignas(64) std::atomic<uint64_t> transitions_rejected{0};
  alignas(64) std::atomic<uint64_t> verdicts_issued{0};
  alignas(64) std::atomic<uint64_t> precedents_created{0};
  alignas(64) std::atomic<uint64_t> waivers_decided{0};
  alignas(64) std::atomic<uint64_t> appeals_submitted{0};
  alignas(64) std::atomic<uint64_t> appeals_decided{0};

  std::array<LatencyHistogram, kPhaseCount> phase_latency;

  std::map<std::string, uint64_t> failure_counts() const;

  static constexpr size_t kMaxRecentEvents = 1000;
  std::vector<ArbitrationEvent> recent_events_snapshot() const;  // oldest first

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, uint64_t> failures_by_code_;

  mutable std::mutex ring_mu_;
  std::vector<ArbitrationEvent> ring_buffer_;
  size_t ring_head_{0};  // next slot to overwrite once the buffer is full
};

ArbitrationStats& global_arbitration_stats();

void emit_arbitration_event(const ArbitrationEvent& ev);

using ArbitrationEventHook = void (*)(const ArbitrationEvent&);
void set_arbitration_event_hook(ArbitrationEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace tribunal
