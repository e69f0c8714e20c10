#include "tribunal/audit.hpp"
#include "tribunal/hash.hpp"
#include "tribunal/jsonlite.hpp"
#include "tribunal/types.hpp"
#include "tribunal/version.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <sstream>

namespace tribunal {

namespace {
constexpr const char* kGenesisDigest =
    "0000000000000000000000000000000000000000000000000000000000000000";

// Chain position after the last entry of an existing log.
struct ChainTail {
  uint64_t    seq{0};
  std::string head{kGenesisDigest};
  bool        ok{true};
};

ChainTail read_chain_tail(const std::string& path) {
  ChainTail tail;
  std::ifstream in(path);
  if (!in) return tail;  // new log

  std::string line;
  std::string last;
  while (std::getline(in, line)) {
    if (!line.empty()) last = line;
  }
  if (last.empty()) return tail;

  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(last, &err);
  const uint64_t seq = jsonlite::get_u64(obj, "seq", 0);
  const std::string prev = jsonlite::get_string(obj, "prev");
  if (err || seq == 0 || !is_hex_digest(prev)) {
    tail.ok = false;
    return tail;
  }
  tail.seq  = seq;
  tail.head = audit_chain_hash(prev, last);
  return tail;
}
}  // namespace

std::string to_string(DecisionKind k) {
  switch (k) {
    case DecisionKind::verdict: return "verdict";
    case DecisionKind::verdict_superseded: return "verdict_superseded";
    case DecisionKind::waiver_decision: return "waiver_decision";
    case DecisionKind::appeal_decision: return "appeal_decision";
    case DecisionKind::session_completed: return "session_completed";
    case DecisionKind::session_failed: return "session_failed";
  }
  return "";
}

// ---------------------------------------------------------------------------
// DecisionRecord → JSON
// ---------------------------------------------------------------------------
std::string decision_to_json(const DecisionRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"seq\":" << r.sequence << ",\"prev\":\"" << r.previous_digest << "\""
    << ",\"kind\":\"" << to_string(r.kind) << "\""
    << ",\"session_id\":\"" << jsonlite::escape(r.session_id) << "\""
    << ",\"subject_id\":\"" << jsonlite::escape(r.subject_id) << "\""
    << ",\"outcome\":\"" << jsonlite::escape(r.outcome) << "\""
    << ",\"confidence\":" << jsonlite::format_double(r.confidence)
    << ",\"digest\":\"" << r.digest << "\""
    << ",\"actor\":\"" << jsonlite::escape(r.actor) << "\""
    << ",\"error_code\":\"" << r.error_code << "\""
    << ",\"engine_semver\":\"" << r.engine_semver << "\""
    << ",\"audit_log_version\":" << r.audit_log_version
    << ",\"hash_algorithm_version\":" << r.hash_algorithm_version
    << ",\"timestamp_unix_ms\":" << r.timestamp_unix_ms
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// ImmutableAuditLog
// ---------------------------------------------------------------------------

struct AuditLogImpl {
  std::mutex  mu;
  FILE*       file{nullptr};
  uint64_t    seq{0};
  uint64_t    entry_count{0};
  uint64_t    failure_count{0};
  std::string last_digest{kGenesisDigest};
};

ImmutableAuditLog::ImmutableAuditLog(const std::string& path)
    : path_(path), impl_(std::make_unique<AuditLogImpl>()) {
  if (path_.empty()) return;

  // An existing log is continued from its last entry. A log whose last line
  // cannot be parsed is left untouched and every append fails.
  const ChainTail tail = read_chain_tail(path_);
  if (!tail.ok) {
    ++impl_->failure_count;
    return;
  }
  impl_->seq         = tail.seq;
  impl_->last_digest = tail.head;

  impl_->file = std::fopen(path_.c_str(), "a");
  if (!impl_->file) ++impl_->failure_count;
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (impl_ && impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

bool ImmutableAuditLog::append(DecisionRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  if (path_.empty()) return true;  // disabled
  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  // Seek to end before writing so the log can only ever grow.
  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  record.sequence               = impl_->seq + 1;
  record.previous_digest        = impl_->last_digest;
  record.timestamp_unix_ms      = now_unix_ms();
  record.engine_semver          = version::ENGINE_SEMVER;
  record.audit_log_version      = version::AUDIT_LOG_VERSION;
  record.hash_algorithm_version = version::HASH_ALGORITHM_VERSION;

  const std::string line       = decision_to_json(record);
  const std::string final_line = line + "\n";
  const bool written = (std::fwrite(final_line.data(), 1, final_line.size(),
                                    impl_->file) == final_line.size());
  std::fflush(impl_->file);

  if (!written) {
    ++impl_->failure_count;
    return false;
  }
  const long post_write_pos = std::ftell(impl_->file);
  if (post_write_pos >= 0 &&
      post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
    ++impl_->failure_count;
    return false;
  }

  impl_->seq         = record.sequence;
  impl_->last_digest = audit_chain_hash(record.previous_digest, line);
  ++impl_->entry_count;
  return true;
}

bool ImmutableAuditLog::enabled() const { return !path_.empty(); }

uint64_t ImmutableAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

std::string ImmutableAuditLog::head_digest() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->last_digest;
}

// ---------------------------------------------------------------------------
// Chain verification
// ---------------------------------------------------------------------------

AuditVerifyResult verify_audit_log(const std::string& path) {
  AuditVerifyResult r;
  std::ifstream in(path);
  if (!in) {
    r.ok    = false;
    r.error = "cannot open " + path;
    return r;
  }

  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 1;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(line, &err);
    const uint64_t seq = jsonlite::get_u64(obj, "seq", 0);
    if (err) {
      r.ok = false;
      r.first_bad_sequence = expected_seq;
      r.error = "malformed entry: " + err->message;
      return r;
    }
    const auto compat = version::check_audit_log_version(
        static_cast<uint32_t>(jsonlite::get_u64(obj, "audit_log_version", 0)));
    if (!compat.ok) {
      r.ok = false;
      r.first_bad_sequence = seq;
      r.error = compat.description;
      return r;
    }
    if (seq != expected_seq) {
      r.ok = false;
      r.first_bad_sequence = seq;
      r.error = "sequence gap: expected " + std::to_string(expected_seq);
      return r;
    }
    const std::string prev = jsonlite::get_string(obj, "prev");
    if (prev != expected_prev) {
      r.ok = false;
      r.first_bad_sequence = seq;
      r.error = "chain link mismatch";
      return r;
    }
    expected_prev = audit_chain_hash(prev, line);
    ++expected_seq;
    ++r.entries;
  }
  return r;
}

// ---------------------------------------------------------------------------
// Global singleton
// ---------------------------------------------------------------------------

namespace {
std::string g_audit_log_path;
std::atomic<bool> g_path_set{false};
ImmutableAuditLog* g_audit_log_instance = nullptr;
std::mutex g_audit_log_init_mu;
}  // namespace

void set_audit_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_audit_log_init_mu);
  g_audit_log_path = path;
  g_path_set.store(true, std::memory_order_release);
}

ImmutableAuditLog& global_audit_log() {
  std::lock_guard<std::mutex> lk(g_audit_log_init_mu);
  if (!g_audit_log_instance) {
    std::string path;
    if (g_path_set.load(std::memory_order_acquire)) {
      path = g_audit_log_path;
    } else {
      const char* env = std::getenv("TRIBUNAL_AUDIT_LOG");
      if (env && env[0]) path = env;
    }
    // Never destroyed.
    g_audit_log_instance = new ImmutableAuditLog(path);
  }
  return *g_audit_log_instance;
}

}  // namespace tribunal
