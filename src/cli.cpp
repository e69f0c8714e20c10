#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "tribunal/audit.hpp"
#include "tribunal/case_file.hpp"
#include "tribunal/config.hpp"
#include "tribunal/hash.hpp"
#include "tribunal/jsonlite.hpp"
#include "tribunal/observability.hpp"
#include "tribunal/orchestrator.hpp"
#include "tribunal/version.hpp"

namespace {
bool read_file(const std::string &path, std::string *out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  out->assign((std::istreambuf_iterator<char>(ifs)),
              std::istreambuf_iterator<char>());
  return true;
}

std::string flag_value(int argc, char **argv, const std::string &flag) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (flag == argv[i])
      return argv[i + 1];
  }
  return "";
}

std::string string_array_json(const std::vector<std::string> &items) {
  std::string out = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i)
      out += ",";
    out += "\"" + tribunal::jsonlite::escape(items[i]) + "\"";
  }
  return out + "]";
}

std::string validation_json(const tribunal::ConfigValidationResult &r) {
  std::ostringstream o;
  o << "{\"ok\":" << (r.ok ? "true" : "false") << ",\"config_version\":\""
    << tribunal::jsonlite::escape(r.config_version) << "\""
    << ",\"errors\":" << string_array_json(r.errors)
    << ",\"warnings\":" << string_array_json(r.warnings) << "}";
  return o.str();
}

void print_error(const std::string &code, const std::string &message) {
  std::cerr << "{\"error\":{\"code\":\"" << tribunal::jsonlite::escape(code)
            << "\",\"message\":\"" << tribunal::jsonlite::escape(message)
            << "\"}}\n";
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (tribunal::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (tribunal::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

// Loads --config (if any) and the TRIBUNAL_* overrides. Returns false after
// printing the validation report when the config file is rejected.
bool load_config(int argc, char **argv, tribunal::ArbitrationConfig *config,
                 std::vector<std::string> *warnings) {
  const std::string path = flag_value(argc, argv, "--config");
  if (!path.empty()) {
    std::string text;
    if (!read_file(path, &text)) {
      print_error("CONFIG_INVALID", "cannot read config file: " + path);
      return false;
    }
    tribunal::ConfigValidationResult vr;
    auto parsed = tribunal::config_from_json(text, &vr);
    if (!parsed) {
      std::cerr << validation_json(vr) << "\n";
      return false;
    }
    *config = *parsed;
    warnings->insert(warnings->end(), vr.warnings.begin(), vr.warnings.end());
  }
  tribunal::apply_env_overrides(*config, warnings);
  return true;
}

// Runs one case file through the full lifecycle. Appeals run before the
// waiver because a waiver decision completes the session.
std::string arbitrate(tribunal::ArbitrationOrchestrator &orch,
                      tribunal::CaseFile c) {
  if (c.violation.detected_at_unix_ms == 0)
    c.violation.detected_at_unix_ms = tribunal::now_unix_ms();

  auto session = orch.start_session(c.violation, c.rules, c.participants);
  const std::string id = session.id;
  try {
    orch.evaluate_rules(id);
    orch.generate_verdict(id, c.issued_by);

    if (c.appeal) {
      const auto appeal =
          orch.submit_appeal(id, c.appeal->appellant_id, c.appeal->grounds,
                             c.appeal->new_evidence);
      for (const auto &vote : c.appeal->votes)
        orch.components().appeal_arbitrator->cast_vote(appeal.id, vote);
      orch.review_appeal(id, appeal.id, c.appeal->reviewers);
    }

    if (c.waiver) {
      orch.evaluate_waiver(id, *c.waiver, c.waiver_decided_by);
    } else {
      orch.complete_session(id);
    }
  } catch (const tribunal::ArbitrationError &e) {
    if (!tribunal::is_terminal(orch.get_session(id).state))
      orch.fail_session(id, e);
    throw;
  }

  std::ostringstream o;
  o << "{\"session\":" << orch.get_session(id).to_json();
  if (auto m = orch.get_session_metrics(id))
    o << ",\"metrics\":" << m->to_json();
  o << ",\"statistics\":" << orch.get_statistics().to_json();
  o << ",\"events\":" << tribunal::global_arbitration_stats().to_json() << "}";
  return o.str();
}

} // namespace

int main(int argc, char **argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0)
      continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    std::cerr << "usage: tribunal <health|version|arbitrate|config check|audit "
                 "verify> ...\n";
    return 2;
  }

  if (cmd == "health") {
    const bool vectors_ok = verify_hash_vectors();
    std::cout << "{\"hash_primitive\":\"blake3\",\"hash_version\":\""
              << tribunal::blake3_version_string()
              << "\",\"hash_vectors_ok\":" << (vectors_ok ? "true" : "false")
              << ",\"engine_semver\":\"" << TRIBUNAL_VERSION << "\"}\n";
    return vectors_ok ? 0 : 1;
  }

  if (cmd == "version") {
    std::cout << tribunal::version::manifest_to_json(
                     tribunal::version::current_manifest())
              << "\n";
    return 0;
  }

  if (cmd == "config" && argc >= 4 && std::string(argv[2]) == "check") {
    std::string text;
    if (!read_file(argv[3], &text)) {
      print_error("CONFIG_INVALID", std::string("cannot read ") + argv[3]);
      return 2;
    }
    const auto result = tribunal::validate_config(text);
    std::cout << validation_json(result) << "\n";
    return result.ok ? 0 : 2;
  }

  if (cmd == "audit" && argc >= 4 && std::string(argv[2]) == "verify") {
    const auto r = tribunal::verify_audit_log(argv[3]);
    std::cout << "{\"ok\":" << (r.ok ? "true" : "false")
              << ",\"entries\":" << r.entries
              << ",\"first_bad_sequence\":" << r.first_bad_sequence
              << ",\"error\":\"" << tribunal::jsonlite::escape(r.error)
              << "\"}\n";
    return r.ok ? 0 : 1;
  }

  if (cmd == "arbitrate" && argc >= 3) {
    std::string case_text;
    if (!read_file(argv[2], &case_text)) {
      print_error("INVALID_ARGUMENT", std::string("cannot read ") + argv[2]);
      return 2;
    }
    std::string parse_error;
    auto case_file = tribunal::parse_case_file(case_text, &parse_error);
    if (!case_file) {
      print_error("INVALID_ARGUMENT", parse_error);
      return 2;
    }

    tribunal::ArbitrationConfig config;
    std::vector<std::string> warnings;
    if (!load_config(argc, argv, &config, &warnings))
      return 2;
    for (const auto &w : warnings)
      std::cerr << "{\"warning\":\"" << tribunal::jsonlite::escape(w)
                << "\"}\n";

    const std::string audit_path = flag_value(argc, argv, "--audit-log");
    if (!audit_path.empty())
      tribunal::set_audit_log_path(audit_path);

    try {
      tribunal::ArbitrationOrchestrator orch(config);
      std::cout << arbitrate(orch, std::move(*case_file)) << "\n";
    } catch (const tribunal::ArbitrationError &e) {
      print_error(tribunal::to_string(e.code()), e.what());
      return 1;
    }
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 2;
}
