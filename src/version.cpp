#include "tribunal/version.hpp"

#include <sstream>

#include "tribunal/hash.hpp"

namespace tribunal {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.hash_primitive       = "blake3";
  m.hash_backend_version = blake3_version_string();
  m.build_timestamp      = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"engine_abi\":" << m.engine_abi
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"audit_log\":" << m.audit_log
    << ",\"precedent_format\":" << m.precedent_format
    << ",\"config_schema\":" << m.config_schema
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_backend_version\":\"" << m.hash_backend_version << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

namespace {

CompatibilityResult check_exact(const char* what, uint32_t found, uint32_t expected) {
  CompatibilityResult r;
  if (found != expected) {
    r.ok          = false;
    r.error_code  = std::string(what) + "_version_mismatch";
    r.description = std::string(what) + " version " + std::to_string(found) +
                    " != supported version " + std::to_string(expected);
  }
  return r;
}

}  // namespace

CompatibilityResult check_audit_log_version(uint32_t found) {
  return check_exact("audit_log", found, AUDIT_LOG_VERSION);
}

CompatibilityResult check_config_version(uint32_t found) {
  return check_exact("config", found, CONFIG_SCHEMA_VERSION);
}

}  // namespace version
}  // namespace tribunal
