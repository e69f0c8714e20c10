#pragma once

// tribunal/version.hpp: Explicit version manifest for every persisted format.
//
// INVARIANT:
//   All version constants are compile-time. Anything that reads a versioned
//   format (audit files, precedent exports, config files) checks the matching
//   constant before trusting the data.

#include <cstdint>
#include <string>

namespace tribunal {
namespace version {

constexpr const char* ENGINE_SEMVER = "1.0.0";

// Bump when a public header changes layout in a way that breaks linking.
constexpr uint32_t ENGINE_ABI_VERSION = 1;

// Version 1 = BLAKE3, 32-byte output hex-encoded to 64 chars, domain-prefixed.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Version 1 = NDJSON DecisionRecord with BLAKE3 chain links.
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// Version 1 = Precedent::to_json() field set, digest over domain "precedent:".
constexpr uint32_t PRECEDENT_FORMAT_VERSION = 1;

// Value of "config_version" accepted by config_from_json().
constexpr uint32_t CONFIG_SCHEMA_VERSION = 1;

struct VersionManifest {
  uint32_t    engine_abi{ENGINE_ABI_VERSION};
  uint32_t    hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t    audit_log{AUDIT_LOG_VERSION};
  uint32_t    precedent_format{PRECEDENT_FORMAT_VERSION};
  uint32_t    config_schema{CONFIG_SCHEMA_VERSION};
  std::string engine_semver{ENGINE_SEMVER};
  std::string hash_primitive;      // "blake3"
  std::string hash_backend_version;
  std::string build_timestamp;     // __DATE__ " " __TIME__
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool        ok{true};
  std::string error_code;
  std::string description;
};

// Checks a persisted format version against what this build understands.
// Never throws.
CompatibilityResult check_audit_log_version(uint32_t found);
CompatibilityResult check_config_version(uint32_t found);

}  // namespace version
}  // namespace tribunal
