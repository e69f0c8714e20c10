#pragma once

#include <string>
#include <string_view>

namespace tribunal {

// BLAKE3 is the sole hash primitive. Every digest is 64 lowercase hex chars.
std::string blake3_hex(std::string_view payload);
std::string blake3_version_string();

// Domain-separated hashing. Domains in use:
//   "verdict:"   Verdict::canonical_json()
//   "precedent:" Precedent canonical form
//   "audit:"     audit log chain links
std::string hash_domain(std::string_view domain, std::string_view payload);

std::string verdict_hash(std::string_view canonical_verdict_json);
std::string precedent_hash(std::string_view canonical_precedent_json);
std::string audit_chain_hash(std::string_view previous_digest, std::string_view entry_json);

// True if s is a well-formed 64-char lowercase hex digest.
bool is_hex_digest(std::string_view s);

}  // namespace tribunal
