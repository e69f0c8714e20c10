#include "tribunal/hash.hpp"

// Hash authority for verdict digests, precedent digests and the audit chain.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. No fallbacks.
//   2. Domain separation: "verdict:", "precedent:", "audit:" prefixes keep
//      digests from different contexts from ever colliding. The prefixes are
//      part of the persisted format; changing one invalidates stored digests.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace tribunal {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string blake3_version_string() {
  const char* ver = blake3_version();
  return ver ? ver : "unknown";
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string verdict_hash(std::string_view canonical_verdict_json) {
  return hash_domain("verdict:", canonical_verdict_json);
}

std::string precedent_hash(std::string_view canonical_precedent_json) {
  return hash_domain("precedent:", canonical_precedent_json);
}

std::string audit_chain_hash(std::string_view previous_digest, std::string_view entry_json) {
  // Chain link = H("audit:" || prev || entry). prev is fixed-width hex, so the
  // concatenation is unambiguous.
  std::string payload;
  payload.reserve(previous_digest.size() + entry_json.size());
  payload.append(previous_digest.data(), previous_digest.size());
  payload.append(entry_json.data(), entry_json.size());
  return hash_domain("audit:", payload);
}

bool is_hex_digest(std::string_view s) {
  if (s.size() != 64) return false;
  for (char c : s) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) return false;
  }
  return true;
}

}  // namespace tribunal
