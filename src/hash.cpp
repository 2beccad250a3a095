#include "arbiter/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. No fallbacks, no alternatives.
//   2. Domain separation: "cas:", "fn:", "chain:", "genesis:", "release:"
//      prefixes prevent cross-context collisions. The prefixes are part of the
//      ledger format contract (version::HASH_ALGORITHM_VERSION); changing one
//      invalidates every stored chain.
//
// EXTENSION_POINT: hash_algorithm_upgrade
//   Bump HASH_ALGORITHM_VERSION, dual-verify old records for a migration
//   window, then cut over. The genesis value changes with the version.
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for O(1) nibble
// encoding instead of snprintf("%02x").

#include <cstring>

extern "C" {
#include <blake3.h>
}

namespace arbiter {
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

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  info.blake3_available = true;
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_bytes_blake3(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return std::string(reinterpret_cast<char*>(out.data()), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string cas_content_hash(std::string_view raw_bytes) {
  return hash_domain("cas:", raw_bytes);
}

std::string logic_content_hash(std::string_view canonical_logic) {
  return hash_domain("fn:", canonical_logic);
}

std::string release_payload_hash(std::string_view canonical_payload) {
  return hash_domain("release:", canonical_payload);
}

std::string chain_link_hash(std::string_view prev_hash,
                            std::string_view canonical_record) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  constexpr std::string_view kDomain = "chain:";
  blake3_hasher_update(&hasher, kDomain.data(), kDomain.size());
  blake3_hasher_update(&hasher, prev_hash.data(), prev_hash.size());
  blake3_hasher_update(&hasher, canonical_record.data(), canonical_record.size());
  return finalize_hex(hasher);
}

const std::string& ledger_genesis_hash() {
  static const std::string genesis = hash_domain("genesis:", "arbiter.ledger.v1");
  return genesis;
}

std::string keyed_hash_hex(const HashKey& key, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init_keyed(&hasher, key.data());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

HashKey derive_hash_key(std::string_view context, std::string_view material) {
  // blake3_hasher_init_derive_key takes a NUL-terminated context string.
  const std::string ctx(context);
  blake3_hasher hasher;
  blake3_hasher_init_derive_key(&hasher, ctx.c_str());
  blake3_hasher_update(&hasher, material.data(), material.size());
  HashKey key{};
  blake3_hasher_finalize(&hasher, key.data(), key.size());
  return key;
}

bool digest_equal(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  unsigned char diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i] ^ b[i]);
  }
  return diff == 0;
}

bool is_hex_digest(std::string_view d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace arbiter
