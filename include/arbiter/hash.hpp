#pragma once

// arbiter/hash.hpp — BLAKE3 hash authority.
//
// Every digest in the system (CAS keys, logic hashes, ledger chain links,
// release payloads, signer MACs) is produced here. No other file includes
// <blake3.h>.

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace arbiter {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  bool blake3_available{false};
};

HashRuntimeInfo hash_runtime_info();

// Plain BLAKE3, 64-char lowercase hex.
std::string blake3_hex(std::string_view payload);

// Binary digest (32 bytes)
std::string hash_bytes_blake3(std::string_view payload);

// Domain-separated hashing for different contexts.
std::string hash_domain(std::string_view domain, std::string_view payload);

// CAS content key ("cas:" domain). input_hash / output_hash /
// feature_snapshot_ref are all values of this function.
std::string cas_content_hash(std::string_view raw_bytes);

// Content hash of decision logic ("fn:" domain).
std::string logic_content_hash(std::string_view canonical_logic);

// Hash of a canonical release payload that signers sign ("release:" domain).
std::string release_payload_hash(std::string_view canonical_payload);

// Ledger link: H("chain:" ‖ prev_hash ‖ canonical_record).
std::string chain_link_hash(std::string_view prev_hash,
                            std::string_view canonical_record);

// Fixed genesis value for chain_hash[-1].
const std::string& ledger_genesis_hash();

// BLAKE3 keyed mode (32-byte key). Used as a MAC by KeyedBlake3Signer.
using HashKey = std::array<uint8_t, 32>;
std::string keyed_hash_hex(const HashKey& key, std::string_view payload);

// Derive a 32-byte key from arbitrary material (BLAKE3 derive_key mode).
HashKey derive_hash_key(std::string_view context, std::string_view material);

// Constant-time comparison of two hex digests.
bool digest_equal(std::string_view a, std::string_view b);

// 64 lowercase hex characters.
bool is_hex_digest(std::string_view d);

}  // namespace arbiter
