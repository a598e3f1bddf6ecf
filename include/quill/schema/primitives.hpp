#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quill::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using context_id_t = hash32_t;
using release_id_t = hash32_t;
using project_id_t = hash32_t;
using repository_id_t = hash32_t;
using scope_mask_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;

/// secp256k1 signature laid out as [r || s || v].
using signature_t = std::array<uint8_t, 65>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

/// Parse 64 hex characters, with or without a 0x prefix.
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Parse 40 hex characters, with or without a 0x prefix.
std::optional<address_t> try_make_address(const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& value);
std::string to_hex(const address_t& value);

bool is_zero(const hash32_t& value);
bool is_zero(const address_t& value);

/// Scope masks travel as 32-byte big-endian words in payloads and storage.
hash32_t to_word(const scope_mask_t& value);
scope_mask_t from_word(const hash32_t& word);

/// One (repository, merkle root) pair naming an anchored snapshot.
struct snapshot_ref_t final {
  repository_id_t repository_id{};
  hash32_t merkle_root{};

  bool operator==(const snapshot_ref_t&) const = default;
};

}  // namespace quill::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
