#pragma once

#include <quill/schema/primitives.hpp>

#include <array>
#include <optional>

namespace quill::crypto {

/// Uncompressed SEC1 point: 0x04 || X || Y.
using public_key_t = std::array<uint8_t, 65>;

bool available();

/// Recover the public key that produced `signature` over `digest`.
///
/// The signature is [r || s || v] with v in {0, 1, 2, 3} or the legacy
/// {27, 28, 29, 30} range. Returns std::nullopt when r/s are out of range,
/// the recovery id is malformed or no curve point matches.
std::optional<public_key_t> recover_public_key(
    const quill::schema::hash32_t& digest,
    const quill::schema::signature_t& signature);

/// Derive the 20-byte ledger address of an uncompressed public key.
quill::schema::address_t address_from_public_key(const public_key_t& key);

/// Recover the signer address; composition of the two functions above.
std::optional<quill::schema::address_t> recover_signer(
    const quill::schema::hash32_t& digest,
    const quill::schema::signature_t& signature);

}  // namespace quill::crypto
