#include <quill/blake3/hash.hpp>
#include <quill/crypto/recover.hpp>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <memory>

namespace quill::crypto {

namespace {

using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

bignum_ptr make_bignum() {
  return bignum_ptr{BN_new(), BN_free};
}

ec_group_ptr make_secp256k1_group() {
  return ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                      EC_GROUP_free};
}

std::optional<uint8_t> recovery_id(const uint8_t v) {
  if (v <= 3) {
    return v;
  }
  if (v >= 27 && v <= 30) {
    return static_cast<uint8_t>(v - 27);
  }
  return std::nullopt;
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto group = make_secp256k1_group();
    return static_cast<bool>(group);
  }();
  return available_now;
}

std::optional<public_key_t> recover_public_key(
    const quill::schema::hash32_t& digest,
    const quill::schema::signature_t& signature) {
  auto recid = recovery_id(signature[64]);
  if (!recid.has_value()) {
    return std::nullopt;
  }

  auto group = make_secp256k1_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!group || !ctx) {
    return std::nullopt;
  }

  const auto* order = EC_GROUP_get0_order(group.get());
  auto prime = make_bignum();
  auto r = bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free};
  auto e = bignum_ptr{BN_bin2bn(digest.data(), 32, nullptr), BN_free};
  auto x = make_bignum();
  auto zero = make_bignum();
  auto neg_e = make_bignum();
  auto u1 = make_bignum();
  auto u2 = make_bignum();
  if (order == nullptr || !prime || !r || !s || !e || !x || !zero || !neg_e ||
      !u1 || !u2) {
    return std::nullopt;
  }
  BN_zero(zero.get());

  if (BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
      BN_cmp(r.get(), order) >= 0 || BN_cmp(s.get(), order) >= 0) {
    return std::nullopt;
  }

  if (EC_GROUP_get_curve(group.get(), prime.get(), nullptr, nullptr,
                         ctx.get()) != 1) {
    return std::nullopt;
  }

  // Candidate R.x is r, or r + n for the second-half recovery ids.
  if (BN_copy(x.get(), r.get()) == nullptr) {
    return std::nullopt;
  }
  if ((*recid & 2u) != 0 && BN_add(x.get(), x.get(), order) != 1) {
    return std::nullopt;
  }
  if (BN_cmp(x.get(), prime.get()) >= 0) {
    return std::nullopt;
  }

  auto big_r = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!big_r ||
      EC_POINT_set_compressed_coordinates(group.get(), big_r.get(), x.get(),
                                          static_cast<int>(*recid & 1u),
                                          ctx.get()) != 1) {
    return std::nullopt;
  }

  // Q = r^-1 (s*R - e*G) = (-e * r^-1)*G + (s * r^-1)*R
  auto r_inv =
      bignum_ptr{BN_mod_inverse(nullptr, r.get(), order, ctx.get()), BN_free};
  if (!r_inv) {
    return std::nullopt;
  }
  if (BN_mod_sub(neg_e.get(), zero.get(), e.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u1.get(), neg_e.get(), r_inv.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u2.get(), s.get(), r_inv.get(), order, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto q = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!q || EC_POINT_mul(group.get(), q.get(), u1.get(), big_r.get(),
                         u2.get(), ctx.get()) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group.get(), q.get()) == 1) {
    return std::nullopt;
  }

  auto key = public_key_t{};
  auto written =
      EC_POINT_point2oct(group.get(), q.get(), POINT_CONVERSION_UNCOMPRESSED,
                         key.data(), key.size(), ctx.get());
  if (written != key.size()) {
    return std::nullopt;
  }
  return key;
}

quill::schema::address_t address_from_public_key(const public_key_t& key) {
  auto digest =
      quill::blake3::hash(quill::schema::bytes_view_t{key.data() + 1, 64});
  auto address = quill::schema::address_t{};
  std::copy_n(digest.data() + (digest.size() - address.size()),
              address.size(), address.data());
  return address;
}

std::optional<quill::schema::address_t> recover_signer(
    const quill::schema::hash32_t& digest,
    const quill::schema::signature_t& signature) {
  auto key = recover_public_key(digest, signature);
  if (!key.has_value()) {
    return std::nullopt;
  }
  return address_from_public_key(*key);
}

}  // namespace quill::crypto
