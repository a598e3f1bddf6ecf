#include <quill/blake3/hash.hpp>
#include <quill/schema/encoding/scale/encoder.hpp>
#include <quill/signing/digest.hpp>

#include <tuple>

namespace quill::signing {

namespace {

using encoder_t = quill::schema::encoding::encoder<
    quill::schema::encoding::scale_encoder_tag>;

inline constexpr std::string_view kDelegateTypeName{"Delegate"};
inline constexpr std::string_view kRevokeTypeName{"Revoke"};
inline constexpr std::string_view kSetAuthorityTypeName{"SetAuthority"};
inline constexpr std::string_view kSetMemberTypeName{"SetMember"};

template <typename Fields>
quill::schema::hash32_t hash_payload(const signing_domain_t& domain,
                                     std::string_view type_name,
                                     const Fields& fields) {
  auto encoder = encoder_t{};
  auto material = encoder.encode(std::tuple{domain.name, domain.version,
                                            domain.chain_id,
                                            std::string{type_name}});
  encoder.encode(fields, material);
  return quill::blake3::hash(
      quill::schema::bytes_view_t{material.data(), material.size()});
}

}  // namespace

quill::schema::hash32_t make_chain_id(const std::string_view chain_name) {
  return quill::blake3::hash(chain_name);
}

signing_domain_t make_delegation_domain(
    const quill::schema::hash32_t& chain_id) {
  return signing_domain_t{.name = std::string{kDelegationDomainName},
                          .version = std::string{kDomainVersion},
                          .chain_id = chain_id};
}

signing_domain_t make_workspace_domain(
    const quill::schema::hash32_t& chain_id) {
  return signing_domain_t{.name = std::string{kWorkspaceDomainName},
                          .version = std::string{kDomainVersion},
                          .chain_id = chain_id};
}

quill::schema::hash32_t make_digest(
    const signing_domain_t& domain,
    const quill::schema::delegate_authorization_t& payload) {
  return hash_payload(
      domain, kDelegateTypeName,
      std::tuple{payload.principal, payload.relayer, payload.context,
                 quill::schema::to_word(payload.scope_mask), payload.nonce,
                 payload.expiry, payload.deadline});
}

quill::schema::hash32_t make_digest(
    const signing_domain_t& domain,
    const quill::schema::revoke_authorization_t& payload) {
  return hash_payload(domain, kRevokeTypeName,
                      std::tuple{payload.principal, payload.relayer,
                                 payload.context, payload.nonce,
                                 payload.deadline});
}

quill::schema::hash32_t make_digest(
    const signing_domain_t& domain,
    const quill::schema::set_authority_authorization_t& payload) {
  return hash_payload(domain, kSetAuthorityTypeName,
                      std::tuple{payload.context, payload.authority,
                                 payload.nonce, payload.deadline});
}

quill::schema::hash32_t make_digest(
    const signing_domain_t& domain,
    const quill::schema::set_member_authorization_t& payload) {
  return hash_payload(domain, kSetMemberTypeName,
                      std::tuple{payload.context, payload.member,
                                 payload.is_member, payload.nonce,
                                 payload.deadline});
}

}  // namespace quill::signing
