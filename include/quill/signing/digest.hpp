#pragma once

#include <quill/schema/authorization.hpp>
#include <quill/schema/primitives.hpp>

#include <string>
#include <string_view>

namespace quill::signing {

inline constexpr std::string_view kDelegationDomainName{"quill.delegation"};
inline constexpr std::string_view kWorkspaceDomainName{"quill.workspace"};
inline constexpr std::string_view kDomainVersion{"1"};

/// Binds a signature to one component of one chain.
struct signing_domain_t final {
  std::string name;
  std::string version;
  quill::schema::hash32_t chain_id{};
};

/// Chain id derived from a human readable chain name.
quill::schema::hash32_t make_chain_id(std::string_view chain_name);

signing_domain_t make_delegation_domain(const quill::schema::hash32_t& chain_id);
signing_domain_t make_workspace_domain(const quill::schema::hash32_t& chain_id);

/// BLAKE3 over SCALE(domain name, domain version, chain id, type name,
/// payload fields in declaration order). The payload `version` member is not
/// part of the signed material.
quill::schema::hash32_t make_digest(
    const signing_domain_t& domain,
    const quill::schema::delegate_authorization_t& payload);
quill::schema::hash32_t make_digest(
    const signing_domain_t& domain,
    const quill::schema::revoke_authorization_t& payload);
quill::schema::hash32_t make_digest(
    const signing_domain_t& domain,
    const quill::schema::set_authority_authorization_t& payload);
quill::schema::hash32_t make_digest(
    const signing_domain_t& domain,
    const quill::schema::set_member_authorization_t& payload);

}  // namespace quill::signing
