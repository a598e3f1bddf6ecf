#pragma once
#include <quill/schema/delegation_requests.hpp>
#include <quill/schema/release_requests.hpp>
#include <quill/schema/repository_requests.hpp>
#include <quill/schema/workspace_requests.hpp>
#include <variant>

namespace quill::schema {

using request_t = std::variant<register_grant_t,
                               revoke_grant_t,
                               revoke_grant_with_sig_t,
                               init_authority_t,
                               set_authority_with_sig_t,
                               set_member_with_sig_t,
                               leave_workspace_t,
                               claim_repository_t,
                               transfer_repository_t,
                               create_snapshot_t,
                               anchor_release_t,
                               set_governance_status_t,
                               revoke_release_t,
                               supersede_release_t,
                               set_dao_executor_t>;

}  // namespace quill::schema
