#include <quill/schema/error_code.hpp>

namespace quill::schema {

error_category category_of(const error_code value) {
  switch (value) {
    case error_code::zero_principal:
    case error_code::zero_relayer:
    case error_code::zero_context:
    case error_code::zero_identifier:
    case error_code::zero_identity:
    case error_code::empty_manifest:
    case error_code::bad_expiry:
    case error_code::empty_snapshot_refs:
    case error_code::invalid_status:
    case error_code::self_supersession:
      return error_category::invalid_input;
    case error_code::signature_expired:
      return error_category::signature_expired;
    case error_code::bad_signer:
      return error_category::signature_invalid;
    case error_code::release_exists:
    case error_code::release_missing:
    case error_code::release_not_pending:
    case error_code::release_revoked:
    case error_code::release_not_revoked:
    case error_code::release_already_superseded:
    case error_code::project_mismatch:
    case error_code::replacement_revoked:
    case error_code::snapshot_missing:
    case error_code::author_not_member:
    case error_code::governance_not_member:
    case error_code::authority_exists:
    case error_code::authority_missing:
    case error_code::cannot_remove_authority:
    case error_code::authority_cannot_leave:
    case error_code::repository_claimed:
    case error_code::repository_missing:
    case error_code::repository_wrong_context:
    case error_code::owner_not_member:
    case error_code::no_change:
    case error_code::duplicate_root:
    case error_code::author_not_owner:
      return error_category::precondition_failed;
    case error_code::not_authorized:
    case error_code::not_governance:
    case error_code::author_mismatch:
      return error_category::unauthorized;
  }
  return error_category::none;
}

error_category category_of_code(const uint32_t code) {
  if (code == 0) {
    return error_category::none;
  }
  return category_of(static_cast<error_code>(code));
}

}  // namespace quill::schema
