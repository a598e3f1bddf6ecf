#include <quill/schema/capability.hpp>

namespace quill::schema {

scope_mask_t scope_of(const capability_t value) {
  return scope_mask_t{1} << static_cast<unsigned>(value);
}

std::optional<capability_t> capability_of(const scope_mask_t& mask) {
  for (const auto& [name, value] : kCapabilityMappings) {
    if (scope_of(value) == mask) {
      return value;
    }
  }
  return std::nullopt;
}

scope_mask_t make_scope_mask(std::initializer_list<capability_t> values) {
  auto mask = scope_mask_t{0};
  for (const auto value : values) {
    mask |= scope_of(value);
  }
  return mask;
}

const scope_mask_t& all_scopes() {
  static const auto mask = scope_mask_t{~scope_mask_t{0}};
  return mask;
}

bool is_all_scopes(const scope_mask_t& mask) {
  return mask == all_scopes();
}

}  // namespace quill::schema
