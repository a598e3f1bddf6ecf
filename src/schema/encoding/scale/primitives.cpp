#include <quill/schema/encoding/scale/primitives.hpp>

#include <system_error>

namespace quill::schema {

void encode(const snapshot_ref_t& o, ::scale::Encoder& encoder) {
  encode(o.repository_id, encoder);
  encode(o.merkle_root, encoder);
}

void decode(snapshot_ref_t& o, ::scale::Decoder& decoder) {
  decode(o.repository_id, decoder);
  decode(o.merkle_root, decoder);
}

void encode(const governance_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(governance_status_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(governance_status_t::rejected)) {
    throw std::system_error{std::make_error_code(std::errc::invalid_argument)};
  }
  o = static_cast<governance_status_t>(raw);
}

}  // namespace quill::schema
