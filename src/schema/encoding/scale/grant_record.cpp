#include <quill/schema/encoding/scale/grant_record.hpp>

namespace quill::schema {

void encode(const grant_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.principal, encoder);
  encode(o.relayer, encoder);
  encode(o.context, encoder);
  encode(to_word(o.scope_mask), encoder);
  encode(o.expiry, encoder);
}

void decode(grant_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.principal, decoder);
  decode(o.relayer, decoder);
  decode(o.context, decoder);
  auto scope_word = hash32_t{};
  decode(scope_word, decoder);
  o.scope_mask = from_word(scope_word);
  decode(o.expiry, decoder);
}

}  // namespace quill::schema
