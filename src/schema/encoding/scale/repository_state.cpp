#include <quill/schema/encoding/scale/repository_state.hpp>

namespace quill::schema {

void encode(const repository_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.repository_id, encoder);
  encode(o.owner, encoder);
  encode(o.context, encoder);
  encode(o.metadata, encoder);
  encode(o.claimed_at, encoder);
}

void decode(repository_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.repository_id, decoder);
  decode(o.owner, decoder);
  decode(o.context, decoder);
  decode(o.metadata, decoder);
  decode(o.claimed_at, decoder);
}

}  // namespace quill::schema
