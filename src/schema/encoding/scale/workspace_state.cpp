#include <quill/schema/encoding/scale/workspace_state.hpp>

namespace quill::schema {

void encode(const workspace_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.context, encoder);
  encode(o.authority, encoder);
}

void decode(workspace_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.context, decoder);
  decode(o.authority, decoder);
}

}  // namespace quill::schema
