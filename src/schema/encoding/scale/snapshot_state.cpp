#include <quill/schema/encoding/scale/snapshot_state.hpp>

namespace quill::schema {

void encode(const snapshot_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.repository_id, encoder);
  encode(o.index, encoder);
  encode(o.context, encoder);
  encode(o.author, encoder);
  encode(o.commit_hash, encoder);
  encode(o.merkle_root, encoder);
  encode(o.manifest_ref, encoder);
  encode(o.created_at, encoder);
}

void decode(snapshot_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.repository_id, decoder);
  decode(o.index, decoder);
  decode(o.context, decoder);
  decode(o.author, decoder);
  decode(o.commit_hash, decoder);
  decode(o.merkle_root, decoder);
  decode(o.manifest_ref, decoder);
  decode(o.created_at, decoder);
}

}  // namespace quill::schema
