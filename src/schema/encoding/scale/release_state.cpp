#include <quill/schema/encoding/scale/primitives.hpp>
#include <quill/schema/encoding/scale/release_state.hpp>

namespace quill::schema {

void encode(const release_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.release_id, encoder);
  encode(o.project_id, encoder);
  encode(o.context, encoder);
  encode(o.manifest_ref, encoder);
  encode(o.name, encoder);
  encode(o.created_at, encoder);
  encode(o.author, encoder);
  encode(o.governance_authority, encoder);
  encode(o.snapshots, encoder);
  encode(o.status, encoder);
  encode(o.revoked, encoder);
  encode(o.superseded_by, encoder);
  encode(o.status_timestamp, encoder);
  encode(o.status_author, encoder);
}

void decode(release_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.release_id, decoder);
  decode(o.project_id, decoder);
  decode(o.context, decoder);
  decode(o.manifest_ref, decoder);
  decode(o.name, decoder);
  decode(o.created_at, decoder);
  decode(o.author, decoder);
  decode(o.governance_authority, decoder);
  decode(o.snapshots, decoder);
  decode(o.status, decoder);
  decode(o.revoked, decoder);
  decode(o.superseded_by, decoder);
  decode(o.status_timestamp, decoder);
  decode(o.status_author, decoder);
}

}  // namespace quill::schema
