#include <quill/schema/encoding/scale/event_record.hpp>

namespace quill::schema {

void encode(const event_attribute<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.key, encoder);
  encode(o.value, encoder);
  encode(o.index, encoder);
}

void decode(event_attribute<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.key, decoder);
  decode(o.value, decoder);
  decode(o.index, decoder);
}

void encode(const event<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.type, encoder);
  encode(o.attributes, encoder);
}

void decode(event<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.type, decoder);
  decode(o.attributes, decoder);
}

void encode(const event_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.sender, encoder);
  encode(o.recorded_at, encoder);
  encode(o.event, encoder);
}

void decode(event_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.sender, decoder);
  decode(o.recorded_at, decoder);
  decode(o.event, decoder);
}

}  // namespace quill::schema
