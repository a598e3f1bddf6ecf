#pragma once
#include <quill/schema/event_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace quill::schema {

void encode(const event_attribute<1>& o, ::scale::Encoder& encoder);
void decode(event_attribute<1>& o, ::scale::Decoder& decoder);

void encode(const event<1>& o, ::scale::Encoder& encoder);
void decode(event<1>& o, ::scale::Decoder& decoder);

void encode(const event_record<1>& o, ::scale::Encoder& encoder);
void decode(event_record<1>& o, ::scale::Decoder& decoder);

}  // namespace quill::schema
