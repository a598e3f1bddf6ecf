#pragma once
#include <quill/schema/grant_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace quill::schema {

void encode(const grant_record<1>& o, ::scale::Encoder& encoder);
void decode(grant_record<1>& o, ::scale::Decoder& decoder);

}  // namespace quill::schema
