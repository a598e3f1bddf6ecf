#pragma once
#include <quill/schema/release_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace quill::schema {

void encode(const release_state<1>& o, ::scale::Encoder& encoder);
void decode(release_state<1>& o, ::scale::Decoder& decoder);

}  // namespace quill::schema
