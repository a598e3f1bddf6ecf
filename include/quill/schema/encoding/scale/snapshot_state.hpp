#pragma once
#include <quill/schema/snapshot_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace quill::schema {

void encode(const snapshot_state<1>& o, ::scale::Encoder& encoder);
void decode(snapshot_state<1>& o, ::scale::Decoder& decoder);

}  // namespace quill::schema
