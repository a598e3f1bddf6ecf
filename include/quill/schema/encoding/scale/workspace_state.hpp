#pragma once
#include <quill/schema/workspace_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace quill::schema {

void encode(const workspace_state<1>& o, ::scale::Encoder& encoder);
void decode(workspace_state<1>& o, ::scale::Decoder& decoder);

}  // namespace quill::schema
