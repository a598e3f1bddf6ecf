#pragma once
#include <quill/schema/repository_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace quill::schema {

void encode(const repository_state<1>& o, ::scale::Encoder& encoder);
void decode(repository_state<1>& o, ::scale::Decoder& decoder);

}  // namespace quill::schema
