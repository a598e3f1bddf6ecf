#pragma once
#include <quill/schema/governance_status.hpp>
#include <quill/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Custom SCALE codecs live in the schema namespace so that the library finds
// them through argument dependent lookup.
namespace quill::schema {

void encode(const snapshot_ref_t& o, ::scale::Encoder& encoder);
void decode(snapshot_ref_t& o, ::scale::Decoder& decoder);

void encode(const governance_status_t& o, ::scale::Encoder& encoder);
void decode(governance_status_t& o, ::scale::Decoder& decoder);

}  // namespace quill::schema
