#pragma once
#include <quill/schema/primitives.hpp>
#include <string_view>

namespace quill::blake3 {

quill::schema::hash32_t hash(const std::string_view& str);
quill::schema::hash32_t hash(const quill::schema::bytes_view_t& bytes);

}  // namespace quill::blake3
