#pragma once
#include <quill/common/critical.hpp>
#include <quill/schema/encoding/encoder.hpp>
#include <quill/schema/encoding/scale/event_record.hpp>
#include <quill/schema/encoding/scale/grant_record.hpp>
#include <quill/schema/encoding/scale/primitives.hpp>
#include <quill/schema/encoding/scale/release_state.hpp>
#include <quill/schema/encoding/scale/repository_state.hpp>
#include <quill/schema/encoding/scale/snapshot_state.hpp>
#include <quill/schema/encoding/scale/workspace_state.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace quill::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  quill::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, quill::schema::bytes_t& out);

  template <typename T>
  T decode(const quill::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const quill::schema::bytes_view_t& bytes);
};

template <typename T>
quill::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    quill::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        quill::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const quill::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    quill::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const quill::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace quill::schema::encoding
