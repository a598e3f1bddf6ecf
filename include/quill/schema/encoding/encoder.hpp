#pragma once
#include <quill/schema/primitives.hpp>
#include <optional>
#include <span>

namespace quill::schema::encoding {

/// Canonical binary codec selected at build time by tag.
///
/// Every stored record, signing payload and query payload goes through one
/// instance of this type so that the wire format has a single owner.
template <typename Library>
struct encoder {
  template <typename T>
  quill::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, quill::schema::bytes_t& out);

  template <typename T>
  T decode(const quill::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const quill::schema::bytes_view_t& bytes);
};

}  // namespace quill::schema::encoding
