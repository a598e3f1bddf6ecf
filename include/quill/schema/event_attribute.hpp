#pragma once

#include <cstdint>
#include <string>

// Schema type: event attribute.
// Key/value pair of an emitted fact; values are rendered as text (hex for
// identifiers) so that indexers can consume them without the schema.
namespace quill::schema {

template <uint16_t Version>
struct event_attribute;

template <>
struct event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};

  bool operator==(const event_attribute&) const = default;
};

using event_attribute_t = event_attribute<1>;

}  // namespace quill::schema
