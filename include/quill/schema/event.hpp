#pragma once

#include <quill/schema/event_attribute.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: event.
// One fact emitted by a successful mutation (`Delegated`, `ReleaseAnchored`,
// ...).
namespace quill::schema {

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;

  /// Value of the first attribute named `key`.
  std::optional<std::string> attribute(std::string_view key) const {
    for (const auto& attribute : attributes) {
      if (attribute.key == key) {
        return attribute.value;
      }
    }
    return std::nullopt;
  }
};

using event_t = event<1>;

}  // namespace quill::schema
