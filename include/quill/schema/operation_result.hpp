#pragma once

#include <quill/schema/error_code.hpp>
#include <quill/schema/event.hpp>
#include <quill/schema/primitives.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace quill::schema {

template <uint16_t Version>
struct operation_result;

/// Outcome of one mutation; `code == 0` means every write was committed.
template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::vector<event_t> events;

  bool ok() const { return code == 0; }
  error_category category() const { return category_of_code(code); }
};

using operation_result_t = operation_result<1>;

operation_result_t make_success(std::string_view codespace,
                                std::vector<event_t> events);

operation_result_t make_failure(std::string_view codespace, error_code code);

event_t make_event(std::string_view type,
                   std::initializer_list<event_attribute_t> attributes);

event_attribute_t make_attribute(std::string_view key,
                                 std::string value,
                                 bool index = false);

}  // namespace quill::schema
