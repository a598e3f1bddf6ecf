#include <quill/schema/operation_result.hpp>

namespace quill::schema {

operation_result_t make_success(const std::string_view codespace,
                                std::vector<event_t> events) {
  return operation_result_t{.code = 0,
                            .log = "ok",
                            .codespace = std::string{codespace},
                            .events = std::move(events)};
}

operation_result_t make_failure(const std::string_view codespace,
                                const error_code code) {
  return operation_result_t{.code = static_cast<uint32_t>(code),
                            .log = std::string{to_string(code)},
                            .codespace = std::string{codespace}};
}

event_t make_event(const std::string_view type,
                   std::initializer_list<event_attribute_t> attributes) {
  return event_t{.type = std::string{type}, .attributes = attributes};
}

event_attribute_t make_attribute(const std::string_view key,
                                 std::string value,
                                 const bool index) {
  return event_attribute_t{
      .key = std::string{key}, .value = std::move(value), .index = index};
}

}  // namespace quill::schema
