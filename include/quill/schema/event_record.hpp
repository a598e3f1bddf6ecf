#pragma once

#include <quill/schema/event.hpp>
#include <quill/schema/primitives.hpp>

#include <cstdint>

// Schema type: event record.
// Event log row persisted by the execution engine under a monotonically
// increasing id.
namespace quill::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  address_t sender{};
  timestamp_seconds_t recorded_at{};
  event_t event;
};

using event_record_t = event_record<1>;

}  // namespace quill::schema
