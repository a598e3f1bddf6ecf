#pragma once

#include <quill/schema/primitives.hpp>

namespace quill::execution {

/// Acting identity and ledger time of one call.
struct call_context final {
  quill::schema::address_t sender{};
  quill::schema::timestamp_seconds_t now{};
};

}  // namespace quill::execution
