#pragma once

#include <quill/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace quill::testing {

inline quill::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = quill::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline quill::schema::address_t make_address(const uint8_t seed) {
  auto out = quill::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed ^ static_cast<uint8_t>(0xA0 + i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary directory removed when the guard goes out of scope.
class temp_path final {
 public:
  explicit temp_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}

  temp_path(const temp_path&) = delete;
  temp_path& operator=(const temp_path&) = delete;

  ~temp_path() { remove_path(path_); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace quill::testing
