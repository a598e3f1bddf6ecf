#pragma once
#include <quill/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace quill::storage {

using key_value_entry_t =
    std::pair<quill::schema::bytes_t, quill::schema::bytes_t>;

/// Writes staged by one operation and committed together.
///
/// An operation validates every precondition first, stages its writes here and
/// hands the batch to `storage::commit`, so state never holds half of a
/// mutation.
struct write_batch final {
  std::vector<key_value_entry_t> entries;
  std::vector<quill::schema::bytes_t> deletions;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const quill::schema::bytes_view_t& key,
           const T& value) {
    entries.push_back(key_value_entry_t{quill::schema::make_bytes(key),
                                        encoder.encode(value)});
  }

  void erase(const quill::schema::bytes_view_t& key) {
    deletions.push_back(quill::schema::make_bytes(key));
  }

  bool empty() const { return entries.empty() && deletions.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const quill::schema::bytes_view_t& key) const;

  /// True when any value is stored at key.
  bool exists(const quill::schema::bytes_view_t& key) const;

  /// Apply every entry of the batch atomically.
  void commit(const write_batch& batch);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const quill::schema::bytes_view_t& prefix) const;
};

/// Stage one operation into a fresh batch and commit it when the operation
/// succeeds. Rejected operations leave storage untouched.
template <typename Storage, typename Stage>
auto commit_staged(Storage& storage, Stage&& stage) {
  auto batch = write_batch{};
  auto result = stage(batch);
  if (result.ok()) {
    storage.commit(batch);
  }
  return result;
}

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace quill::storage
