#pragma once
#include <provenance/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace provenance::storage {

using key_value_entry_t =
    std::pair<provenance::schema::bytes_t, provenance::schema::bytes_t>;

/// Last committed ledger checkpoint persisted alongside every submission.
struct committed_state final {
  uint64_t total_submissions{};
  provenance::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const provenance::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const provenance::schema::bytes_view_t& key,
           const T& value) const;

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const provenance::schema::bytes_view_t& prefix) const;

  /// Apply all entries as a single atomic write.
  void commit_batch(const std::vector<key_value_entry_t>& entries) const;
};

/// Pair `key` with the encoded `value` for a batch commit.
template <typename Encoder, typename T>
key_value_entry_t make_entry(Encoder& encoder,
                             provenance::schema::bytes_t key,
                             const T& value) {
  return key_value_entry_t{std::move(key), encoder.encode(value)};
}

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace provenance::storage
