#pragma once

#include <array>
#include <provenance/schema/enum_string.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: content hash algorithm.
// Digest used to content-address submitted payloads.
namespace provenance::schema {

enum class content_hash_algorithm : uint16_t {
  sha256 = 0,
  blake3 = 1,
};

inline constexpr auto kContentHashMappings = std::array{
    std::pair<std::string_view, content_hash_algorithm>{
        "sha256", content_hash_algorithm::sha256},
    std::pair<std::string_view, content_hash_algorithm>{
        "blake3", content_hash_algorithm::blake3},
};

template <>
inline std::optional<content_hash_algorithm>
try_from_string<content_hash_algorithm>(const std::string_view value) {
  return from_string(value, kContentHashMappings);
}

inline constexpr std::string_view to_string(
    const content_hash_algorithm value) {
  return to_string(value, kContentHashMappings).value_or("unknown");
}

}  // namespace provenance::schema
