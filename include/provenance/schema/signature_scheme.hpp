#pragma once

#include <array>
#include <provenance/schema/enum_string.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: signature scheme.
// Key families accepted for device and administrator keys.
namespace provenance::schema {

enum class signature_scheme : uint8_t {
  ed25519 = 0,
  secp256k1 = 1,
};

inline constexpr auto kSignatureSchemeMappings = std::array{
    std::pair<std::string_view, signature_scheme>{"ed25519",
                                                  signature_scheme::ed25519},
    std::pair<std::string_view, signature_scheme>{"secp256k1",
                                                  signature_scheme::secp256k1},
};

template <>
inline std::optional<signature_scheme> try_from_string<signature_scheme>(
    const std::string_view value) {
  return from_string(value, kSignatureSchemeMappings);
}

inline constexpr std::string_view to_string(const signature_scheme value) {
  return to_string(value, kSignatureSchemeMappings).value_or("unknown");
}

}  // namespace provenance::schema
