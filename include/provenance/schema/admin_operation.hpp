#pragma once

#include <array>
#include <provenance/schema/enum_string.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: admin operation.
// Administrative mutations that require a signed admin grant.
namespace provenance::schema {

enum class admin_operation : uint16_t {
  register_verifier = 0,
  set_verifier_active = 1,
  register_device = 2,
  set_device_active = 3,
  update_registry = 4,
};

inline constexpr auto kAdminOperationMappings = std::array{
    std::pair<std::string_view, admin_operation>{
        "register_verifier", admin_operation::register_verifier},
    std::pair<std::string_view, admin_operation>{
        "set_verifier_active", admin_operation::set_verifier_active},
    std::pair<std::string_view, admin_operation>{
        "register_device", admin_operation::register_device},
    std::pair<std::string_view, admin_operation>{
        "set_device_active", admin_operation::set_device_active},
    std::pair<std::string_view, admin_operation>{
        "update_registry", admin_operation::update_registry},
};

template <>
inline std::optional<admin_operation> try_from_string<admin_operation>(
    const std::string_view value) {
  return from_string(value, kAdminOperationMappings);
}

inline constexpr std::string_view to_string(const admin_operation value) {
  return to_string(value, kAdminOperationMappings).value_or("unknown");
}

}  // namespace provenance::schema
