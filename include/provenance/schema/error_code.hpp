#pragma once

#include <array>
#include <cstdint>
#include <provenance/schema/enum_string.hpp>
#include <string_view>

namespace provenance::schema {

/// Caller-facing failure classes. Every error_code belongs to exactly one.
enum class error_kind : uint16_t {
  none = 0,
  validation = 1,
  authorization = 2,
  conflict = 3,
  not_found = 4,
  integrity = 5,
  range = 6,
};

// The hundreds digit of an error_code selects its error_kind.
enum class error_code : uint32_t {
  ok = 0,

  zero_data_hash = 100,
  empty_signature = 101,
  empty_data_uri = 102,
  data_uri_too_long = 103,
  metadata_too_long = 104,
  zero_address = 105,
  zero_device_id = 106,
  invalid_verifier_name = 107,
  unsupported_public_key = 108,
  invalid_registry = 109,
  malformed_identifier = 110,

  device_unknown = 200,
  device_inactive = 201,
  verifier_unknown = 202,
  verifier_inactive = 203,
  admin_nonce_mismatch = 204,
  admin_signature_invalid = 205,

  duplicate_data_hash = 300,
  verifier_exists = 301,
  device_exists = 302,

  submission_missing = 400,
  device_missing = 401,
  verifier_missing = 402,

  signature_verification_failed = 500,
  malformed_signature = 501,

  history_start_out_of_range = 600,
};

inline constexpr auto kErrorKindMappings = std::array{
    std::pair<std::string_view, error_kind>{"none", error_kind::none},
    std::pair<std::string_view, error_kind>{"validation",
                                            error_kind::validation},
    std::pair<std::string_view, error_kind>{"authorization",
                                            error_kind::authorization},
    std::pair<std::string_view, error_kind>{"conflict", error_kind::conflict},
    std::pair<std::string_view, error_kind>{"not_found",
                                            error_kind::not_found},
    std::pair<std::string_view, error_kind>{"integrity",
                                            error_kind::integrity},
    std::pair<std::string_view, error_kind>{"range", error_kind::range},
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"zero_data_hash",
                                            error_code::zero_data_hash},
    std::pair<std::string_view, error_code>{"empty_signature",
                                            error_code::empty_signature},
    std::pair<std::string_view, error_code>{"empty_data_uri",
                                            error_code::empty_data_uri},
    std::pair<std::string_view, error_code>{"data_uri_too_long",
                                            error_code::data_uri_too_long},
    std::pair<std::string_view, error_code>{"metadata_too_long",
                                            error_code::metadata_too_long},
    std::pair<std::string_view, error_code>{"zero_address",
                                            error_code::zero_address},
    std::pair<std::string_view, error_code>{"zero_device_id",
                                            error_code::zero_device_id},
    std::pair<std::string_view, error_code>{"invalid_verifier_name",
                                            error_code::invalid_verifier_name},
    std::pair<std::string_view, error_code>{
        "unsupported_public_key", error_code::unsupported_public_key},
    std::pair<std::string_view, error_code>{"invalid_registry",
                                            error_code::invalid_registry},
    std::pair<std::string_view, error_code>{"malformed_identifier",
                                            error_code::malformed_identifier},
    std::pair<std::string_view, error_code>{"device_unknown",
                                            error_code::device_unknown},
    std::pair<std::string_view, error_code>{"device_inactive",
                                            error_code::device_inactive},
    std::pair<std::string_view, error_code>{"verifier_unknown",
                                            error_code::verifier_unknown},
    std::pair<std::string_view, error_code>{"verifier_inactive",
                                            error_code::verifier_inactive},
    std::pair<std::string_view, error_code>{"admin_nonce_mismatch",
                                            error_code::admin_nonce_mismatch},
    std::pair<std::string_view, error_code>{
        "admin_signature_invalid", error_code::admin_signature_invalid},
    std::pair<std::string_view, error_code>{"duplicate_data_hash",
                                            error_code::duplicate_data_hash},
    std::pair<std::string_view, error_code>{"verifier_exists",
                                            error_code::verifier_exists},
    std::pair<std::string_view, error_code>{"device_exists",
                                            error_code::device_exists},
    std::pair<std::string_view, error_code>{"submission_missing",
                                            error_code::submission_missing},
    std::pair<std::string_view, error_code>{"device_missing",
                                            error_code::device_missing},
    std::pair<std::string_view, error_code>{"verifier_missing",
                                            error_code::verifier_missing},
    std::pair<std::string_view, error_code>{
        "signature_verification_failed",
        error_code::signature_verification_failed},
    std::pair<std::string_view, error_code>{"malformed_signature",
                                            error_code::malformed_signature},
    std::pair<std::string_view, error_code>{
        "history_start_out_of_range", error_code::history_start_out_of_range},
};

inline constexpr error_kind kind_of(const error_code code) {
  switch (static_cast<uint32_t>(code) / 100) {
    case 0:
      return error_kind::none;
    case 1:
      return error_kind::validation;
    case 2:
      return error_kind::authorization;
    case 3:
      return error_kind::conflict;
    case 4:
      return error_kind::not_found;
    case 5:
      return error_kind::integrity;
    case 6:
      return error_kind::range;
    default:
      return error_kind::none;
  }
}

inline constexpr std::string_view to_string(const error_kind value) {
  return to_string(value, kErrorKindMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

}  // namespace provenance::schema
