#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: device.
// Device security module bound to exactly one verifier. `public_key` selects
// the signature scheme by length (32 bytes Ed25519, 33 bytes secp256k1).
namespace provenance::schema {

template <uint16_t Version>
struct device;

template <>
struct device<1> final {
  uint16_t version{1};
  device_id_t device_id{};
  address_t verifier_address{};
  bytes_t public_key;
  std::string metadata;
  bool active{};
  timestamp_milliseconds_t registered_at{};
};

using device_t = device<1>;

}  // namespace provenance::schema
