#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: verifier.
// Trust chain root: a principal that vouches for a set of devices. Devices
// may only submit while their verifier is active.
namespace provenance::schema {

template <uint16_t Version>
struct verifier;

template <>
struct verifier<1> final {
  uint16_t version{1};
  address_t address{};
  std::string name;
  std::string metadata;
  bool active{};
  timestamp_milliseconds_t registered_at{};
};

using verifier_t = verifier<1>;

}  // namespace provenance::schema
