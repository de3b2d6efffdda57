#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>

// Schema type: admin grant.
// Single-use authorization for one administrative operation. `signature` is
// the administrator's signature over the operation challenge for `nonce`.
namespace provenance::schema {

template <uint16_t Version>
struct admin_grant;

template <>
struct admin_grant<1> final {
  uint16_t version{1};
  uint64_t nonce{};
  bytes_t signature;
};

using admin_grant_t = admin_grant<1>;

}  // namespace provenance::schema
