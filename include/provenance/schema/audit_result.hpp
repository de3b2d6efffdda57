#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: audit result.
// Outcome of re-folding the persisted submission log into a state root and
// comparing it against the live root.
namespace provenance::schema {

template <uint16_t Version>
struct audit_result;

template <>
struct audit_result<1> final {
  uint16_t version{1};
  bool consistent{};
  uint64_t checked{};
  hash32_t live_root{};
  hash32_t recomputed_root{};
  std::string error;
};

using audit_result_t = audit_result<1>;

}  // namespace provenance::schema
