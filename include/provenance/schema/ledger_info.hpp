#pragma once

#include <provenance/schema/content_hash.hpp>
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace provenance::schema {

template <uint16_t Version>
struct ledger_info;

template <>
struct ledger_info<1> final {
  uint16_t schema_version{1};
  std::string name{"provenance-ledger"};
  std::string version{"0.1.0"};
  uint64_t total_submissions{};
  hash32_t state_root{};
  content_hash_algorithm content_hash{content_hash_algorithm::sha256};
  hash32_t registry_id{};
};

using ledger_info_t = ledger_info<1>;

}  // namespace provenance::schema
