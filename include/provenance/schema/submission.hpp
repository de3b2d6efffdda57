#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: submission.
// Append-only ledger record keyed by the content hash. `verifier_address` is
// the owning verifier at submission time, not the current one.
namespace provenance::schema {

template <uint16_t Version>
struct submission;

template <>
struct submission<1> final {
  uint16_t version{1};
  hash32_t data_hash{};
  device_id_t device_id{};
  address_t verifier_address{};
  bytes_t signature;
  timestamp_milliseconds_t timestamp{};
  std::string data_uri;
  std::string metadata;
  bool verified{};
  uint64_t sequence_number{};
};

using submission_t = submission<1>;

}  // namespace provenance::schema
