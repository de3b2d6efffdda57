#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

// Schema type: ledger event.
// Notifications delivered to audit subscribers after a submission commits,
// DataSubmitted first and SubmissionVerified second.
namespace provenance::schema {

template <uint16_t Version>
struct data_submitted;

template <>
struct data_submitted<1> final {
  uint16_t version{1};
  hash32_t data_hash{};
  device_id_t device_id{};
  address_t verifier_address{};
  timestamp_milliseconds_t timestamp{};
  std::string data_uri;
  uint64_t sequence_number{};
};

using data_submitted_t = data_submitted<1>;

template <uint16_t Version>
struct submission_verified;

template <>
struct submission_verified<1> final {
  uint16_t version{1};
  hash32_t data_hash{};
  device_id_t device_id{};
  bool is_valid{};
};

using submission_verified_t = submission_verified<1>;

using ledger_event_t = std::variant<data_submitted_t, submission_verified_t>;

using event_sink_t = std::function<void(const ledger_event_t&)>;

}  // namespace provenance::schema
