#pragma once

#include <provenance/schema/device.hpp>
#include <provenance/schema/submission.hpp>
#include <provenance/schema/verifier.hpp>
#include <cstdint>

// Schema type: submission details.
// Chain of custody view: the ledger record joined with the current registry
// records of its device and verifier.
namespace provenance::schema {

template <uint16_t Version>
struct submission_details;

template <>
struct submission_details<1> final {
  uint16_t version{1};
  submission_t submission;
  device_t device;
  verifier_t verifier;
};

using submission_details_t = submission_details<1>;

}  // namespace provenance::schema
