#include <provenance/schema/key/builder.hpp>
#include <provenance/schema/key/ledger_keys.hpp>

namespace provenance::schema::key {

bytes_t make_prefix_key(std::string_view prefix) {
  return builder{}.write(prefix).data;
}

bytes_t make_verifier_key(const address_t& address) {
  return builder{}.write(kVerifierKeyPrefix).write(address).data;
}

bytes_t make_device_key(const device_id_t& device_id) {
  return builder{}.write(kDeviceKeyPrefix).write(device_id).data;
}

bytes_t make_verifier_device_key(const address_t& address,
                                 const uint64_t position) {
  return builder{}
      .write(kVerifierDeviceKeyPrefix)
      .write(address)
      .write_ordered(position)
      .data;
}

bytes_t make_submission_key(const hash32_t& data_hash) {
  return builder{}.write(kSubmissionKeyPrefix).write(data_hash).data;
}

bytes_t make_history_key(const uint64_t sequence_number) {
  return builder{}.write(kHistoryKeyPrefix).write_ordered(sequence_number).data;
}

bytes_t make_device_index_key(const device_id_t& device_id,
                              const uint64_t position) {
  return builder{}
      .write(kDeviceIndexKeyPrefix)
      .write(device_id)
      .write_ordered(position)
      .data;
}

bytes_t make_verifier_index_key(const address_t& address,
                                const uint64_t position) {
  return builder{}
      .write(kVerifierIndexKeyPrefix)
      .write(address)
      .write_ordered(position)
      .data;
}

}  // namespace provenance::schema::key
