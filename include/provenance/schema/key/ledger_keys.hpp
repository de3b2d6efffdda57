#pragma once

#include <array>
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: ledger keys.
// Canonical key prefixes and key builders for registry records, ledger
// records, ordered indices and bookkeeping rows.
namespace provenance::schema::key {

inline constexpr std::string_view kVerifierKeyPrefix{"PV|REGISTRY|VERIFIER|"};
inline constexpr std::string_view kDeviceKeyPrefix{"PV|REGISTRY|DEVICE|"};
inline constexpr std::string_view kVerifierDeviceKeyPrefix{
    "PV|REGISTRY|VERIFIER_DEVICE|"};
inline constexpr std::string_view kSubmissionKeyPrefix{
    "PV|LEDGER|SUBMISSION|"};
inline constexpr std::string_view kHistoryKeyPrefix{"PV|LEDGER|HISTORY|"};
inline constexpr std::string_view kDeviceIndexKeyPrefix{
    "PV|LEDGER|DEVICE_INDEX|"};
inline constexpr std::string_view kVerifierIndexKeyPrefix{
    "PV|LEDGER|VERIFIER_INDEX|"};
inline constexpr std::string_view kCommittedStateKey{"PV|LEDGER|META|STATE"};
inline constexpr std::string_view kAdminNonceKey{"PV|ADMIN|NONCE"};

inline constexpr std::array<std::string_view, 9> kLedgerKeyspaces{
    kVerifierKeyPrefix,      kDeviceKeyPrefix,
    kVerifierDeviceKeyPrefix, kSubmissionKeyPrefix,
    kHistoryKeyPrefix,       kDeviceIndexKeyPrefix,
    kVerifierIndexKeyPrefix, kCommittedStateKey,
    kAdminNonceKey};

bytes_t make_prefix_key(std::string_view prefix);

bytes_t make_verifier_key(const address_t& address);
bytes_t make_device_key(const device_id_t& device_id);
bytes_t make_verifier_device_key(const address_t& address, uint64_t position);

bytes_t make_submission_key(const hash32_t& data_hash);
bytes_t make_history_key(uint64_t sequence_number);
bytes_t make_device_index_key(const device_id_t& device_id, uint64_t position);
bytes_t make_verifier_index_key(const address_t& address, uint64_t position);

}  // namespace provenance::schema::key
