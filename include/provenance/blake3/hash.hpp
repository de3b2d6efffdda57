#pragma once
#include <blake3.h>
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace provenance::blake3 {

/// Incremental BLAKE3 state. Finalizing does not reset the state, so more
/// input may still be appended afterwards.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);

  provenance::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

provenance::schema::hash32_t hash(const std::string_view& str);
provenance::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace provenance::blake3
