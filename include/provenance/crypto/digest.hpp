#pragma once

#include <provenance/schema/content_hash.hpp>
#include <provenance/schema/primitives.hpp>

namespace provenance::crypto {

provenance::schema::hash32_t sha256(
    const provenance::schema::bytes_view_t& bytes);

/// Content address of `bytes` under the configured algorithm.
provenance::schema::hash32_t content_hash(
    provenance::schema::content_hash_algorithm algorithm,
    const provenance::schema::bytes_view_t& bytes);

}  // namespace provenance::crypto
