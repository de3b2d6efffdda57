#pragma once

#include <provenance/schema/content_hash.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    provenance::schema,
    content_hash_algorithm,
    provenance::schema::content_hash_algorithm::sha256,
    provenance::schema::content_hash_algorithm::blake3)
