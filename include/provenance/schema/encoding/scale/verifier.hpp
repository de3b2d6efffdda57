#pragma once

#include <provenance/schema/verifier.hpp>
#include <scale/scale.hpp>

// Declared beside the record so the codec finds them by argument-dependent
// lookup ahead of aggregate decomposition.
namespace provenance::schema {

void encode(const provenance::schema::verifier<1>& o, ::scale::Encoder& encoder);
void decode(provenance::schema::verifier<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
