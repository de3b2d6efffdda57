#include <provenance/schema/encoding/scale/verifier.hpp>

namespace provenance::schema {

void encode(const verifier<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.address, encoder);
  encode(o.name, encoder);
  encode(o.metadata, encoder);
  encode(o.active, encoder);
  encode(o.registered_at, encoder);
}

void decode(verifier<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.address, decoder);
  decode(o.name, decoder);
  decode(o.metadata, decoder);
  decode(o.active, decoder);
  decode(o.registered_at, decoder);
}

}  // namespace provenance::schema
