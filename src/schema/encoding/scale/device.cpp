#include <provenance/schema/encoding/scale/device.hpp>

namespace provenance::schema {

void encode(const device<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.device_id, encoder);
  encode(o.verifier_address, encoder);
  encode(o.public_key, encoder);
  encode(o.metadata, encoder);
  encode(o.active, encoder);
  encode(o.registered_at, encoder);
}

void decode(device<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.device_id, decoder);
  decode(o.verifier_address, decoder);
  decode(o.public_key, decoder);
  decode(o.metadata, decoder);
  decode(o.active, decoder);
  decode(o.registered_at, decoder);
}

}  // namespace provenance::schema
