#include <provenance/schema/encoding/scale/submission.hpp>

namespace provenance::schema {

void encode(const submission<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.data_hash, encoder);
  encode(o.device_id, encoder);
  encode(o.verifier_address, encoder);
  encode(o.signature, encoder);
  encode(o.timestamp, encoder);
  encode(o.data_uri, encoder);
  encode(o.metadata, encoder);
  encode(o.verified, encoder);
  encode(o.sequence_number, encoder);
}

void decode(submission<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.data_hash, decoder);
  decode(o.device_id, decoder);
  decode(o.verifier_address, decoder);
  decode(o.signature, decoder);
  decode(o.timestamp, decoder);
  decode(o.data_uri, decoder);
  decode(o.metadata, decoder);
  decode(o.verified, decoder);
  decode(o.sequence_number, decoder);
}

}  // namespace provenance::schema
