#include <invoicer/schema/encoding/scale/invoice_state.hpp>

using namespace invoicer::schema;

namespace invoicer::schema::encoding::scale {

void encode(invoice_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.issuer_name, encoder);
  encode(o.client_name, encoder);
  encode(o.issuer, encoder);
  encode(o.recipient, encoder);
  encode(o.amount, encoder);
  encode(o.due_date, encoder);
  encode(o.issuer_status, encoder);
  encode(o.recipient_status, encoder);
  encode(o.creation_date, encoder);
  encode(o.last_modified_date, encoder);
  encode(o.message, encoder);
}

void decode(invoice_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.issuer_name, decoder);
  decode(o.client_name, decoder);
  decode(o.issuer, decoder);
  decode(o.recipient, decoder);
  decode(o.amount, decoder);
  decode(o.due_date, decoder);
  decode(o.issuer_status, decoder);
  decode(o.recipient_status, decoder);
  decode(o.creation_date, decoder);
  decode(o.last_modified_date, decoder);
  decode(o.message, decoder);
}

}  // namespace invoicer::schema::encoding::scale
