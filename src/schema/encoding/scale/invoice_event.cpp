#include <invoicer/schema/encoding/scale/invoice_event.hpp>

using namespace invoicer::schema;

namespace invoicer::schema::encoding::scale {

void encode(invoice_created_event<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.issuer, encoder);
  encode(o.recipient, encoder);
  encode(o.amount, encoder);
  encode(o.due_date, encoder);
}

void decode(invoice_created_event<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.issuer, decoder);
  decode(o.recipient, decoder);
  decode(o.amount, decoder);
  decode(o.due_date, decoder);
}

void encode(invoice_updated_event<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.issuer_status, encoder);
  encode(o.recipient_status, encoder);
}

void decode(invoice_updated_event<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.issuer_status, decoder);
  decode(o.recipient_status, decoder);
}

}  // namespace invoicer::schema::encoding::scale
