#include <invoicer/schema/encoding/scale/invoice_event_record.hpp>

using namespace invoicer::schema;

namespace invoicer::schema::encoding::scale {

void encode(invoice_event_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.recorded_at, encoder);
  encode(o.event, encoder);
}

void decode(invoice_event_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.recorded_at, decoder);
  decode(o.event, decoder);
}

}  // namespace invoicer::schema::encoding::scale
