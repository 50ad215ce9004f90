#pragma once

#include <invoicer/schema/encoding/scale/invoice_event.hpp>
#include <invoicer/schema/invoice_event_record.hpp>
#include <scale/scale.hpp>

namespace invoicer::schema::encoding::scale {

void encode(invoicer::schema::invoice_event_record<1>&& o,
            ::scale::Encoder& encoder);
void decode(invoicer::schema::invoice_event_record<1>&& o,
            ::scale::Decoder& decoder);

}  // namespace invoicer::schema::encoding::scale
