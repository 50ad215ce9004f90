#pragma once
#include <invoicer/schema/encoding/scale/issuer_status.hpp>
#include <invoicer/schema/encoding/scale/recipient_status.hpp>
#include <invoicer/schema/invoice_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace invoicer::schema::encoding::scale {

void encode(invoice_created_event<1>&& o, ::scale::Encoder& encoder);
void decode(invoice_created_event<1>&& o, ::scale::Decoder& decoder);

void encode(invoice_updated_event<1>&& o, ::scale::Encoder& encoder);
void decode(invoice_updated_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace invoicer::schema::encoding::scale
