#pragma once
#include <invoicer/schema/encoding/scale/issuer_status.hpp>
#include <invoicer/schema/encoding/scale/recipient_status.hpp>
#include <invoicer/schema/invoice_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace invoicer::schema::encoding::scale {

void encode(invoice_state<1>&& o, ::scale::Encoder& encoder);
void decode(invoice_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace invoicer::schema::encoding::scale
