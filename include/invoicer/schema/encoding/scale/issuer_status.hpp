#pragma once

#include <invoicer/schema/issuer_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    invoicer::schema,
    issuer_status_t,
    invoicer::schema::issuer_status_t::pending,
    invoicer::schema::issuer_status_t::approved,
    invoicer::schema::issuer_status_t::payment_received,
    invoicer::schema::issuer_status_t::rejected)
