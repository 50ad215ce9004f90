#pragma once

#include <invoicer/schema/recipient_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    invoicer::schema,
    recipient_status_t,
    invoicer::schema::recipient_status_t::pending,
    invoicer::schema::recipient_status_t::approved,
    invoicer::schema::recipient_status_t::paid,
    invoicer::schema::recipient_status_t::overdue,
    invoicer::schema::recipient_status_t::rejected)
