#pragma once

#include <invoicer/schema/primitives.hpp>
#include <invoicer/storage/storage.hpp>
#include <functional>
#include <vector>

namespace invoicer::execution {

/// Value-transfer collaborator used by settlement.
///
/// Appends the writes that move `amount` from `from` to `to` onto `batch` and
/// returns true, or returns false when the transfer cannot happen. Nothing is
/// written by the rail itself: settlement commits `batch` together with the
/// settled invoice and its event, and drops it when the rail returns false or
/// throws.
using transfer_rail_t = std::function<bool(
    const invoicer::schema::party_id_t& from,
    const invoicer::schema::party_id_t& to,
    const invoicer::schema::amount_t& amount,
    std::vector<invoicer::storage::key_value_entry_t>& batch)>;

}  // namespace invoicer::execution
