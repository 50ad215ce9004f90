#pragma once

#include <invoicer/schema/invoice_error_code.hpp>
#include <invoicer/schema/invoice_state.hpp>
#include <invoicer/schema/sweep_mode.hpp>

#include <cstdint>
#include <optional>

// Transition rules for the two per-party invoice statuses. Approve, reject and
// modify share `validate_party_action`; the mutators assume it passed.
namespace invoicer::execution {

enum class party_role_t : uint8_t { none = 0, issuer = 1, recipient = 2 };

/// Which side of the invoice `caller` acts for. Recipient wins the (never
/// persisted) case where both identities match.
party_role_t resolve_party_role(const invoicer::schema::invoice_state_t& state,
                                const invoicer::schema::party_id_t& caller);

/// True when the acting party's own status is still pending.
bool own_status_pending(const invoicer::schema::invoice_state_t& state,
                        party_role_t role);

/// Shared precondition for approve, reject and modify.
///
/// Returns `unauthorized` for a non-party, `invalid_transition` when the
/// acting party's own status is not pending, std::nullopt otherwise.
std::optional<invoicer::schema::invoice_error_code> validate_party_action(
    const invoicer::schema::invoice_state_t& state,
    party_role_t role);

void apply_approval(invoicer::schema::invoice_state_t& state,
                    party_role_t role);

/// Both sides become rejected regardless of which party acted.
void apply_rejection(invoicer::schema::invoice_state_t& state);

/// Acting side becomes approved, the counterparty goes back to pending.
void apply_reopen(invoicer::schema::invoice_state_t& state, party_role_t role);

bool settlement_ready(const invoicer::schema::invoice_state_t& state);

void apply_settlement(invoicer::schema::invoice_state_t& state);

/// Whether the overdue sweep rewrites this invoice at time `now`.
bool sweep_applies(const invoicer::schema::invoice_state_t& state,
                   invoicer::schema::timestamp_milliseconds_t now,
                   invoicer::schema::sweep_mode_t mode);

}  // namespace invoicer::execution
