#include <invoicer/execution/approval.hpp>

using namespace invoicer::schema;

namespace invoicer::execution {

party_role_t resolve_party_role(const invoice_state_t& state,
                                const party_id_t& caller) {
  if (state.id == 0) {
    return party_role_t::none;
  }
  if (caller == state.recipient) {
    return party_role_t::recipient;
  }
  if (caller == state.issuer) {
    return party_role_t::issuer;
  }
  return party_role_t::none;
}

bool own_status_pending(const invoice_state_t& state, const party_role_t role) {
  switch (role) {
    case party_role_t::issuer:
      return state.issuer_status == issuer_status_t::pending;
    case party_role_t::recipient:
      return state.recipient_status == recipient_status_t::pending;
    case party_role_t::none:
      break;
  }
  return false;
}

std::optional<invoice_error_code> validate_party_action(
    const invoice_state_t& state,
    const party_role_t role) {
  if (role == party_role_t::none) {
    return invoice_error_code::unauthorized;
  }
  if (!own_status_pending(state, role)) {
    return invoice_error_code::invalid_transition;
  }
  return std::nullopt;
}

void apply_approval(invoice_state_t& state, const party_role_t role) {
  if (role == party_role_t::recipient) {
    state.recipient_status = recipient_status_t::approved;
  } else if (role == party_role_t::issuer) {
    state.issuer_status = issuer_status_t::approved;
  }
}

void apply_rejection(invoice_state_t& state) {
  state.recipient_status = recipient_status_t::rejected;
  state.issuer_status = issuer_status_t::rejected;
}

void apply_reopen(invoice_state_t& state, const party_role_t role) {
  if (role == party_role_t::recipient) {
    state.recipient_status = recipient_status_t::approved;
    state.issuer_status = issuer_status_t::pending;
  } else if (role == party_role_t::issuer) {
    state.issuer_status = issuer_status_t::approved;
    state.recipient_status = recipient_status_t::pending;
  }
}

bool settlement_ready(const invoice_state_t& state) {
  return state.recipient_status == recipient_status_t::approved &&
         state.issuer_status == issuer_status_t::approved;
}

void apply_settlement(invoice_state_t& state) {
  state.recipient_status = recipient_status_t::paid;
  state.issuer_status = issuer_status_t::payment_received;
}

bool sweep_applies(const invoice_state_t& state,
                   const timestamp_milliseconds_t now,
                   const sweep_mode_t mode) {
  if (now <= state.due_date) {
    return false;
  }
  const auto status = state.recipient_status;
  if (mode == sweep_mode_t::conjunctive) {
    return status != recipient_status_t::paid &&
           status != recipient_status_t::rejected &&
           status != recipient_status_t::overdue;
  }
  // A status cannot equal all three at once, so this admits every past-due
  // invoice.
  return status != recipient_status_t::paid ||
         status != recipient_status_t::rejected ||
         status != recipient_status_t::overdue;
}

}  // namespace invoicer::execution
