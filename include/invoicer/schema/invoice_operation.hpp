#pragma once
#include <invoicer/schema/approve_invoice.hpp>
#include <invoicer/schema/create_invoice.hpp>
#include <invoicer/schema/modify_invoice.hpp>
#include <invoicer/schema/pay_invoice.hpp>
#include <invoicer/schema/reject_invoice.hpp>
#include <invoicer/schema/sweep_overdue.hpp>
#include <variant>

namespace invoicer::schema {

using invoice_operation_t = std::variant<create_invoice_t,
                                         approve_invoice_t,
                                         reject_invoice_t,
                                         modify_invoice_t,
                                         pay_invoice_t,
                                         sweep_overdue_t>;

}  // namespace invoicer::schema
