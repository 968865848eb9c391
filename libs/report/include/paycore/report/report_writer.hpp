#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "paycore/ledger/account_store.hpp"

namespace paycore {
namespace report {

// Header line of the account report.
inline constexpr const char* kReportHeader = "client,available,held,total,locked";

// One report row, amounts rendered with four decimal places.
std::string format_row(const ledger::AccountSnapshot& account);

// Writes the header and one row per account in the given order. Throws
// std::runtime_error if the stream fails.
void write_csv(std::ostream& out, const std::vector<ledger::AccountSnapshot>& accounts);

}  // namespace report
}  // namespace paycore
