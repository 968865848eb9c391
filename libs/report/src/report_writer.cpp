#include "paycore/report/report_writer.hpp"

#include <stdexcept>

namespace paycore {
namespace report {

std::string format_row(const ledger::AccountSnapshot& account) {
  std::string row = std::to_string(account.client);
  row.push_back(',');
  row += account.available.to_string();
  row.push_back(',');
  row += account.held.to_string();
  row.push_back(',');
  row += account.total.to_string();
  row.push_back(',');
  row += account.locked ? "true" : "false";
  return row;
}

void write_csv(std::ostream& out, const std::vector<ledger::AccountSnapshot>& accounts) {
  out << kReportHeader << '\n';
  for (const auto& account : accounts) {
    out << format_row(account) << '\n';
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write account report");
  }
}

}  // namespace report
}  // namespace paycore
