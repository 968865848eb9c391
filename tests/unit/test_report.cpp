#include "test_report.hpp"

#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "paycore/report/report_writer.hpp"

namespace paycore::tests {

void test_report_writer() {
  using common::Amount;

  const std::vector<ledger::AccountSnapshot> accounts = {
      {.client = 1,
       .available = *Amount::parse("1.5"),
       .held = Amount{},
       .total = *Amount::parse("1.5"),
       .locked = false},
      {.client = 2,
       .available = Amount{},
       .held = *Amount::parse("0.0001"),
       .total = *Amount::parse("0.0001"),
       .locked = true},
  };

  assert(report::format_row(accounts[0]) == "1,1.5000,0.0000,1.5000,false");

  std::ostringstream out;
  report::write_csv(out, accounts);
  assert(out.str() ==
         "client,available,held,total,locked\n"
         "1,1.5000,0.0000,1.5000,false\n"
         "2,0.0000,0.0001,0.0001,true\n");

  std::ostringstream empty;
  report::write_csv(empty, {});
  assert(empty.str() == "client,available,held,total,locked\n");
}

}  // namespace paycore::tests
