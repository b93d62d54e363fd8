#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"

#include <iostream>
#include <string>
#include <vector>

int main() {
  using ranops::tests::common::DispatchArgs;
  using ranops::tests::common::ExpectEqual;

  ExpectEqual(DispatchArgs({"ranops", "--help"}), 0, "--help");
  ExpectEqual(DispatchArgs({"ranops", "3", "-h"}), 0, "-h after a positional");

  const std::vector<std::vector<std::string>> usage_errors = {
      {"ranops", "x"},
      {"ranops", "-1"},
      {"ranops", "1", "0"},
      {"ranops", "1", "1", "0"},
      {"ranops", "1", "2", "3", "4"},
      {"ranops", "3", "2", "5"},
      {"ranops", "3", "1", "2"},
      {"ranops", "--bogus"},
      {"ranops", "--config"},
      {"ranops", "--log-level"},
      {"ranops", "--log-level", "loud"},
      {"ranops", "4294967296"},
  };
  for (const auto& args : usage_errors) {
    std::string joined;
    for (const auto& arg : args) {
      joined += arg + " ";
    }
    ExpectEqual(DispatchArgs(args), 2, "usage error for '" + joined + "'");
  }

  std::cout << "cli_usage_smoke: ok\n";
  return 0;
}
