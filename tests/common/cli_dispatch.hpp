#ifndef BOOTSTREAM_TESTS_COMMON_CLI_DISPATCH_HPP_
#define BOOTSTREAM_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "bootstream/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace bootstream::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return bootstream::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

struct CapturedDispatch {
  int exit_code = 0;
  std::string out;
  std::string err;
};

// Runs the router with stdout/stderr redirected into strings.
inline CapturedDispatch DispatchCaptured(const std::vector<std::string>& argv_storage) {
  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());

  CapturedDispatch result;
  result.exit_code = DispatchArgs(argv_storage);

  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);
  result.out = captured_out.str();
  result.err = captured_err.str();
  return result;
}

} // namespace bootstream::tests::common

#endif // BOOTSTREAM_TESTS_COMMON_CLI_DISPATCH_HPP_
