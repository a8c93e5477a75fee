#pragma once

namespace bootstream::cli {

// Routes `bootstream` subcommands and returns process exit codes with a stable
// contract for cron jobs and build pipelines:
//   0  => success (including dry runs that change nothing)
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => catalog invalid, 11 => filter syntax, 20 => artifact invalid,
//   21 => unknown product, 30 => signature mismatch, 31 => keyring unavailable
int Dispatch(int argc, char** argv);

} // namespace bootstream::cli
