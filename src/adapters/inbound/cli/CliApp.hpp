#pragma once

#include <ostream>
#include <string>

namespace prowl::client::adapters::cli
{

constexpr int kExitOk = 0;
constexpr int kExitError = 1;

// basename of argv[0], "prowl" when absent
std::string program_name(int argc, const char* const* argv);

// One whole invocation: parse, load config, compose, run. Errors are reported to `err` as
// "<program>: Error: <message>" and mapped to kExitError; --help prints to stdout and is kExitOk.
int run(int argc, const char* const* argv, std::ostream& err);

}  // namespace prowl::client::adapters::cli
