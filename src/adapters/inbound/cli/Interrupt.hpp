#pragma once

#include <string>

namespace prowl::client::adapters::cli
{

constexpr int kExitInterrupted = 2;

// SIGINT/SIGTERM print "<program>: Operation interrupted." and end the process with
// kExitInterrupted. Safe at any point: settings writes are rename-based.
void install_interrupt_handler(const std::string& program);

}  // namespace prowl::client::adapters::cli
