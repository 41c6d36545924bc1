#include <iostream>

#include "adapters/inbound/cli/CliApp.hpp"
#include "adapters/inbound/cli/Interrupt.hpp"

namespace cli = prowl::client::adapters::cli;

int main(int argc, char** argv)
{
  cli::install_interrupt_handler(cli::program_name(argc, argv));
  return cli::run(argc, argv, std::cerr);
}
