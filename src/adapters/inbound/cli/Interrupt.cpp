#include "adapters/inbound/cli/Interrupt.hpp"

#include <unistd.h>

#include <csignal>
#include <cstdio>
#include <cstring>
#include <algorithm>

namespace prowl::client::adapters::cli
{

namespace
{
// filled once before the handler is installed; only read inside it
char g_message[256];
std::size_t g_message_len = 0;

void on_interrupt(int)
{
  // async-signal-safe only: write(2) and _exit(2)
  const ssize_t n = ::write(STDERR_FILENO, g_message, g_message_len);
  (void)n;
  ::_exit(kExitInterrupted);
}
}  // namespace

void install_interrupt_handler(const std::string& program)
{
  const int n = std::snprintf(g_message, sizeof(g_message), "\n%s: Operation interrupted.\n",
                              program.c_str());
  g_message_len = n < 0 ? 0 : std::min<std::size_t>(n, sizeof(g_message) - 1);

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_interrupt;
  sigemptyset(&sa.sa_mask);
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
}

}  // namespace prowl::client::adapters::cli
