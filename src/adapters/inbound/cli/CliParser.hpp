#pragma once

#include <CLI/CLI.hpp>

#include "domain/Invocation.hpp"

namespace prowl::client::adapters::cli
{

// Command-line surface of the tool. Only tokenizes and types the arguments; what they mean
// together is decided by RequestComposer.
class CliParser
{
 public:
  CliParser();

  // Throws CLI::ParseError; CLI::Success for --help.
  prowl::client::domain::RawInvocation parse(int argc, const char* const* argv);

  // Prints help or the parse error the way CLI11 does and returns its exit code.
  int exit(const CLI::Error& e) { return app_.exit(e); }

 private:
  CLI::App app_;

  std::string event_;
  std::string description_;
  std::string application_;
  std::string url_;
  std::string apiKey_;
  std::string setApiKey_;
  int priority_{0};

  CLI::Option* eventOpt_{nullptr};
  CLI::Option* descriptionOpt_{nullptr};
  CLI::Option* applicationOpt_{nullptr};
  CLI::Option* urlOpt_{nullptr};
  CLI::Option* apiKeyOpt_{nullptr};
  CLI::Option* setApiKeyOpt_{nullptr};
};

}  // namespace prowl::client::adapters::cli
