#include "adapters/inbound/cli/CliParser.hpp"

using prowl::client::domain::RawInvocation;

namespace prowl::client::adapters::cli
{

CliParser::CliParser() : app_("Deliver a notification using Prowl for iOS.", "prowl")
{
  app_.footer(
      "Usage forms:\n"
      "  prowl --help\n"
      "  prowl --set-api-key=<api-key>\n"
      "  prowl [<options>] [[<event>] <description>]");

  eventOpt_ = app_.add_option("event", event_, "The event part of the notification.");

  descriptionOpt_ = app_.add_option(
      "description", description_,
      "The description part of the notification. Defaults to the URL specified using --url, "
      "if one is specified. Otherwise the description is mandatory.");

  applicationOpt_ = app_.add_option(
      "-a,--application", application_,
      "The application part of the notification. Defaults to the current user's name and the "
      "host's name in the form of <username>@<hostname>.");

  urlOpt_ = app_.add_option("-u,--url", url_,
                            "URL that should be opened when the notification is activated.");

  app_.add_option("-p,--priority", priority_,
                  "The priority of the notification. Specify a number from -2 to 2. Defaults "
                  "to 0.");

  apiKeyOpt_ = app_.add_option("-k,--api-key", apiKey_, "API key to use for the notification.");

  setApiKeyOpt_ = app_.add_option(
      "--set-api-key", setApiKey_,
      "Set the default API key used for calls where -k is not specified.");
}

RawInvocation CliParser::parse(int argc, const char* const* argv)
{
  app_.parse(argc, argv);

  RawInvocation r;
  if (eventOpt_->count()) r.positionals.push_back(event_);
  if (descriptionOpt_->count()) r.positionals.push_back(description_);
  if (applicationOpt_->count()) r.application = application_;
  if (urlOpt_->count()) r.url = url_;
  if (apiKeyOpt_->count()) r.apiKey = apiKey_;
  if (setApiKeyOpt_->count()) r.setApiKey = setApiKey_;
  r.priority = priority_;
  return r;
}

}  // namespace prowl::client::adapters::cli
