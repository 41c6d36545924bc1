#pragma once

#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/message.hpp>

#include "application/ports/ILogger.hpp"
#include "application/ports/INotifier.hpp"
#include "domain/Config.hpp"

namespace prowl::client::infrastructure::http
{

// Blocking HTTPS POST of the notification as a form body. One connection per call; no retry.
class Notifier_Beast final : public prowl::client::application::ports::INotifier
{
 public:
  using Request = boost::beast::http::request<boost::beast::http::string_body>;

  Notifier_Beast(prowl::client::domain::Config::Api api,
                 prowl::client::application::ports::ILogger& log);

  prowl::client::application::ports::NotifyResult send(
      const prowl::client::domain::Notification& n) override;

  static Request make_request(const prowl::client::domain::Config::Api& api,
                              const prowl::client::domain::Notification& n);

 private:
  prowl::client::domain::Config::Api api_;
  prowl::client::application::ports::ILogger& log_;
};

}  // namespace prowl::client::infrastructure::http
