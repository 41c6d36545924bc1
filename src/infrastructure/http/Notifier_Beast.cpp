#include "infrastructure/http/Notifier_Beast.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <utility>

#include "infrastructure/http/FormBody.hpp"

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

using prowl::client::application::ports::LogLevel;
using prowl::client::application::ports::NotifyResult;
using prowl::client::domain::Notification;

namespace prowl::client::infrastructure::http
{

Notifier_Beast::Notifier_Beast(prowl::client::domain::Config::Api api,
                               prowl::client::application::ports::ILogger& log)
    : api_(std::move(api)), log_(log)
{
}

Notifier_Beast::Request Notifier_Beast::make_request(const prowl::client::domain::Config::Api& api,
                                                     const Notification& n)
{
  Request req{bhttp::verb::post, api.target, 11};
  req.set(bhttp::field::host, api.host);
  req.set(bhttp::field::user_agent, "prowl-cli/" PROWL_VERSION);
  req.set(bhttp::field::content_type, "application/x-www-form-urlencoded");
  req.body() = form_body(n.fields());
  req.prepare_payload();
  return req;
}

NotifyResult Notifier_Beast::send(const Notification& n)
{
  asio::io_context ioc;

  ssl::context ctx{ssl::context::tls_client};
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(ssl::verify_peer);

  tcp::resolver resolver{ioc};
  beast::ssl_stream<beast::tcp_stream> stream{ioc, ctx};

  // SNI, required by most virtual-hosted TLS endpoints
  if (!SSL_set_tlsext_host_name(stream.native_handle(), api_.host.c_str()))
  {
    throw boost::system::system_error(
        beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
        "SNI");
  }
  stream.set_verify_callback(ssl::host_name_verification(api_.host));

  log_.app(LogLevel::debug, "Connecting to " + api_.host + ":" + api_.port);
  const auto results = resolver.resolve(api_.host, api_.port);
  beast::get_lowest_layer(stream).connect(results);
  stream.handshake(ssl::stream_base::client);

  const auto req = make_request(api_, n);
  bhttp::write(stream, req);

  beast::flat_buffer buffer;
  bhttp::response<bhttp::string_body> res;
  bhttp::read(stream, buffer, res);

  // many servers drop the connection without close_notify; that is not an error here
  beast::error_code ec;
  stream.shutdown(ec);
  if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated)
    log_.app(LogLevel::debug, "TLS shutdown: " + ec.message());

  return NotifyResult{res.result_int(), res.body()};
}

}  // namespace prowl::client::infrastructure::http
