#include "infrastructure/http/FormBody.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

namespace prowl::client::infrastructure::http
{

namespace
{
struct CurlDeleter
{
  void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct CurlFree
{
  void operator()(char* p) const { curl_free(p); }
};

std::string escape(CURL* curl, const std::string& text)
{
  std::unique_ptr<char, CurlFree> out{
      curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()))};
  if (!out) throw std::runtime_error("Failed to URL-encode form field");
  return out.get();
}
}  // namespace

std::string form_body(const std::vector<prowl::client::domain::FormField>& fields)
{
  std::unique_ptr<CURL, CurlDeleter> curl{curl_easy_init()};
  if (!curl) throw std::runtime_error("Failed to initialize CURL instance");

  std::string body;
  for (std::size_t i = 0; i < fields.size(); ++i)
  {
    if (i) body.push_back('&');
    body += escape(curl.get(), fields[i].first);
    body.push_back('=');
    body += escape(curl.get(), fields[i].second);
  }
  return body;
}

}  // namespace prowl::client::infrastructure::http
