#pragma once

#include <string>

#include "http_transport.hpp"

namespace eventcache::client {

/*
  HttpTransport over libcurl easy handles.

  One handle per request; curl_global_init is performed once per process.
*/
class CurlHttpTransport final : public HttpTransport {
 public:
  explicit CurlHttpTransport(std::string user_agent);

  HttpResponse Get(const HttpRequest& request) override;

 private:
  std::string user_agent_;
};

} // namespace eventcache::client
