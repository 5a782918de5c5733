#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace eventcache::client {

struct HttpRequest {
  std::string url;

  // Appended to url as a query string by the transport (percent-encoded).
  // Empty for continuation links, which are requested verbatim.
  std::vector<std::pair<std::string, std::string>> query_params;

  std::vector<std::pair<std::string, std::string>> headers;

  std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
  long        status = 0;
  std::string body;

  // Header names are stored lower-case.
  std::map<std::string, std::string> headers;

  std::optional<std::string> Header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    if (it == headers.end()) return std::nullopt;
    return it->second;
  }
};

/*
  Blocking HTTP GET seam.

  Implementations throw util::TransportError when no response was received
  (DNS, connect, TLS, timeout). Any received response, whatever its status,
  is returned to the caller.
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Get(const HttpRequest& request) = 0;
};

} // namespace eventcache::client
