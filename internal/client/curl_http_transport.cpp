#include "curl_http_transport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>

#include "internal/util/errors.hpp"

namespace eventcache::client {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

struct CurlListDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlList   = std::unique_ptr<curl_slist, CurlListDeleter>;

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw util::TransportError("curl_global_init failed");
    }
  });
}

size_t WriteBody(char* data, size_t size, size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  body->append(data, size * nmemb);
  return size * nmemb;
}

size_t WriteHeader(char* data, size_t size, size_t nitems, void* userp) {
  auto*       headers = static_cast<std::map<std::string, std::string>*>(userp);
  std::string line(data, size * nitems);

  // A new status line starts a new header block (redirects, 100-continue).
  if (line.rfind("HTTP/", 0) == 0) {
    headers->clear();
    return size * nitems;
  }

  auto colon = line.find(':');
  if (colon == std::string::npos) return size * nitems;

  std::string name = line.substr(0, colon);
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });

  std::string value = line.substr(colon + 1);
  auto        first = value.find_first_not_of(" \t");
  auto        last  = value.find_last_not_of(" \t\r\n");
  value             = first == std::string::npos ? std::string() : value.substr(first, last - first + 1);

  (*headers)[name] = value;
  return size * nitems;
}

std::string BuildUrl(CURL* curl, const HttpRequest& request) {
  if (request.query_params.empty()) return request.url;

  std::string url       = request.url;
  char        separator = url.find('?') == std::string::npos ? '?' : '&';

  for (const auto& [key, value] : request.query_params) {
    std::unique_ptr<char, decltype(&curl_free)> k(curl_easy_escape(curl, key.c_str(), static_cast<int>(key.size())), &curl_free);
    std::unique_ptr<char, decltype(&curl_free)> v(curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size())),
                                                  &curl_free);
    if (!k || !v) throw util::TransportError("failed to encode query parameter " + key);

    url += separator;
    url += k.get();
    url += '=';
    url += v.get();
    separator = '&';
  }
  return url;
}

} // namespace

CurlHttpTransport::CurlHttpTransport(std::string user_agent) : user_agent_(std::move(user_agent)) {
  EnsureCurlGlobalInit();
}

HttpResponse CurlHttpTransport::Get(const HttpRequest& request) {
  CurlHandle curl(curl_easy_init());
  if (!curl) {
    throw util::TransportError("curl_easy_init failed");
  }

  const std::string url = BuildUrl(curl.get(), request);

  CurlList header_list;
  for (const auto& [name, value] : request.headers) {
    const std::string line = name + ": " + value;
    curl_slist*       next = curl_slist_append(header_list.get(), line.c_str());
    if (!next) throw util::TransportError("failed to build request headers");
    header_list.release();
    header_list.reset(next);
  }

  HttpResponse response;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, WriteHeader);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
  if (!user_agent_.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
  }

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw util::TransportError(std::string("GET ") + request.url + " failed: " + curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

} // namespace eventcache::client
