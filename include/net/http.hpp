#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace net {

struct HttpResponse {
  long status = 0;
  std::string body;
};

// Blocking POST. Returns 0 once an HTTP exchange completed (any status),
// E_TRANSIENT on connection/timeout failures and E_CANCELLED when `cancel`
// was raised while the request was in flight.
class Http {
public:
  virtual ~Http() = default;
  virtual int post(const std::string& url, const char* content_type,
                   const uint8_t* body, size_t len,
                   HttpResponse& resp,
                   const std::atomic<bool>* cancel = nullptr) = 0;
};

// libcurl easy handle per request, so one instance may be shared by the
// transfer workers. curl_global_init() is the caller's job.
class CurlHttp : public Http {
public:
  explicit CurlHttp(long timeout_s = 120, bool verbose = false)
    : timeout_s_(timeout_s), verbose_(verbose) {}

  int post(const std::string& url, const char* content_type,
           const uint8_t* body, size_t len,
           HttpResponse& resp,
           const std::atomic<bool>* cancel = nullptr) override;

private:
  long timeout_s_;
  bool verbose_;
};

}
