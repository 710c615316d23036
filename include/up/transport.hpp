#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "up/plan.hpp"

namespace net { class Http; }

namespace up {

// Moves one encrypted range to `<target>/<start>`. A non-empty response body
// is the upload token and ends up in `token`; otherwise `token` is cleared.
// Transient failures are handled inside; whatever comes back is final.
class ChunkTransport {
public:
  virtual ~ChunkTransport() = default;
  virtual int send(const std::string& target, const ChunkBoundary& b,
                   const std::vector<uint8_t>& ct, std::string& token,
                   const std::atomic<bool>* cancel) = 0;
};

struct RetryPolicy {
  int retries = 6;
  std::chrono::milliseconds backoff{250};
  std::chrono::milliseconds max_backoff{16000};
};

// Delay before retry `attempt` (0-based), doubled each time and capped
std::chrono::milliseconds backoff_delay(const RetryPolicy& p, int attempt);

// Sleeps in short slices; false if `cancel` was raised meanwhile
bool sleep_cancellable(std::chrono::milliseconds d, const std::atomic<bool>* cancel);

// True when `body` is only an optional '-' and digits, i.e. a service code
bool parse_service_code(const std::string& body, long& code);

class HttpChunkTransport : public ChunkTransport {
public:
  HttpChunkTransport(net::Http& http, RetryPolicy policy, bool verbose = false)
    : http_(http), policy_(policy), verbose_(verbose) {}

  int send(const std::string& target, const ChunkBoundary& b,
           const std::vector<uint8_t>& ct, std::string& token,
           const std::atomic<bool>* cancel) override;

private:
  int attempt(const std::string& url, const ChunkBoundary& b,
              const std::vector<uint8_t>& ct, std::string& token,
              const std::atomic<bool>* cancel);

  net::Http& http_;
  RetryPolicy policy_;
  bool verbose_;
};

}
