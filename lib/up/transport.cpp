#include <cstdio>
#include <cstdlib>
#include <thread>

#include "up/transport.hpp"
#include "net/http.hpp"
#include "vaultup/errors.hpp"

namespace up {

using namespace vaultup;

std::chrono::milliseconds backoff_delay(const RetryPolicy& p, int attempt){
  auto d = p.backoff;
  for (int i = 0; i < attempt && d < p.max_backoff; i++) d *= 2;
  return d < p.max_backoff ? d : p.max_backoff;
}

bool sleep_cancellable(std::chrono::milliseconds d, const std::atomic<bool>* cancel){
  const auto slice = std::chrono::milliseconds(50);
  auto deadline = std::chrono::steady_clock::now() + d;
  while (std::chrono::steady_clock::now() < deadline){
    if (cancel && cancel->load()) return false;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    std::this_thread::sleep_for(left < slice ? left : slice);
  }
  return !(cancel && cancel->load());
}

bool parse_service_code(const std::string& body, long& code){
  if (body.empty() || body.size() > 12) return false;
  size_t i = (body[0] == '-') ? 1 : 0;
  if (i == body.size()) return false;
  for (size_t k = i; k < body.size(); k++)
    if (body[k] < '0' || body[k] > '9') return false;
  code = std::strtol(body.c_str(), nullptr, 10);
  return true;
}

int HttpChunkTransport::attempt(const std::string& url, const ChunkBoundary& b,
                                const std::vector<uint8_t>& ct, std::string& token,
                                const std::atomic<bool>* cancel){
  net::HttpResponse resp;
  int rc = http_.post(url, "application/octet-stream", ct.data(), ct.size(), resp, cancel);
  if (rc != 0) return rc;

  if (resp.status == 0 || resp.status >= 500 || resp.status == 408 || resp.status == 429) return E_TRANSIENT;
  if (resp.status != 200){
    std::fprintf(stderr, "[XFER] chunk @%llu rejected with HTTP %ld\n",
                 (unsigned long long)b.start, resp.status);
    return E_PERMANENT;
  }

  long code = 0;
  if (parse_service_code(resp.body, code) && code < 0){
    std::fprintf(stderr, "[XFER] chunk @%llu refused: %s (%ld)\n",
                 (unsigned long long)b.start, service_strerror(code), code);
    return E_PERMANENT;
  }

  token = resp.body;
  return 0;
}

int HttpChunkTransport::send(const std::string& target, const ChunkBoundary& b,
                             const std::vector<uint8_t>& ct, std::string& token,
                             const std::atomic<bool>* cancel){
  token.clear();
  if (ct.size() != b.size()) return E_ARGS;

  const std::string url = target + "/" + std::to_string(b.start);

  int rc = E_TRANSIENT;
  for (int i = 0; i <= policy_.retries; i++){
    if (cancel && cancel->load()) return E_CANCELLED;

    rc = attempt(url, b, ct, token, cancel);
    if (rc != E_TRANSIENT) return rc;
    if (i == policy_.retries) break;

    auto d = backoff_delay(policy_, i);
    if (verbose_)
      std::fprintf(stderr, "[XFER] chunk @%llu transient failure, retry %d/%d in %lld ms\n",
                   (unsigned long long)b.start, i + 1, policy_.retries, (long long)d.count());
    if (!sleep_cancellable(d, cancel)) return E_CANCELLED;
  }

  std::fprintf(stderr, "[XFER] chunk @%llu gave up after %d attempts\n",
               (unsigned long long)b.start, policy_.retries + 1);
  return rc;
}

}
