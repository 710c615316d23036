#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "net/http.hpp"
#include "up/remote.hpp"
#include "up/transport.hpp"
#include "vaultup/errors.hpp"

namespace fakes {

// Scripted HTTP: `handler` decides the answer for every request
struct FakeHttp : net::Http {
  struct Call {
    std::string url;
    std::string content_type;
    std::vector<uint8_t> body;
  };

  std::function<int(const Call&, net::HttpResponse&)> handler;
  std::mutex mtx;
  std::vector<Call> calls;

  int post(const std::string& url, const char* content_type,
           const uint8_t* body, size_t len,
           net::HttpResponse& resp,
           const std::atomic<bool>* cancel = nullptr) override {
    if (cancel && cancel->load()) return vaultup::E_CANCELLED;
    Call c{url, content_type ? content_type : "", std::vector<uint8_t>(body, body + len)};
    {
      std::lock_guard<std::mutex> lk(mtx);
      calls.push_back(c);
    }
    resp = net::HttpResponse{};
    return handler ? handler(c, resp) : 0;
  }

  size_t count(){
    std::lock_guard<std::mutex> lk(mtx);
    return calls.size();
  }
};

inline net::HttpResponse ok(const std::string& body){
  net::HttpResponse r;
  r.status = 200;
  r.body = body;
  return r;
}

// In-memory service
struct FakeRemote : up::Remote {
  std::string target = "https://ul.example/u1";
  int target_rc = 0;
  int create_rc = 0;
  int pfa_rc = 0;

  std::string attr_target = "https://fa.example/f1";
  int attr_rc = 0;

  int target_calls = 0;
  int create_calls = 0;
  int pfa_calls = 0;
  int attr_calls = 0;
  uint64_t requested_size = 0;
  uint64_t attr_size = 0;
  std::string parent;
  nlohmann::json last_node;
  std::string last_fa;

  int request_upload_target(uint64_t size, std::string& url) override {
    target_calls++;
    requested_size = size;
    if (target_rc != 0) return target_rc;
    url = target;
    return 0;
  }

  int request_attr_target(uint64_t size, std::string& url) override {
    attr_calls++;
    attr_size = size;
    if (attr_rc != 0) return attr_rc;
    url = attr_target;
    return 0;
  }

  int create_node(const std::string& p, const nlohmann::json& node, std::string& handle) override {
    create_calls++;
    if (create_rc != 0) return create_rc;
    parent = p;
    last_node = node;
    handle = "H" + std::to_string(create_calls) + "xYz12";
    return 0;
  }

  int put_file_attr(const std::string&, const std::string& fa) override {
    pfa_calls++;
    last_fa = fa;
    return pfa_rc;
  }

  int calls() const { return target_calls + create_calls + pfa_calls + attr_calls; }
};

// Records every chunk; `behaviour` may override the default (token on the
// chunk that ends at `total`).
struct FakeTransport : up::ChunkTransport {
  uint64_t total = 0;
  std::string token = "TOKEN-abc";
  std::function<int(const up::ChunkBoundary&, std::string&, const std::atomic<bool>*)> behaviour;

  std::mutex mtx;
  std::map<uint64_t, std::vector<uint8_t>> received;  // start -> ciphertext
  std::atomic<int> sent{0};
  std::atomic<int> cancelled{0};

  int send(const std::string&, const up::ChunkBoundary& b,
           const std::vector<uint8_t>& ct, std::string& tok,
           const std::atomic<bool>* cancel) override {
    sent++;
    tok.clear();
    if (behaviour){
      int rc = behaviour(b, tok, cancel);
      if (rc == vaultup::E_CANCELLED) cancelled++;
      if (rc != 0) return rc;
    } else if (b.end == total) {
      tok = token;
    }
    std::lock_guard<std::mutex> lk(mtx);
    received[b.start] = ct;
    return 0;
  }

  size_t count(){
    std::lock_guard<std::mutex> lk(mtx);
    return received.size();
  }
};

// Waits until `cancel` is raised or `limit` passes
inline bool wait_for_cancel(const std::atomic<bool>* cancel, std::chrono::milliseconds limit){
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline){
    if (cancel && cancel->load()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return false;
}

// Polls `cond` until it holds or `limit` passes
template <typename Cond>
inline bool wait_until(Cond cond, std::chrono::milliseconds limit){
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline){
    if (cond()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return cond();
}

inline std::vector<uint8_t> pattern(size_t n, uint32_t seed = 1){
  std::vector<uint8_t> v(n);
  uint32_t x = seed * 2654435761u + 12345u;
  for (size_t i = 0; i < n; i++){
    x = x * 1103515245u + 12345u;
    v[i] = static_cast<uint8_t>(x >> 16);
  }
  return v;
}

}
