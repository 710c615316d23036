#include <cstdio>
#include <utility>
#include <openssl/rand.h>

#include "net/api.hpp"
#include "vaultup/errors.hpp"

namespace net {

using namespace vaultup;
using nlohmann::json;

ApiClient::ApiClient(Http& http, std::string gateway, std::string sid,
                     up::RetryPolicy policy, bool verbose)
  : http_(http), gateway_(std::move(gateway)), sid_(std::move(sid)),
    policy_(policy), verbose_(verbose), seq_(0) {
  uint32_t r = 0;
  if (RAND_bytes(reinterpret_cast<unsigned char*>(&r), sizeof(r)) == 1) seq_ = r % 1000000000u;
  if (!gateway_.empty() && gateway_.back() != '/') gateway_.push_back('/');
}

std::string ApiClient::next_url(){
  std::string url = gateway_ + "cs?id=" + std::to_string(seq_++);
  if (!sid_.empty()) url += "&sid=" + sid_;
  return url;
}

// 0 with `result` set, E_API with `code` set, or a transport error
int ApiClient::call_once(const std::string& body, json& result, long& code){
  HttpResponse resp;
  int rc = http_.post(next_url(), "application/json",
                      reinterpret_cast<const uint8_t*>(body.data()), body.size(), resp);
  if (rc != 0) return rc;
  if (resp.status >= 500 || resp.status == 0) return E_TRANSIENT;
  if (resp.status != 200){
    std::fprintf(stderr, "[API] HTTP %ld\n", resp.status);
    return E_API;
  }

  json j = json::parse(resp.body, nullptr, false);
  if (j.is_discarded()){
    std::fprintf(stderr, "[API] unparseable response (%zu bytes)\n", resp.body.size());
    return E_API;
  }

  // A bare number is a request-level error
  if (j.is_number_integer()){
    code = j.get<long>();
    return code < 0 ? E_API : 0;
  }
  if (!j.is_array() || j.empty()){
    std::fprintf(stderr, "[API] unexpected response shape\n");
    return E_API;
  }

  result = j[0];
  if (result.is_number_integer() && result.get<long>() < 0){
    code = result.get<long>();
    return E_API;
  }
  return 0;
}

int ApiClient::call(const json& cmd, json& result){
  if (!cmd.is_object() || !cmd.contains("a") || !cmd["a"].is_string()) return E_ARGS;
  const std::string body = json::array({cmd}).dump(-1, ' ', false, json::error_handler_t::replace);
  const std::string name = cmd["a"].get<std::string>();

  int rc = E_TRANSIENT;
  for (int i = 0; i <= policy_.retries; i++){
    long code = 0;
    rc = call_once(body, result, code);
    if (rc == 0){
      last_code_ = 0;
      return 0;
    }

    bool again = (rc == E_TRANSIENT) || (rc == E_API && service_code_transient(code));
    if (rc == E_API && code < 0){
      last_code_ = code;
      std::fprintf(stderr, "[API] '%s' failed: %s (%ld)\n", name.c_str(), service_strerror(code), code);
    }
    if (!again || i == policy_.retries) break;

    auto d = up::backoff_delay(policy_, i);
    if (verbose_)
      std::fprintf(stderr, "[API] '%s' retry %d/%d in %lld ms\n",
                   name.c_str(), i + 1, policy_.retries, (long long)d.count());
    up::sleep_cancellable(d, nullptr);
  }
  return rc;
}

int ApiClient::request_target(const char* cmd, uint64_t size, std::string& url){
  json res;
  int rc = call({{"a", cmd}, {"s", size}}, res);
  if (rc != 0) return rc;
  if (!res.is_object() || !res.contains("p") || !res["p"].is_string()){
    std::fprintf(stderr, "[API] '%s' answer carries no target\n", cmd);
    return E_API;
  }
  url = res["p"].get<std::string>();
  return 0;
}

int ApiClient::request_upload_target(uint64_t size, std::string& url){
  return request_target("u", size, url);
}

int ApiClient::request_attr_target(uint64_t size, std::string& url){
  return request_target("ufa", size, url);
}

int ApiClient::create_node(const std::string& parent, const json& node, std::string& handle){
  json res;
  int rc = call({{"a", "p"}, {"t", parent}, {"n", json::array({node})}}, res);
  if (rc != 0) return rc;

  if (!res.is_object() || !res.contains("f") || !res["f"].is_array() || res["f"].empty()){
    std::fprintf(stderr, "[API] 'p' answer carries no node\n");
    return E_API;
  }
  const json& f = res["f"][0];
  if (!f.contains("h") || !f["h"].is_string()) return E_API;
  handle = f["h"].get<std::string>();
  return 0;
}

int ApiClient::put_file_attr(const std::string& handle, const std::string& fa){
  json res;
  return call({{"a", "pfa"}, {"n", handle}, {"fa", fa}}, res);
}

}
