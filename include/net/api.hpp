#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include "net/http.hpp"
#include "up/remote.hpp"
#include "up/transport.hpp"

namespace net {

// JSON command channel: POST [cmd] to <gateway>cs?id=<seq>[&sid=<sid>].
// Transient service codes and transport failures are retried per `policy`.
class ApiClient : public up::Remote {
public:
  ApiClient(Http& http, std::string gateway, std::string sid,
            up::RetryPolicy policy, bool verbose = false);

  // Single command; `result` is the command's slot in the response array
  int call(const nlohmann::json& cmd, nlohmann::json& result);

  // Last negative service code seen, 0 if none
  long last_service_code() const { return last_code_; }

  int request_upload_target(uint64_t size, std::string& url) override;
  int request_attr_target(uint64_t size, std::string& url) override;
  int create_node(const std::string& parent, const nlohmann::json& node,
                  std::string& handle) override;
  int put_file_attr(const std::string& handle, const std::string& fa) override;

private:
  int request_target(const char* cmd, uint64_t size, std::string& url);
  int call_once(const std::string& body, nlohmann::json& result, long& code);
  std::string next_url();

  Http& http_;
  std::string gateway_;
  std::string sid_;
  up::RetryPolicy policy_;
  bool verbose_;
  uint64_t seq_;
  long last_code_ = 0;
};

}
