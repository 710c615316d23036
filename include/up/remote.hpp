#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace up {

// The service as seen by the upload pipeline
class Remote {
public:
  virtual ~Remote() = default;

  // Transfer target URL for `size` bytes of ciphertext
  virtual int request_upload_target(uint64_t size, std::string& url) = 0;

  // Creates one node under `parent`; `handle` receives its handle
  virtual int create_node(const std::string& parent, const nlohmann::json& node,
                          std::string& handle) = 0;

  // Target URL for an encrypted thumbnail or preview of `size` bytes
  virtual int request_attr_target(uint64_t size, std::string& url) = 0;

  // Attaches a media attribute to an existing node
  virtual int put_file_attr(const std::string& handle, const std::string& fa) = 0;
};

}
