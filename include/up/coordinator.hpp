#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "enc/attr.hpp"
#include "enc/file_cipher.hpp"
#include "net/http.hpp"
#include "up/plan.hpp"
#include "up/remote.hpp"
#include "up/source.hpp"
#include "up/transport.hpp"

namespace up {

enum class UploadState { Planning, Transferring, Finalizing, Done, Failed };

const char* state_name(UploadState s);

struct UploadRequest {
  std::string parent;                 // target folder handle
  enc::FileAttributes attrs;          // name is required
  std::string fa;                     // opaque thumbnail/preview refs, sent with the node
  std::vector<uint8_t> thumbnail;     // image bytes, uploaded before the node, best effort
  std::vector<uint8_t> preview;
  std::string media_fa;               // attached after creation, best effort
  std::string replace;                // handle of the node this one versions
  std::optional<enc::FileKeyMaterial> material; // generated when empty
};

struct UploadResult {
  std::string handle;
  enc::FileKey key{};
  uint64_t chunks = 0;
  uint64_t bytes = 0;
  std::vector<std::string> warnings;  // non-fatal failures of auxiliary steps
};

struct Progress {
  uint64_t chunks_done = 0;
  uint64_t chunks_total = 0;
  uint64_t bytes_done = 0;
  uint64_t bytes_total = 0;
};

// Called from transfer threads, never concurrently with itself
using ProgressFn = std::function<void(const Progress&)>;

struct CoordinatorOptions {
  size_t concurrency = 20;
  size_t mac_depth = 8;
  std::chrono::milliseconds mac_timeout{120000};
  std::chrono::milliseconds transfer_timeout{3600000};
  bool verbose = false;
};

// One upload per instance: Planning -> Transferring -> Finalizing -> Done.
// Any fatal error moves to Failed and every later call returns E_STATE.
class UploadCoordinator {
public:
  UploadCoordinator(Remote& remote, ChunkTransport& transport,
                    const uint8_t account_key[enc::KEY_SIZE],
                    CoordinatorOptions opts = CoordinatorOptions());
  ~UploadCoordinator();
  UploadCoordinator(const UploadCoordinator&) = delete;
  UploadCoordinator& operator=(const UploadCoordinator&) = delete;

  void set_progress(ProgressFn fn) { progress_ = std::move(fn); }

  // Channel for thumbnail/preview bytes; without one they are skipped with a warning
  void set_attribute_http(net::Http* http) { attr_http_ = http; }

  int upload(ByteSource& src, const UploadRequest& req, UploadResult& out);

  // Opens `path` and uploads it
  int upload_file(const std::string& path, const UploadRequest& req, UploadResult& out);

  UploadState state() const { return state_.load(); }
  int error() const { return error_; }

private:
  int fail(int rc);
  int transfer(ByteSource& src, const std::vector<ChunkBoundary>& bounds,
               const std::string& target, enc::EncryptionEngine& engine,
               std::string& token);
  int finalize(const UploadRequest& req, const std::string& token,
               enc::EncryptionEngine& engine, UploadResult& out);
  std::string upload_attributes(const UploadRequest& req, const enc::FileKey& fk,
                                UploadResult& out);

  Remote& remote_;
  ChunkTransport& transport_;
  uint8_t account_key_[enc::KEY_SIZE];
  CoordinatorOptions opts_;
  ProgressFn progress_;
  net::Http* attr_http_ = nullptr;

  std::atomic<UploadState> state_{UploadState::Planning};
  int error_ = 0;
  bool started_ = false;
};

}
