#include <algorithm>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <thread>
#include <utility>
#include <openssl/crypto.h>

#include "up/coordinator.hpp"
#include "up/file_attr.hpp"
#include "up/node.hpp"
#include "util/bounded_queue.hpp"
#include "vaultup/errors.hpp"

namespace up {

using namespace vaultup;

const char* state_name(UploadState s){
  switch (s){
    case UploadState::Planning:     return "planning";
    case UploadState::Transferring: return "transferring";
    case UploadState::Finalizing:   return "finalizing";
    case UploadState::Done:         return "done";
    case UploadState::Failed:       return "failed";
  }
  return "?";
}

namespace {

struct TransferJob {
  uint64_t index = 0;
  ChunkBoundary bound;
  std::vector<uint8_t> ct;
};

// Fixed set of workers draining a bounded job queue. The first failure is
// kept, raises the cancel flag and drops whatever is still queued.
class TransferPool {
public:
  TransferPool(ChunkTransport& t, const std::string& target, size_t workers,
               const Progress& totals, const ProgressFn& progress, bool verbose)
    : transport_(t), target_(target), workers_(workers ? workers : 1),
      jobs_(workers_), prog_(totals), progress_(progress), verbose_(verbose) {}

  ~TransferPool(){
    abort();
    join();
  }

  void start(){
    running_ = workers_;
    for (size_t i = 0; i < workers_; i++) threads_.emplace_back(&TransferPool::run, this);
  }

  bool submit(TransferJob job){ return jobs_.push(std::move(job)); }

  // Barrier: no more jobs, wait for every worker to finish
  int wait(std::chrono::milliseconds timeout, std::string& token){
    jobs_.close();

    std::unique_lock<std::mutex> lk(mtx_);
    if (!idle_cv_.wait_for(lk, timeout, [&]{ return running_ == 0; })){
      std::fprintf(stderr, "[XFER] %zu transfers still running after %lld ms\n",
                   running_, (long long)timeout.count());
      lk.unlock();
      abort();
      join();
      return E_TIMEOUT;
    }
    lk.unlock();
    join();

    if (rc_ != 0) return rc_;
    token = token_;
    return 0;
  }

  void abort(){
    cancel_.store(true);
    jobs_.abort();
  }

  int error(){
    std::lock_guard<std::mutex> lk(mtx_);
    return rc_;
  }

private:
  void run(){
    TransferJob job;
    while (jobs_.pop(job)){
      std::string token;
      int rc = transport_.send(target_, job.bound, job.ct, token, &cancel_);
      uint64_t len = job.ct.size();
      job.ct.clear();
      job.ct.shrink_to_fit();

      if (rc != 0){
        failed(rc, job);
        break;
      }
      done(job, len, token);
    }

    std::lock_guard<std::mutex> lk(mtx_);
    running_--;
    idle_cv_.notify_all();
  }

  // progress_mtx_ keeps callbacks serial and in order; mtx_ is not held across them
  void done(const TransferJob& job, uint64_t len, const std::string& token){
    std::lock_guard<std::mutex> serial(progress_mtx_);
    Progress snap;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      record(job, len, token);
      snap = prog_;
    }
    if (progress_) progress_(snap);
  }

  void record(const TransferJob& job, uint64_t len, const std::string& token){
    if (!token.empty()){
      if (job.bound.end != prog_.bytes_total)
        std::fprintf(stderr, "[XFER] token on chunk %llu which is not the last one\n",
                     (unsigned long long)job.index);
      if (token_.empty() || job.bound.start >= token_start_){
        token_ = token;
        token_start_ = job.bound.start;
      }
    }
    prog_.chunks_done++;
    prog_.bytes_done += len;
    if (verbose_)
      std::fprintf(stderr, "[XFER] chunk %llu done (%llu/%llu)\n", (unsigned long long)job.index,
                   (unsigned long long)prog_.chunks_done, (unsigned long long)prog_.chunks_total);
  }

  void failed(int rc, const TransferJob& job){
    std::lock_guard<std::mutex> lk(mtx_);
    if (rc_ == 0){
      rc_ = rc;
      if (rc != E_CANCELLED)
        std::fprintf(stderr, "[XFER] chunk %llu @%llu failed: %s, cancelling upload\n",
                     (unsigned long long)job.index, (unsigned long long)job.bound.start,
                     vaultup::strerror(rc));
    }
    cancel_.store(true);
    jobs_.abort();
  }

  void join(){
    for (auto& t : threads_)
      if (t.joinable()) t.join();
  }

  ChunkTransport& transport_;
  const std::string target_;
  const size_t workers_;
  util::BoundedQueue<TransferJob> jobs_;
  std::vector<std::thread> threads_;
  std::atomic<bool> cancel_{false};

  std::mutex progress_mtx_;
  std::mutex mtx_;
  std::condition_variable idle_cv_;
  size_t running_ = 0;
  int rc_ = 0;
  std::string token_;
  uint64_t token_start_ = 0;
  Progress prog_;
  const ProgressFn& progress_;
  bool verbose_;
};

}

UploadCoordinator::UploadCoordinator(Remote& remote, ChunkTransport& transport,
                                     const uint8_t account_key[enc::KEY_SIZE],
                                     CoordinatorOptions opts)
  : remote_(remote), transport_(transport), opts_(opts) {
  std::memcpy(account_key_, account_key, enc::KEY_SIZE);
}

UploadCoordinator::~UploadCoordinator(){
  OPENSSL_cleanse(account_key_, sizeof(account_key_));
}

int UploadCoordinator::fail(int rc){
  error_ = rc;
  state_.store(UploadState::Failed);
  std::fprintf(stderr, "[UP] upload failed: %s\n", vaultup::strerror(rc));
  return rc;
}

int UploadCoordinator::upload_file(const std::string& path, const UploadRequest& req, UploadResult& out){
  if (started_ || state_.load() != UploadState::Planning) return E_STATE;
  FileSource src;
  int rc = src.open(path);
  if (rc != 0){
    started_ = true;
    return fail(rc);
  }
  return upload(src, req, out);
}

int UploadCoordinator::upload(ByteSource& src, const UploadRequest& req, UploadResult& out){
  if (started_ || state_.load() != UploadState::Planning) return E_STATE;
  started_ = true;

  // Planning
  const uint64_t size = src.size();
  if (size == 0) return fail(E_EMPTY_SOURCE);
  if (req.attrs.name.empty()) return fail(E_ARGS);

  std::vector<ChunkBoundary> bounds;
  int rc = plan(size, bounds);
  if (rc != 0) return fail(rc);
  if (opts_.verbose)
    std::fprintf(stderr, "[PLAN] %llu bytes in %zu chunks\n", (unsigned long long)size, bounds.size());

  std::string target;
  if ((rc = remote_.request_upload_target(size, target)) != 0) return fail(rc);

  enc::FileKeyMaterial m;
  if (req.material) m = *req.material;
  else if ((rc = enc::generate_material(m)) != 0) return fail(rc);

  enc::EncryptionEngine engine(m, opts_.mac_depth);
  enc::wipe_material(m);
  if ((rc = engine.init()) != 0) return fail(rc);

  // Transferring
  state_.store(UploadState::Transferring);
  std::string token;
  if ((rc = transfer(src, bounds, target, engine, token)) != 0){
    engine.abort();
    return fail(rc);
  }

  // Finalizing
  state_.store(UploadState::Finalizing);
  out.bytes = size;
  if ((rc = finalize(req, token, engine, out)) != 0) return fail(rc);

  state_.store(UploadState::Done);
  if (opts_.verbose) std::fprintf(stderr, "[UP] created %s\n", out.handle.c_str());
  return 0;
}

int UploadCoordinator::transfer(ByteSource& src, const std::vector<ChunkBoundary>& bounds,
                                const std::string& target, enc::EncryptionEngine& engine,
                                std::string& token){
  Progress totals;
  totals.chunks_total = bounds.size();
  totals.bytes_total = src.size();

  size_t workers = std::min(std::max<size_t>(opts_.concurrency, 1), bounds.size());
  TransferPool pool(transport_, target, workers, totals, progress_, opts_.verbose);
  pool.start();

  std::vector<uint8_t> plain;
  int rc = 0;
  for (size_t i = 0; i < bounds.size(); i++){
    const ChunkBoundary& b = bounds[i];
    plain.resize(b.size());
    if ((rc = src.read(b.start, plain.data(), plain.size())) != 0) break;

    TransferJob job;
    job.index = i;
    job.bound = b;
    if ((rc = engine.encrypt(i, plain.data(), plain.size(), job.ct)) != 0) break;

    if (!pool.submit(std::move(job))){
      rc = pool.error();
      if (rc == 0) rc = E_CANCELLED;
      break;
    }
  }
  OPENSSL_cleanse(plain.data(), plain.size());

  // A failed transfer wins over the E_CANCELLED the producer may have seen
  if (rc != 0){
    pool.abort();
    int prc = pool.error();
    return (prc != 0 && prc != E_CANCELLED) ? prc : rc;
  }
  return pool.wait(opts_.transfer_timeout, token);
}

int UploadCoordinator::finalize(const UploadRequest& req, const std::string& token,
                                enc::EncryptionEngine& engine, UploadResult& out){
  enc::FileKey fk{};
  int rc = engine.finalize(opts_.mac_timeout, fk);
  if (rc != 0) return rc;

  if (token.empty()){
    std::fprintf(stderr, "[UP] all chunks sent but no upload token came back\n");
    OPENSSL_cleanse(fk.data(), fk.size());
    return E_MISSING_TOKEN;
  }

  const std::string fa = upload_attributes(req, fk, out);

  nlohmann::json node;
  if ((rc = build_file_node(fk, req.attrs, account_key_, token, fa, req.replace, node)) != 0){
    OPENSSL_cleanse(fk.data(), fk.size());
    return rc;
  }

  std::string handle;
  if ((rc = remote_.create_node(req.parent, node, handle)) != 0){
    OPENSSL_cleanse(fk.data(), fk.size());
    return rc;
  }

  out.handle = handle;
  out.key = fk;
  out.chunks = engine.chunks();
  OPENSSL_cleanse(fk.data(), fk.size());

  if (!req.media_fa.empty()){
    rc = remote_.put_file_attr(handle, req.media_fa);
    if (rc != 0){
      std::string w = std::string("media attribute not attached: ") + vaultup::strerror(rc);
      std::fprintf(stderr, "[UP] %s\n", w.c_str());
      out.warnings.push_back(w);
    }
  }
  return 0;
}

// Thumbnail then preview; a failure only costs that reference
std::string UploadCoordinator::upload_attributes(const UploadRequest& req, const enc::FileKey& fk,
                                                 UploadResult& out){
  std::vector<std::string> refs{req.fa};
  if (req.thumbnail.empty() && req.preview.empty()) return req.fa;

  if (!attr_http_){
    std::string w = "thumbnail/preview skipped: no attribute channel";
    std::fprintf(stderr, "[UP] %s\n", w.c_str());
    out.warnings.push_back(w);
    return req.fa;
  }

  enc::FileKeyMaterial m;
  enc::MetaMac meta;
  enc::split_file_key(fk, m, meta);

  const std::pair<const std::vector<uint8_t>*, int> images[] = {
    {&req.thumbnail, FA_THUMBNAIL},
    {&req.preview, FA_PREVIEW},
  };
  for (const auto& img : images){
    if (img.first->empty()) continue;
    std::string ref;
    int rc = upload_file_attribute(remote_, *attr_http_, m.key.data(), *img.first, img.second, ref);
    if (rc != 0){
      std::string w = std::string(img.second == FA_THUMBNAIL ? "thumbnail" : "preview") +
                      " not uploaded: " + vaultup::strerror(rc);
      std::fprintf(stderr, "[UP] %s\n", w.c_str());
      out.warnings.push_back(w);
      continue;
    }
    if (opts_.verbose) std::fprintf(stderr, "[UP] file attribute %s\n", ref.c_str());
    refs.push_back(ref);
  }
  enc::wipe_material(m);
  return join_file_attrs(refs);
}

}
