#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>
#include <openssl/types.h>

#include "params.hpp"
#include "util/bounded_queue.hpp"

namespace enc {

// Per-upload key material: AES key + CTR nonce (24 bytes total)
struct FileKeyMaterial {
  std::array<uint8_t, KEY_SIZE>   key{};
  std::array<uint8_t, NONCE_SIZE> nonce{};
};

using FileKey = std::array<uint8_t, FILE_KEY_SIZE>;
using Mac     = std::array<uint8_t, MAC_SIZE>;
using MetaMac = std::array<uint8_t, META_MAC_SIZE>;

int generate_material(FileKeyMaterial& out);

// `p` must hold exactly MATERIAL_SIZE bytes (key | nonce)
int material_from_bytes(const uint8_t* p, size_t n, FileKeyMaterial& out);

void wipe_material(FileKeyMaterial& m);

// CBC-MAC of one chunk's plaintext, IV = nonce | nonce. Independent of
// every other chunk.
int chunk_digest(const FileKeyMaterial& m, const uint8_t* pt, size_t len, Mac& out);

// acc := AES(key, acc ^ digest)
int fold_digest(const FileKeyMaterial& m, Mac& acc, const Mac& digest);

MetaMac condense_mac(const Mac& acc);

// w0..w3 = key ^ (nonce | meta), w4..w7 = nonce | meta
FileKey assemble_file_key(const FileKeyMaterial& m, const MetaMac& meta);

// Recover material and MetaMac from a 32-byte FileKey
void split_file_key(const FileKey& fk, FileKeyMaterial& m, MetaMac& meta);

// AES-128-CTR, counter = nonce | be64(block). Every call starts on a block
// boundary and advances the counter by ceil(len / 16).
class StreamCipher {
public:
  StreamCipher() = default;
  ~StreamCipher();
  StreamCipher(const StreamCipher&) = delete;
  StreamCipher& operator=(const StreamCipher&) = delete;

  int init(const FileKeyMaterial& m, uint64_t first_block = 0);
  int apply(const uint8_t* in, size_t len, uint8_t* out);
  uint64_t block() const { return block_; }

private:
  EVP_CIPHER_CTX* ctx_ = nullptr;
  std::array<uint8_t, NONCE_SIZE> nonce_{};
  uint64_t block_ = 0;
};

// Single consumer that folds chunk digests into the running accumulator in
// submission order. The accumulator never leaves the worker thread until it
// has drained; submit() blocks while the FIFO is full.
class MacFolder {
public:
  MacFolder(const FileKeyMaterial& m, size_t depth);
  ~MacFolder();
  MacFolder(const MacFolder&) = delete;
  MacFolder& operator=(const MacFolder&) = delete;

  int start();
  int submit(uint64_t index, std::vector<uint8_t> plaintext);
  int finish(std::chrono::milliseconds timeout, Mac& out);
  void cancel();

private:
  struct Item {
    uint64_t index = 0;
    std::vector<uint8_t> data;
  };

  void run();

  FileKeyMaterial material_;
  util::BoundedQueue<Item> fifo_;
  std::thread worker_;
  std::atomic<bool> cancelled_{false};

  std::mutex done_mtx_;
  std::condition_variable done_cv_;
  bool done_ = false;
  int rc_ = 0;
  Mac result_{};
};

// Cipher + authenticator behind one contract. encrypt() must be called with
// index 0, 1, 2, ... and never after finalize().
class EncryptionEngine {
public:
  EncryptionEngine(const FileKeyMaterial& m, size_t mac_depth = 8);
  ~EncryptionEngine();
  EncryptionEngine(const EncryptionEngine&) = delete;
  EncryptionEngine& operator=(const EncryptionEngine&) = delete;

  int init();
  int encrypt(uint64_t index, const uint8_t* pt, size_t len, std::vector<uint8_t>& ct);
  int finalize(std::chrono::milliseconds timeout, FileKey& out);
  void abort();

  const FileKeyMaterial& material() const { return material_; }
  uint64_t chunks() const { return next_; }

private:
  FileKeyMaterial material_;
  StreamCipher cipher_;
  MacFolder folder_;
  uint64_t next_ = 0;
  bool ready_ = false;
  bool finalized_ = false;
};

// Download side: sequential decrypt with MetaMac verification. Each decrypt()
// call must cover exactly one planned chunk.
class FileDecryptor {
public:
  FileDecryptor() = default;
  ~FileDecryptor();
  FileDecryptor(const FileDecryptor&) = delete;
  FileDecryptor& operator=(const FileDecryptor&) = delete;

  int init(const FileKey& fk);
  int decrypt(const uint8_t* ct, size_t len, std::vector<uint8_t>& pt);
  int verify() const;

private:
  FileKeyMaterial material_;
  MetaMac expected_{};
  Mac acc_{};
  StreamCipher cipher_;
};

}
