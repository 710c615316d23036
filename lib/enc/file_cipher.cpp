#include <cstdio>
#include <cstring>
#include <openssl/evp.h>
#include <openssl/crypto.h>

#include "enc/file_cipher.hpp"
#include "enc/crypto.hpp"
#include "util.hpp"
#include "vaultup/errors.hpp"

namespace enc {

using namespace vaultup;

int generate_material(FileKeyMaterial& out){
  uint8_t raw[MATERIAL_SIZE];
  if (fill_rand(raw, sizeof(raw)) != 0) return E_CRYPTO;
  int rc = material_from_bytes(raw, sizeof(raw), out);
  OPENSSL_cleanse(raw, sizeof(raw));
  return rc;
}

int material_from_bytes(const uint8_t* p, size_t n, FileKeyMaterial& out){
  if (!p || n != MATERIAL_SIZE) return E_ARGS;
  std::memcpy(out.key.data(), p, KEY_SIZE);
  std::memcpy(out.nonce.data(), p + KEY_SIZE, NONCE_SIZE);
  return 0;
}

void wipe_material(FileKeyMaterial& m){
  OPENSSL_cleanse(m.key.data(), m.key.size());
  OPENSSL_cleanse(m.nonce.data(), m.nonce.size());
}

int chunk_digest(const FileKeyMaterial& m, const uint8_t* pt, size_t len, Mac& out){
  uint8_t iv[MAC_SIZE];
  std::memcpy(iv, m.nonce.data(), NONCE_SIZE);
  std::memcpy(iv + NONCE_SIZE, m.nonce.data(), NONCE_SIZE);
  return cbc_mac(m.key.data(), iv, pt, len, out.data());
}

int fold_digest(const FileKeyMaterial& m, Mac& acc, const Mac& digest){
  for (size_t i = 0; i < MAC_SIZE; i++) acc[i] ^= digest[i];
  return aes_ecb_encrypt(m.key.data(), acc.data(), MAC_SIZE, acc.data());
}

MetaMac condense_mac(const Mac& acc){
  MetaMac meta{};
  for (size_t i = 0; i < 4; i++){
    meta[i]     = acc[i] ^ acc[4 + i];
    meta[4 + i] = acc[8 + i] ^ acc[12 + i];
  }
  return meta;
}

FileKey assemble_file_key(const FileKeyMaterial& m, const MetaMac& meta){
  FileKey fk{};
  // second half first: nonce | meta
  std::memcpy(fk.data() + KEY_SIZE, m.nonce.data(), NONCE_SIZE);
  std::memcpy(fk.data() + KEY_SIZE + NONCE_SIZE, meta.data(), META_MAC_SIZE);
  for (size_t i = 0; i < KEY_SIZE; i++) fk[i] = m.key[i] ^ fk[KEY_SIZE + i];
  return fk;
}

void split_file_key(const FileKey& fk, FileKeyMaterial& m, MetaMac& meta){
  for (size_t i = 0; i < KEY_SIZE; i++) m.key[i] = fk[i] ^ fk[KEY_SIZE + i];
  std::memcpy(m.nonce.data(), fk.data() + KEY_SIZE, NONCE_SIZE);
  std::memcpy(meta.data(), fk.data() + KEY_SIZE + NONCE_SIZE, META_MAC_SIZE);
}

// ---------------------------------------------------------------------------
// StreamCipher

StreamCipher::~StreamCipher(){
  EVP_CIPHER_CTX_free(ctx_);
}

int StreamCipher::init(const FileKeyMaterial& m, uint64_t first_block){
  if (!ctx_) ctx_ = EVP_CIPHER_CTX_new();
  if (!ctx_) return E_CRYPTO;
  if (EVP_EncryptInit_ex(ctx_, EVP_aes_128_ctr(), nullptr, m.key.data(), nullptr) != 1) return E_CRYPTO;
  nonce_ = m.nonce;
  block_ = first_block;
  return 0;
}

int StreamCipher::apply(const uint8_t* in, size_t len, uint8_t* out){
  if (!ctx_) return E_STATE;
  if (len == 0) return 0;

  uint8_t iv[BLOCK_SIZE];
  std::memcpy(iv, nonce_.data(), NONCE_SIZE);
  uint64_t ctr_be = util::enc::htobe_u64(block_);
  std::memcpy(iv + NONCE_SIZE, &ctr_be, sizeof(ctr_be));

  int outl = 0;
  if (EVP_EncryptInit_ex(ctx_, nullptr, nullptr, nullptr, iv) != 1) return E_CRYPTO;
  if (EVP_EncryptUpdate(ctx_, out, &outl, in, static_cast<int>(len)) != 1) return E_CRYPTO;
  if (static_cast<size_t>(outl) != len) return E_CRYPTO;

  block_ += (len + BLOCK_SIZE - 1) / BLOCK_SIZE;
  return 0;
}

// ---------------------------------------------------------------------------
// MacFolder

MacFolder::MacFolder(const FileKeyMaterial& m, size_t depth)
  : material_(m), fifo_(depth) {}

MacFolder::~MacFolder(){
  fifo_.abort();
  if (worker_.joinable()) worker_.join();
  wipe_material(material_);
  OPENSSL_cleanse(result_.data(), result_.size());
}

int MacFolder::start(){
  if (worker_.joinable()) return E_STATE;
  worker_ = std::thread(&MacFolder::run, this);
  return 0;
}

void MacFolder::run(){
  Mac acc{};      // all zero
  int rc = 0;
  Item item;

  while (fifo_.pop(item)){
    // planned chunks are never empty
    if (item.data.empty()){
      rc = E_ARGS;
      break;
    }
    Mac digest{};
    if ((rc = chunk_digest(material_, item.data.data(), item.data.size(), digest)) != 0) break;
    if ((rc = fold_digest(material_, acc, digest)) != 0) break;
    OPENSSL_cleanse(item.data.data(), item.data.size());
    item.data.clear();
    item.data.shrink_to_fit();
  }
  if (rc == 0 && cancelled_.load()) rc = E_CANCELLED;
  if (rc != 0 && rc != E_CANCELLED){
    std::fprintf(stderr, "[MAC] fold failed at chunk %llu: %s\n",
                 (unsigned long long)item.index, vaultup::strerror(rc));
    fifo_.abort();
  }

  std::lock_guard<std::mutex> lk(done_mtx_);
  result_ = acc;
  rc_ = rc;
  done_ = true;
  done_cv_.notify_all();
  OPENSSL_cleanse(acc.data(), acc.size());
}

int MacFolder::submit(uint64_t index, std::vector<uint8_t> plaintext){
  if (!worker_.joinable()) return E_STATE;
  Item item;
  item.index = index;
  item.data = std::move(plaintext);
  if (!fifo_.push(std::move(item))){
    // a failing worker aborts the FIFO just before it publishes rc_
    std::unique_lock<std::mutex> lk(done_mtx_);
    if (!cancelled_.load())
      done_cv_.wait_for(lk, std::chrono::milliseconds(200), [&]{ return done_; });
    return (done_ && rc_ != 0) ? rc_ : E_CANCELLED;
  }
  return 0;
}

int MacFolder::finish(std::chrono::milliseconds timeout, Mac& out){
  if (!worker_.joinable()) return E_STATE;
  fifo_.close();

  std::unique_lock<std::mutex> lk(done_mtx_);
  if (!done_cv_.wait_for(lk, timeout, [&]{ return done_; })){
    std::fprintf(stderr, "[MAC] drain timed out after %lld ms, %zu chunks pending\n",
                 (long long)timeout.count(), fifo_.size());
    lk.unlock();
    cancel();
    return E_MAC_TIMEOUT;
  }
  if (rc_ != 0) return rc_;
  out = result_;
  return 0;
}

void MacFolder::cancel(){
  cancelled_.store(true);
  fifo_.abort();
}

// ---------------------------------------------------------------------------
// EncryptionEngine

EncryptionEngine::EncryptionEngine(const FileKeyMaterial& m, size_t mac_depth)
  : material_(m), folder_(m, mac_depth) {}

EncryptionEngine::~EncryptionEngine(){
  wipe_material(material_);
}

int EncryptionEngine::init(){
  if (ready_) return E_STATE;
  int rc = cipher_.init(material_);
  if (rc != 0) return rc;
  if ((rc = folder_.start()) != 0) return rc;
  ready_ = true;
  return 0;
}

int EncryptionEngine::encrypt(uint64_t index, const uint8_t* pt, size_t len, std::vector<uint8_t>& ct){
  if (!ready_ || finalized_) return E_STATE;
  if (len == 0 || !pt) return E_ARGS;
  if (index != next_){
    std::fprintf(stderr, "[ENC] chunk %llu out of order, expected %llu\n",
                 (unsigned long long)index, (unsigned long long)next_);
    return E_ORDER;
  }

  ct.resize(len);
  int rc = cipher_.apply(pt, len, ct.data());
  if (rc != 0) return rc;
  next_++;

  // The digest is folded on the MAC thread; this only waits when the FIFO is full
  return folder_.submit(index, std::vector<uint8_t>(pt, pt + len));
}

int EncryptionEngine::finalize(std::chrono::milliseconds timeout, FileKey& out){
  if (!ready_ || finalized_) return E_STATE;
  finalized_ = true;

  Mac acc{};
  int rc = folder_.finish(timeout, acc);
  if (rc != 0) return rc;

  MetaMac meta = condense_mac(acc);
  out = assemble_file_key(material_, meta);
  OPENSSL_cleanse(acc.data(), acc.size());
  return 0;
}

void EncryptionEngine::abort(){
  finalized_ = true;
  folder_.cancel();
}

// ---------------------------------------------------------------------------
// FileDecryptor

FileDecryptor::~FileDecryptor(){
  wipe_material(material_);
}

int FileDecryptor::init(const FileKey& fk){
  split_file_key(fk, material_, expected_);
  acc_.fill(0);
  return cipher_.init(material_);
}

int FileDecryptor::decrypt(const uint8_t* ct, size_t len, std::vector<uint8_t>& pt){
  pt.resize(len);
  int rc = cipher_.apply(ct, len, pt.data());
  if (rc != 0) return rc;

  Mac digest{};
  if ((rc = chunk_digest(material_, pt.data(), len, digest)) != 0) return rc;
  return fold_digest(material_, acc_, digest);
}

int FileDecryptor::verify() const {
  MetaMac got = condense_mac(acc_);
  return (CRYPTO_memcmp(got.data(), expected_.data(), META_MAC_SIZE) == 0) ? 0 : E_MAC_MISMATCH;
}

}
