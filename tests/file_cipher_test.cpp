#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <thread>
#include <utility>
#include <vector>

#include "enc/crypto.hpp"
#include "enc/file_cipher.hpp"
#include "up/plan.hpp"
#include "util.hpp"
#include "vaultup/errors.hpp"
#include "fakes.hpp"

using namespace enc;

static const std::chrono::milliseconds WAIT{10000};

static FileKeyMaterial fixed_material(uint8_t seed){
  uint8_t raw[MATERIAL_SIZE];
  for (size_t i = 0; i < sizeof(raw); i++) raw[i] = static_cast<uint8_t>(seed + i * 7);
  FileKeyMaterial m;
  int rc = material_from_bytes(raw, sizeof(raw), m);
  assert(rc == 0);
  return m;
}

// Runs a whole buffer through an engine along the planned chunks
static FileKey encrypt_all(const FileKeyMaterial& m, const std::vector<uint8_t>& data,
                           std::vector<std::vector<uint8_t>>* cts = nullptr, size_t depth = 8){
  std::vector<up::ChunkBoundary> bounds;
  int rc = up::plan(data.size(), bounds);
  assert(rc == 0);

  EncryptionEngine eng(m, depth);
  assert(eng.init() == 0);
  for (size_t i = 0; i < bounds.size(); i++){
    std::vector<uint8_t> ct;
    rc = eng.encrypt(i, data.data() + bounds[i].start, bounds[i].size(), ct);
    assert(rc == 0);
    assert(ct.size() == bounds[i].size());
    if (cts) cts->push_back(ct);
  }
  FileKey fk{};
  rc = eng.finalize(WAIT, fk);
  assert(rc == 0);
  assert(eng.chunks() == bounds.size());
  return fk;
}

static void test_primitives(){
  const uint8_t key[16] = {1,2,3,4,5,6,7,8,9,10,11,12,13,14,15,16};

  // CBC-MAC with a zero IV is the last CBC ciphertext block
  auto data = fakes::pattern(64, 3);
  std::vector<uint8_t> cbc(64);
  assert(aes_cbc_encrypt(key, data.data(), data.size(), cbc.data()) == 0);
  uint8_t zero_iv[16] = {0};
  uint8_t mac[16];
  assert(cbc_mac(key, zero_iv, data.data(), data.size(), mac) == 0);
  assert(std::memcmp(mac, cbc.data() + 48, 16) == 0);

  // a partial tail is zero padded
  std::vector<uint8_t> padded(32, 0);
  std::memcpy(padded.data(), data.data(), 20);
  uint8_t mac_a[16], mac_b[16];
  assert(cbc_mac(key, zero_iv, data.data(), 20, mac_a) == 0);
  assert(cbc_mac(key, zero_iv, padded.data(), 32, mac_b) == 0);
  assert(std::memcmp(mac_a, mac_b, 16) == 0);

  // ECB and CBC refuse ragged input
  uint8_t out[17];
  assert(aes_ecb_encrypt(key, data.data(), 17, out) == vaultup::E_ARGS);
  assert(aes_cbc_decrypt(key, data.data(), 15, out) == vaultup::E_ARGS);

  // decrypt undoes encrypt
  std::vector<uint8_t> back(64);
  assert(aes_cbc_decrypt(key, cbc.data(), cbc.size(), back.data()) == 0);
  assert(back == data);
}

static void test_stream_cipher(){
  FileKeyMaterial m = fixed_material(9);

  // keystream block i is AES(key, nonce | be64(i))
  std::vector<uint8_t> zeros(48, 0), ks(48);
  StreamCipher sc;
  assert(sc.init(m) == 0);
  assert(sc.apply(zeros.data(), zeros.size(), ks.data()) == 0);
  assert(sc.block() == 3);

  for (uint64_t i = 0; i < 3; i++){
    uint8_t ctr[16];
    std::memcpy(ctr, m.nonce.data(), NONCE_SIZE);
    uint64_t be = util::enc::htobe_u64(i);
    std::memcpy(ctr + NONCE_SIZE, &be, 8);
    uint8_t blk[16];
    assert(aes_ecb_encrypt(m.key.data(), ctr, 16, blk) == 0);
    assert(std::memcmp(blk, ks.data() + i * 16, 16) == 0);
  }

  // split calls continue the same keystream
  auto data = fakes::pattern(4096 + 100, 5);
  std::vector<uint8_t> whole(data.size()), parts(data.size());
  StreamCipher a, b;
  assert(a.init(m) == 0 && b.init(m) == 0);
  assert(a.apply(data.data(), data.size(), whole.data()) == 0);
  assert(b.apply(data.data(), 4096, parts.data()) == 0);
  assert(b.apply(data.data() + 4096, 100, parts.data() + 4096) == 0);
  assert(whole == parts);
}

static void test_ordering(){
  FileKeyMaterial m = fixed_material(1);
  auto data = fakes::pattern(64);
  std::vector<uint8_t> ct;

  EncryptionEngine eng(m);
  assert(eng.encrypt(0, data.data(), 16, ct) == vaultup::E_STATE);
  assert(eng.init() == 0);
  assert(eng.encrypt(0, data.data(), 16, ct) == 0);
  assert(eng.encrypt(2, data.data(), 16, ct) == vaultup::E_ORDER);
  assert(eng.encrypt(0, data.data(), 16, ct) == vaultup::E_ORDER);
  assert(eng.encrypt(1, data.data(), 16, ct) == 0);

  FileKey fk{};
  assert(eng.finalize(WAIT, fk) == 0);
  assert(eng.encrypt(2, data.data(), 16, ct) == vaultup::E_STATE);
  assert(eng.finalize(WAIT, fk) == vaultup::E_STATE);
}

static void test_file_key(){
  FileKeyMaterial m = fixed_material(42);
  auto data = fakes::pattern(200 * 1024, 7);

  FileKey fk = encrypt_all(m, data);

  // w0..w3 ^ w4..w7 gives the cipher key, w4..w5 the nonce
  for (size_t i = 0; i < KEY_SIZE; i++) assert((fk[i] ^ fk[KEY_SIZE + i]) == m.key[i]);
  assert(std::memcmp(fk.data() + KEY_SIZE, m.nonce.data(), NONCE_SIZE) == 0);

  // same fold done by hand
  std::vector<up::ChunkBoundary> bounds;
  assert(up::plan(data.size(), bounds) == 0);
  Mac acc{};
  for (const auto& b : bounds){
    Mac d{};
    assert(chunk_digest(m, data.data() + b.start, b.size(), d) == 0);
    assert(fold_digest(m, acc, d) == 0);
  }
  MetaMac meta = condense_mac(acc);
  assert(std::memcmp(fk.data() + KEY_SIZE + NONCE_SIZE, meta.data(), META_MAC_SIZE) == 0);

  FileKeyMaterial m2;
  MetaMac meta2;
  split_file_key(fk, m2, meta2);
  assert(m2.key == m.key && m2.nonce == m.nonce && meta2 == meta);
}

static void test_determinism(){
  FileKeyMaterial m = fixed_material(77);
  const size_t sizes[] = {1, 16, 131072, 131072 + 3, 1500000};
  for (size_t n : sizes){
    auto data = fakes::pattern(n, static_cast<uint32_t>(n));
    FileKey a = encrypt_all(m, data);
    FileKey b = encrypt_all(m, data, nullptr, 1);
    assert(a == b);

    // one flipped bit in the first and last byte
    auto flipped = data;
    flipped[0] ^= 0x01;
    assert(encrypt_all(m, flipped) != a);
    flipped = data;
    flipped[n - 1] ^= 0x80;
    assert(encrypt_all(m, flipped) != a);
  }

  // different material, different key
  auto data = fakes::pattern(1000);
  assert(encrypt_all(fixed_material(1), data) != encrypt_all(fixed_material(2), data));
}

static void test_decryptor(){
  FileKeyMaterial m = fixed_material(11);
  auto data = fakes::pattern(900 * 1024, 13);
  std::vector<std::vector<uint8_t>> cts;
  FileKey fk = encrypt_all(m, data, &cts);

  std::vector<uint8_t> out;
  {
    FileDecryptor dec;
    assert(dec.init(fk) == 0);
    for (const auto& ct : cts){
      std::vector<uint8_t> pt;
      assert(dec.decrypt(ct.data(), ct.size(), pt) == 0);
      out.insert(out.end(), pt.begin(), pt.end());
    }
    assert(out == data);
    assert(dec.verify() == 0);
  }

  // tampered ciphertext
  {
    cts[1][17] ^= 0x04;
    FileDecryptor dec;
    assert(dec.init(fk) == 0);
    for (const auto& ct : cts){
      std::vector<uint8_t> pt;
      assert(dec.decrypt(ct.data(), ct.size(), pt) == 0);
    }
    assert(dec.verify() == vaultup::E_MAC_MISMATCH);
  }
}

static void test_mac_folder(){
  FileKeyMaterial m = fixed_material(5);

  MacFolder idle(m, 2);
  Mac out{};
  assert(idle.submit(0, {1, 2, 3}) == vaultup::E_STATE);
  assert(idle.finish(WAIT, out) == vaultup::E_STATE);

  // depth 1 forces the producer to wait on every chunk
  MacFolder f(m, 1);
  assert(f.start() == 0);
  Mac acc{};
  for (uint64_t i = 0; i < 50; i++){
    auto chunk = fakes::pattern(1000 + i, static_cast<uint32_t>(i));
    Mac d{};
    assert(chunk_digest(m, chunk.data(), chunk.size(), d) == 0);
    assert(fold_digest(m, acc, d) == 0);
    assert(f.submit(i, chunk) == 0);
  }
  assert(f.finish(WAIT, out) == 0);
  assert(out == acc);

  // cancelled folds report it
  MacFolder c(m, 4);
  assert(c.start() == 0);
  assert(c.submit(0, fakes::pattern(64)) == 0);
  c.cancel();
  assert(c.submit(1, fakes::pattern(64)) == vaultup::E_CANCELLED);
  assert(c.finish(WAIT, out) == vaultup::E_CANCELLED);

  // a fold error reaches later submits and finish() as itself
  MacFolder e(m, 2);
  assert(e.start() == 0);
  assert(e.submit(0, std::vector<uint8_t>()) == 0);
  int rc = 0;
  for (uint64_t i = 1; i < 1000 && rc == 0; i++){
    rc = e.submit(i, fakes::pattern(64));
    if (rc == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  assert(rc == vaultup::E_ARGS);
  assert(e.finish(WAIT, out) == vaultup::E_ARGS);
}

static void test_mac_timeout(){
  FileKeyMaterial m = fixed_material(9);
  const size_t big = 32 * 1024 * 1024;

  // the fold of 128 MiB cannot finish within a millisecond
  {
    MacFolder f(m, 4);
    assert(f.start() == 0);
    std::vector<std::vector<uint8_t>> chunks(4, std::vector<uint8_t>(big, 0x5a));
    for (uint64_t i = 0; i < chunks.size(); i++) assert(f.submit(i, std::move(chunks[i])) == 0);
    Mac out{};
    auto t0 = std::chrono::steady_clock::now();
    assert(f.finish(std::chrono::milliseconds(1), out) == vaultup::E_MAC_TIMEOUT);
    assert(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(2));
  }

  // same through the engine, which also pays for CTR and a copy per chunk
  {
    std::vector<uint8_t> pt(big / 2, 0xa5);
    EncryptionEngine eng(m, 8);
    assert(eng.init() == 0);
    std::vector<uint8_t> ct;
    for (uint64_t i = 0; i < 6; i++) assert(eng.encrypt(i, pt.data(), pt.size(), ct) == 0);
    FileKey fk{};
    assert(eng.finalize(std::chrono::milliseconds(1), fk) == vaultup::E_MAC_TIMEOUT);
  }

  // empty chunks never reach the MAC
  {
    EncryptionEngine eng(m);
    assert(eng.init() == 0);
    std::vector<uint8_t> ct;
    uint8_t b = 0;
    assert(eng.encrypt(0, &b, 0, ct) == vaultup::E_ARGS);
    assert(eng.encrypt(0, &b, 1, ct) == 0);
  }
}

int main(){
  test_primitives();
  test_stream_cipher();
  test_ordering();
  test_file_key();
  test_determinism();
  test_decryptor();
  test_mac_folder();
  test_mac_timeout();

  FileKeyMaterial g1, g2;
  assert(generate_material(g1) == 0 && generate_material(g2) == 0);
  assert(g1.key != g2.key);
  uint8_t short_raw[10] = {0};
  assert(material_from_bytes(short_raw, sizeof(short_raw), g1) == vaultup::E_ARGS);
  return 0;
}
