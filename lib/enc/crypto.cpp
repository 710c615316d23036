#include <algorithm>
#include <cstring>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>

#include "enc/crypto.hpp"
#include "vaultup/errors.hpp"

namespace enc {

using namespace vaultup;

static int aes_block_op(const EVP_CIPHER* cipher, bool encrypt,
                        const uint8_t key[KEY_SIZE], const uint8_t* iv,
                        const uint8_t* in, size_t len, uint8_t* out){
  if (len % BLOCK_SIZE != 0) return E_ARGS;
  if (len == 0) return 0;

  int rc = E_CRYPTO, outl = 0, tmplen = 0;
  EVP_CIPHER_CTX* c = EVP_CIPHER_CTX_new();
  if (!c) return E_CRYPTO;
  do {
    if (EVP_CipherInit_ex(c, cipher, nullptr, key, iv, encrypt ? 1 : 0) != 1) break;
    if (EVP_CIPHER_CTX_set_padding(c, 0) != 1) break;     // caller pads
    if (EVP_CipherUpdate(c, out, &outl, in, static_cast<int>(len)) != 1) break;
    if (EVP_CipherFinal_ex(c, out + outl, &tmplen) != 1) break;
    if (static_cast<size_t>(outl + tmplen) != len) break;
    rc = 0;
  } while(0);
  EVP_CIPHER_CTX_free(c);
  return rc;
}

int aes_ecb_encrypt(const uint8_t key[KEY_SIZE], const uint8_t* in, size_t len, uint8_t* out){
  return aes_block_op(EVP_aes_128_ecb(), true, key, nullptr, in, len, out);
}

int aes_ecb_decrypt(const uint8_t key[KEY_SIZE], const uint8_t* in, size_t len, uint8_t* out){
  return aes_block_op(EVP_aes_128_ecb(), false, key, nullptr, in, len, out);
}

int aes_cbc_encrypt(const uint8_t key[KEY_SIZE], const uint8_t* in, size_t len, uint8_t* out){
  static const uint8_t zero_iv[BLOCK_SIZE] = {};
  return aes_block_op(EVP_aes_128_cbc(), true, key, zero_iv, in, len, out);
}

int aes_cbc_decrypt(const uint8_t key[KEY_SIZE], const uint8_t* in, size_t len, uint8_t* out){
  static const uint8_t zero_iv[BLOCK_SIZE] = {};
  return aes_block_op(EVP_aes_128_cbc(), false, key, zero_iv, in, len, out);
}

int cbc_mac(const uint8_t key[KEY_SIZE], const uint8_t iv[MAC_SIZE],
            const uint8_t* in, size_t len, uint8_t out[MAC_SIZE]){
  std::memcpy(out, iv, MAC_SIZE);
  if (len == 0) return 0;

  // CBC keeps its chaining state across updates, so the input is fed in
  // slices and only the last output block is kept.
  static constexpr size_t SLICE = 4096;
  uint8_t scratch[SLICE];
  const size_t full = len - (len % BLOCK_SIZE);

  int rc = E_CRYPTO, outl = 0;
  EVP_CIPHER_CTX* c = EVP_CIPHER_CTX_new();
  if (!c) return E_CRYPTO;
  do {
    if (EVP_EncryptInit_ex(c, EVP_aes_128_cbc(), nullptr, key, iv) != 1) break;
    if (EVP_CIPHER_CTX_set_padding(c, 0) != 1) break;

    size_t off = 0;
    bool ok = true;
    while (off < full){
      size_t n = std::min(SLICE, full - off);
      if (EVP_EncryptUpdate(c, scratch, &outl, in + off, static_cast<int>(n)) != 1){ ok = false; break; }
      std::memcpy(out, scratch + n - BLOCK_SIZE, MAC_SIZE);
      off += n;
    }
    if (!ok) break;

    if (full < len){
      uint8_t last[BLOCK_SIZE] = {};
      std::memcpy(last, in + full, len - full);
      if (EVP_EncryptUpdate(c, scratch, &outl, last, BLOCK_SIZE) != 1) break;
      std::memcpy(out, scratch, MAC_SIZE);
    }
    rc = 0;
  } while(0);
  EVP_CIPHER_CTX_free(c);
  OPENSSL_cleanse(scratch, sizeof(scratch));
  return rc;
}

int fill_rand(uint8_t* p, size_t n){
  return (RAND_bytes(p, static_cast<int>(n)) == 1) ? 0 : E_CRYPTO;
}

}
