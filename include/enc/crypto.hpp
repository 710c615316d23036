#pragma once
#include <cstddef>
#include <cstdint>

#include "params.hpp"

namespace enc {

// AES-128 primitives over OpenSSL EVP. Lengths must be multiples of BLOCK_SIZE
// unless noted; buffers may alias. All return 0 or E_CRYPTO / E_ARGS.

int aes_ecb_encrypt(const uint8_t key[KEY_SIZE],
                    const uint8_t* in, size_t len, uint8_t* out);

int aes_ecb_decrypt(const uint8_t key[KEY_SIZE],
                    const uint8_t* in, size_t len, uint8_t* out);

// CBC with an all-zero IV
int aes_cbc_encrypt(const uint8_t key[KEY_SIZE],
                    const uint8_t* in, size_t len, uint8_t* out);

int aes_cbc_decrypt(const uint8_t key[KEY_SIZE],
                    const uint8_t* in, size_t len, uint8_t* out);

// CBC-MAC of `len` bytes (any length, tail zero-padded) starting from `iv`
int cbc_mac(const uint8_t key[KEY_SIZE],
            const uint8_t iv[MAC_SIZE],
            const uint8_t* in, size_t len,
            uint8_t out[MAC_SIZE]);

int fill_rand(uint8_t* p, size_t n);

}
