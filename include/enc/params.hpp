#pragma once
#include <cstdint>
#include <cstddef>

namespace enc {
inline constexpr size_t   BLOCK_SIZE      = 16;        // AES block
inline constexpr size_t   KEY_SIZE        = 16;        // AES-128
inline constexpr size_t   NONCE_SIZE      = 8;         // CTR prefix
inline constexpr size_t   MATERIAL_SIZE   = KEY_SIZE + NONCE_SIZE;  // key | nonce
inline constexpr size_t   MAC_SIZE        = 16;        // chunk digest / accumulator
inline constexpr size_t   META_MAC_SIZE   = 8;
inline constexpr size_t   FILE_KEY_SIZE   = 32;        // armored file key
inline constexpr size_t   FOLDER_KEY_SIZE = 16;
inline constexpr char     ATTR_MAGIC[4]   = {'M','E','G','A'};
inline constexpr size_t   ATTR_MAGIC_LEN  = sizeof(ATTR_MAGIC);
} // namespace enc
