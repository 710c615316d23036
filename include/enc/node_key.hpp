#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "params.hpp"
#include "file_cipher.hpp"

namespace enc {

using FolderKey = std::array<uint8_t, FOLDER_KEY_SIZE>;

// Node key after unarmoring. For files `tail` holds nonce | MetaMac.
struct NodeKey {
  std::array<uint8_t, KEY_SIZE> key{};
  std::array<uint8_t, KEY_SIZE> tail{};
  bool is_file = false;
};

// Armored blobs are the merged key encrypted with AES-ECB under `outer`
int armor_file_key(const FileKey& fk, const uint8_t outer[KEY_SIZE], std::vector<uint8_t>& blob);
int armor_folder_key(const FolderKey& k, const uint8_t outer[KEY_SIZE], std::vector<uint8_t>& blob);
int armor_node_key(const NodeKey& nk, const uint8_t outer[KEY_SIZE], std::vector<uint8_t>& blob);

// 16 bytes -> folder key, 32 bytes -> file key (first half ^ second half),
// anything else is E_KEY_FORMAT
int unarmor(const uint8_t* blob, size_t n, const uint8_t outer[KEY_SIZE], NodeKey& out);

// Rebuilds the 32-byte merged form of a file NodeKey
FileKey merge_file_key(const NodeKey& nk);

int generate_folder_key(FolderKey& out);

void wipe_node_key(NodeKey& nk);

}
