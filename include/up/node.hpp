#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include "enc/attr.hpp"
#include "enc/file_cipher.hpp"
#include "enc/node_key.hpp"
#include "up/remote.hpp"

namespace up {

enum NodeType { NODE_FILE = 0, NODE_FOLDER = 1 };

// {"h":token,"t":0,"a":attrs,"k":key[,"fa":fa][,"ov":replace]}
// The key is ECB-encrypted under `account_key`, attrs under the file's real key.
int build_file_node(const enc::FileKey& fk, const enc::FileAttributes& attrs,
                    const uint8_t account_key[enc::KEY_SIZE],
                    const std::string& token, const std::string& fa,
                    const std::string& replace, nlohmann::json& node);

int build_folder_node(const enc::FolderKey& k, const enc::FileAttributes& attrs,
                      const uint8_t account_key[enc::KEY_SIZE], nlohmann::json& node);

struct DecodedNode {
  std::string handle;
  int type = NODE_FILE;
  enc::NodeKey key;
  enc::FileAttributes attrs;
};

// Accepts "k" either bare or as "<owner>:<key>[/<owner>:<key>...]"; the
// first entry is used.
int decode_node(const nlohmann::json& node, const uint8_t account_key[enc::KEY_SIZE], DecodedNode& out);

int create_folder(Remote& remote, const std::string& parent, const std::string& name,
                  const uint8_t account_key[enc::KEY_SIZE], std::string& handle);

// https://mega.nz/file/<handle>#<key>
std::string make_link(const std::string& handle, const enc::FileKey& fk);

}
