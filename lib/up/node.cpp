#include <cstdio>
#include <vector>
#include <openssl/crypto.h>

#include "up/node.hpp"
#include "util.hpp"
#include "vaultup/errors.hpp"

namespace up {

using namespace vaultup;
using nlohmann::json;

int build_file_node(const enc::FileKey& fk, const enc::FileAttributes& attrs,
                    const uint8_t account_key[enc::KEY_SIZE],
                    const std::string& token, const std::string& fa,
                    const std::string& replace, json& node){
  if (token.empty()) return E_MISSING_TOKEN;

  enc::FileKeyMaterial m;
  enc::MetaMac meta;
  enc::split_file_key(fk, m, meta);

  std::string attr_b64;
  int rc = enc::encode_attributes(attrs, m.key.data(), attr_b64);
  enc::wipe_material(m);
  if (rc != 0) return rc;

  std::vector<uint8_t> blob;
  if ((rc = enc::armor_file_key(fk, account_key, blob)) != 0) return rc;

  node = json{
    {"h", token},
    {"t", NODE_FILE},
    {"a", attr_b64},
    {"k", util::b64url_encode(blob.data(), blob.size())},
  };
  if (!fa.empty()) node["fa"] = fa;
  if (!replace.empty()) node["ov"] = replace;
  return 0;
}

int build_folder_node(const enc::FolderKey& k, const enc::FileAttributes& attrs,
                      const uint8_t account_key[enc::KEY_SIZE], json& node){
  std::string attr_b64;
  int rc = enc::encode_attributes(attrs, k.data(), attr_b64);
  if (rc != 0) return rc;

  std::vector<uint8_t> blob;
  if ((rc = enc::armor_folder_key(k, account_key, blob)) != 0) return rc;

  node = json{
    {"h", "xxxxxxxx"},
    {"t", NODE_FOLDER},
    {"a", attr_b64},
    {"k", util::b64url_encode(blob.data(), blob.size())},
  };
  return 0;
}

int decode_node(const json& node, const uint8_t account_key[enc::KEY_SIZE], DecodedNode& out){
  if (!node.is_object() || !node.contains("k") || !node["k"].is_string()) return E_ARGS;
  if (node.contains("t") && !node["t"].is_number_integer()) return E_ARGS;
  if (node.contains("h") && !node["h"].is_string()) return E_ARGS;

  std::string k = node["k"].get<std::string>();
  size_t slash = k.find('/');
  if (slash != std::string::npos) k.resize(slash);
  size_t colon = k.find(':');
  if (colon != std::string::npos) k.erase(0, colon + 1);

  std::vector<uint8_t> blob;
  if (util::b64url_decode(k, blob) != 0) return E_KEY_FORMAT;

  int rc = enc::unarmor(blob.data(), blob.size(), account_key, out.key);
  if (rc != 0) return rc;

  out.type = node.contains("t") ? node["t"].get<int>() : static_cast<int>(NODE_FILE);
  if ((out.type == NODE_FILE) != out.key.is_file){
    enc::wipe_node_key(out.key);
    return E_KEY_FORMAT;
  }
  out.handle = node.contains("h") ? node["h"].get<std::string>() : std::string();

  if (node.contains("a") && node["a"].is_string()){
    if ((rc = enc::decode_attributes(node["a"].get<std::string>(), out.key.key.data(), out.attrs)) != 0)
      return rc;
  }
  return 0;
}

int create_folder(Remote& remote, const std::string& parent, const std::string& name,
                  const uint8_t account_key[enc::KEY_SIZE], std::string& handle){
  if (name.empty()) return E_ARGS;

  enc::FolderKey k;
  int rc = enc::generate_folder_key(k);
  if (rc != 0) return rc;

  enc::FileAttributes attrs;
  attrs.name = name;

  json node;
  rc = build_folder_node(k, attrs, account_key, node);
  OPENSSL_cleanse(k.data(), k.size());
  if (rc != 0) return rc;

  if ((rc = remote.create_node(parent, node, handle)) != 0){
    std::fprintf(stderr, "[UP] mkdir '%s' failed: %s\n", name.c_str(), vaultup::strerror(rc));
    return rc;
  }
  return 0;
}

std::string make_link(const std::string& handle, const enc::FileKey& fk){
  return "https://mega.nz/file/" + handle + "#" + util::b64url_encode(fk.data(), fk.size());
}

}
