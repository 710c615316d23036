#include <cstdio>
#include <cstring>
#include <openssl/crypto.h>

#include "enc/attr.hpp"
#include "enc/crypto.hpp"
#include "util.hpp"
#include "vaultup/errors.hpp"

namespace enc {

using namespace vaultup;
using nlohmann::json;

json attributes_to_json(const FileAttributes& a){
  json j = json::object();
  for (auto it = a.extra.begin(); it != a.extra.end(); ++it) j[it.key()] = it.value();

  j["n"] = a.name;
  if (a.mtime) j["t"] = *a.mtime;
  if (a.label > 0) j["lbl"] = a.label;
  if (a.fav) j["fav"] = 1;
  if (a.custom.is_object() && !a.custom.empty()) j["e"] = a.custom;
  return j;
}

int attributes_from_json(const json& j, FileAttributes& out){
  if (!j.is_object()) return E_ATTR_DECODE;

  out = FileAttributes{};
  for (auto it = j.begin(); it != j.end(); ++it){
    const std::string& k = it.key();
    const json& v = it.value();
    if (k == "n"){
      if (v.is_string()) out.name = v.get<std::string>();
    } else if (k == "t"){
      if (v.is_number_integer()) out.mtime = v.get<int64_t>();
    } else if (k == "lbl"){
      if (v.is_number_integer()) out.label = v.get<int>();
    } else if (k == "fav"){
      out.fav = v.is_number() ? v.get<int>() != 0 : v.is_boolean() && v.get<bool>();
    } else if (k == "e"){
      if (v.is_object()) out.custom = v;
    } else {
      out.extra[k] = v;
    }
  }
  return 0;
}

int seal_attr_blob(const json& j, const uint8_t key[KEY_SIZE], std::vector<uint8_t>& out){
  // names from disk need not be UTF-8
  std::string text = j.dump(-1, ' ', false, json::error_handler_t::replace);

  size_t used = ATTR_MAGIC_LEN + text.size();
  size_t padded = (used / BLOCK_SIZE + 1) * BLOCK_SIZE;

  out.assign(padded, 0);
  std::memcpy(out.data(), ATTR_MAGIC, ATTR_MAGIC_LEN);
  std::memcpy(out.data() + ATTR_MAGIC_LEN, text.data(), text.size());

  int rc = aes_cbc_encrypt(key, out.data(), out.size(), out.data());
  if (rc != 0) out.clear();
  return rc;
}

int open_attr_blob(const uint8_t* blob, size_t n, const uint8_t key[KEY_SIZE], json& out){
  if (!blob || n == 0 || n % BLOCK_SIZE != 0) return E_ATTR_DECODE;

  std::vector<uint8_t> plain(n);
  int rc = aes_cbc_decrypt(key, blob, n, plain.data());
  if (rc != 0) return rc;

  if (std::memcmp(plain.data(), ATTR_MAGIC, ATTR_MAGIC_LEN) != 0){
    OPENSSL_cleanse(plain.data(), plain.size());
    return E_ATTR_DECODE;
  }

  size_t end = plain.size();
  while (end > ATTR_MAGIC_LEN && plain[end - 1] == 0) end--;

  std::string text(reinterpret_cast<const char*>(plain.data()) + ATTR_MAGIC_LEN, end - ATTR_MAGIC_LEN);
  OPENSSL_cleanse(plain.data(), plain.size());

  out = json::parse(text, nullptr, false);
  if (out.is_discarded()) return E_ATTR_DECODE;
  return 0;
}

int encode_attributes(const FileAttributes& a, const uint8_t key[KEY_SIZE], std::string& b64){
  if (a.label < 0 || a.label > 7) return E_ARGS;

  std::vector<uint8_t> blob;
  int rc = seal_attr_blob(attributes_to_json(a), key, blob);
  if (rc != 0) return rc;
  b64 = util::b64url_encode(blob.data(), blob.size());
  return 0;
}

int decode_attributes(const std::string& b64, const uint8_t key[KEY_SIZE], FileAttributes& out){
  std::vector<uint8_t> blob;
  if (util::b64url_decode(b64, blob) != 0) return E_ATTR_DECODE;

  json j;
  int rc = open_attr_blob(blob.data(), blob.size(), key, j);
  if (rc != 0) return rc;
  return attributes_from_json(j, out);
}

}
