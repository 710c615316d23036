#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "params.hpp"

namespace enc {

// Node attributes as stored in the encrypted "a" field
struct FileAttributes {
  std::string name;                 // n
  std::optional<int64_t> mtime;     // t, unix seconds
  int label = 0;                    // lbl, 0..7
  bool fav = false;                 // fav
  nlohmann::json custom;            // e, object or null
  nlohmann::json extra = nlohmann::json::object(); // keys we don't model
};

nlohmann::json attributes_to_json(const FileAttributes& a);
int attributes_from_json(const nlohmann::json& j, FileAttributes& out);

// "MEGA" + compact JSON, NUL padded to the next block boundary (a whole block
// of NULs when already aligned), AES-CBC with zero IV.
int seal_attr_blob(const nlohmann::json& j, const uint8_t key[KEY_SIZE], std::vector<uint8_t>& out);
int open_attr_blob(const uint8_t* blob, size_t n, const uint8_t key[KEY_SIZE], nlohmann::json& out);

// Same as above, base64url on the outside
int encode_attributes(const FileAttributes& a, const uint8_t key[KEY_SIZE], std::string& b64);
int decode_attributes(const std::string& b64, const uint8_t key[KEY_SIZE], FileAttributes& out);

}
