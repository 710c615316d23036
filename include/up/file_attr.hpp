#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "enc/params.hpp"
#include "net/http.hpp"
#include "up/remote.hpp"

namespace up {

enum FileAttrType { FA_THUMBNAIL = 0, FA_PREVIEW = 1 };

// Encrypts `image` (zero padded, CBC, zero IV) under the file's AES key,
// posts it to the target the service hands out for it and sets `ref` to
// "<type>*<handle>", ready to go into a node's "fa" list.
int upload_file_attribute(Remote& remote, net::Http& http,
                          const uint8_t key[enc::KEY_SIZE],
                          const std::vector<uint8_t>& image, int type,
                          std::string& ref);

// Joins non-empty refs with '/'
std::string join_file_attrs(const std::vector<std::string>& refs);

}
