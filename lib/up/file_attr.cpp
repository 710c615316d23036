#include <cstdio>
#include <cstring>

#include "enc/crypto.hpp"
#include "up/file_attr.hpp"
#include "up/transport.hpp"
#include "util.hpp"
#include "vaultup/errors.hpp"

namespace up {

using namespace vaultup;

int upload_file_attribute(Remote& remote, net::Http& http,
                          const uint8_t key[enc::KEY_SIZE],
                          const std::vector<uint8_t>& image, int type,
                          std::string& ref){
  if (image.empty() || (type != FA_THUMBNAIL && type != FA_PREVIEW)) return E_ARGS;

  std::vector<uint8_t> ct((image.size() + enc::BLOCK_SIZE - 1) / enc::BLOCK_SIZE * enc::BLOCK_SIZE, 0);
  std::memcpy(ct.data(), image.data(), image.size());
  int rc = enc::aes_cbc_encrypt(key, ct.data(), ct.size(), ct.data());
  if (rc != 0) return rc;

  std::string url;
  if ((rc = remote.request_attr_target(ct.size(), url)) != 0) return rc;

  net::HttpResponse resp;
  rc = http.post(url + "/" + std::to_string(type), "application/octet-stream",
                 ct.data(), ct.size(), resp);
  if (rc != 0) return rc;

  if (resp.status == 0 || resp.status >= 500) return E_TRANSIENT;
  long code = 0;
  if (resp.status != 200 || resp.body.empty() ||
      (parse_service_code(resp.body, code) && code < 0)){
    std::fprintf(stderr, "[FA] type %d refused: HTTP %ld, %zu byte answer\n",
                 type, resp.status, resp.body.size());
    return E_PERMANENT;
  }

  // the answer is the raw attribute handle
  ref = std::to_string(type) + "*" +
        util::b64url_encode(reinterpret_cast<const uint8_t*>(resp.body.data()), resp.body.size());
  return 0;
}

std::string join_file_attrs(const std::vector<std::string>& refs){
  std::string out;
  for (const auto& r : refs){
    if (r.empty()) continue;
    if (!out.empty()) out.push_back('/');
    out += r;
  }
  return out;
}

}
