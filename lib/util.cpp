#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <string>
#include <vector>
#include <openssl/evp.h>

#include "util.hpp"

namespace util {

std::string expand_args(const std::string& path) {
  if (path.empty() || path[0] != '~') return path;

  if (path.size() == 1 || path[1] == '/') {
      const char* h = std::getenv("HOME");
      if (!h) {
          if (auto* pw = getpwuid(getuid())) h = pw->pw_dir;
      }
      return (h ? std::string(h) : std::string()) + path.substr(1);
  }

  size_t slash = path.find('/');
  std::string user = path.substr(1, (slash == std::string::npos ? std::string::npos : slash - 1));
  if (auto* pw = getpwnam(user.c_str())) {
      std::string home = pw->pw_dir;
      return home + (slash == std::string::npos ? "" : path.substr(slash));
  }
  return path;
}

std::string rstrip_slash(std::string p) {
  if (p.size() > 1 && p.back() == '/') p.pop_back();
  return p;
}

std::string base_name(const std::string& path){
  std::string p = rstrip_slash(path);
  size_t slash = p.find_last_of('/');
  return (slash == std::string::npos) ? p : p.substr(slash + 1);
}

// OpenSSL works on the standard alphabet with '=' padding; swap and pad around it
std::string b64url_encode(const uint8_t* p, size_t n){
  if (n == 0) return std::string();
  std::string out(4 * ((n + 2) / 3) + 1, '\0');
  int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), p, static_cast<int>(n));
  out.resize(len > 0 ? static_cast<size_t>(len) : 0);
  while (!out.empty() && out.back() == '=') out.pop_back();
  for (char& c : out){
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  return out;
}

int b64url_decode(const std::string& in, std::vector<uint8_t>& out){
  out.clear();
  std::string s = in;
  while (!s.empty() && s.back() == '=') s.pop_back();
  for (char& c : s){
    if (c == '-') c = '+';
    else if (c == '_') c = '/';
    else if (c == '=') return -1;
  }
  // a single dangling sextet cannot encode a byte
  if (s.size() % 4 == 1) return -1;
  if (s.empty()) return 0;

  const size_t bytes = s.size() * 3 / 4;
  // zero sextets fill the last quantum; the extra bytes are cut below
  while (s.size() % 4) s.push_back('A');

  out.resize(s.size() / 4 * 3);
  int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.data()),
                            static_cast<int>(s.size()));
  if (len < 0 || static_cast<size_t>(len) < bytes){
    out.clear();
    return -1;
  }
  out.resize(bytes);
  return 0;
}

int hex_decode(const char* hex, uint8_t* out, size_t n){
  if (!hex) return -1;
  size_t len = 0;
  while (hex[len]) len++;
  if (len != 2 * n) return -1;
  auto hex2n = [](char c)->int{
    if ('0'<=c && c<='9') return c-'0';
    if ('a'<=c && c<='f') return 10 + c-'a';
    if ('A'<=c && c<='F') return 10 + c-'A';
    return -1;
  };
  for (size_t i=0;i<n;i++){
    int hi = hex2n(hex[2*i]);
    int lo = hex2n(hex[2*i+1]);
    if (hi<0||lo<0) return -1;
    out[i] = (uint8_t)((hi<<4)|lo);
  }
  return 0;
}

}

namespace util::enc {

uint64_t htobe_u64(uint64_t x){
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
  return __builtin_bswap64(x);
#else
  return x;
#endif
}

}

namespace util::fs {

int open_source(const char* path, uint64_t& size_out){
  int fd = open(path, O_RDONLY | O_CLOEXEC);
  if (fd == -1) return -errno;

  struct stat st{};
  if (fstat(fd, &st) == -1){
    int se = errno;
    close(fd);
    return -se;
  }
  if (!S_ISREG(st.st_mode)){
    close(fd);
    return -EISDIR;
  }
  size_out = static_cast<uint64_t>(st.st_size);
  return fd;
}

ssize_t full_pread(int fd, void *buf, size_t n, off_t offset){
  uint8_t *p = static_cast<uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t r = pread(fd, p+done, n-done, offset + (off_t)done);
    if (r < 0){
      if (errno==EINTR) continue;
      return -1;
    }
    if (r == 0) break; // EOF
    done += (size_t)r;
  }
  return (ssize_t)done;
}

}
