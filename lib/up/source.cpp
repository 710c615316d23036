#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unistd.h>

#include "up/source.hpp"
#include "util.hpp"
#include "vaultup/errors.hpp"

namespace up {

FileSource::~FileSource(){
  if (fd_ >= 0) close(fd_);
}

int FileSource::open(const std::string& path){
  if (fd_ >= 0) return vaultup::E_STATE;

  uint64_t size = 0;
  int fd = util::fs::open_source(path.c_str(), size);
  if (fd < 0){
    std::fprintf(stderr, "[UP] cannot open '%s': %s\n", path.c_str(), std::strerror(-fd));
    return vaultup::E_SOURCE_READ;
  }
  fd_ = fd;
  size_ = size;
  return 0;
}

int FileSource::read(uint64_t off, uint8_t* buf, size_t n){
  if (fd_ < 0) return vaultup::E_STATE;
  ssize_t r = util::fs::full_pread(fd_, buf, n, static_cast<off_t>(off));
  if (r < 0){
    std::fprintf(stderr, "[UP] read @%llu failed: %s\n", (unsigned long long)off, std::strerror(errno));
    return vaultup::E_SOURCE_READ;
  }
  if (static_cast<size_t>(r) != n){
    std::fprintf(stderr, "[UP] short read @%llu: %zd of %zu\n", (unsigned long long)off, r, n);
    return vaultup::E_SOURCE_READ;
  }
  return 0;
}

int BufferSource::read(uint64_t off, uint8_t* buf, size_t n){
  if (off > data_.size() || n > data_.size() - off) return vaultup::E_SOURCE_READ;
  if (n) std::memcpy(buf, data_.data() + off, n);
  return 0;
}

}
