#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <sys/types.h>

namespace util {

std::string expand_args(const std::string& path);

std::string rstrip_slash(std::string p);

// Last path component
std::string base_name(const std::string& path);

// URL-safe base64 without padding
std::string b64url_encode(const uint8_t* p, size_t n);
int b64url_decode(const std::string& in, std::vector<uint8_t>& out);

// Exactly 2*n hex chars into n bytes; -1 on bad input
int hex_decode(const char* hex, uint8_t* out, size_t n);

namespace enc {

// Host to big-endian
uint64_t htobe_u64(uint64_t x);

}

namespace fs {

// Opens a regular file read-only; returns fd or -errno
int open_source(const char* path, uint64_t& size_out);

ssize_t full_pread(int fd, void* buf, size_t n, off_t offset);

}

}
