#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace up {

// Random-access plaintext of a known length
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual uint64_t size() const = 0;
  // Fills exactly `n` bytes at `off`; E_SOURCE_READ on a short read
  virtual int read(uint64_t off, uint8_t* buf, size_t n) = 0;
};

class FileSource : public ByteSource {
public:
  FileSource() = default;
  ~FileSource() override;
  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  // 0, or E_SOURCE_READ when the path is missing or not a regular file
  int open(const std::string& path);
  uint64_t size() const override { return size_; }
  int read(uint64_t off, uint8_t* buf, size_t n) override;

private:
  int fd_ = -1;
  uint64_t size_ = 0;
};

class BufferSource : public ByteSource {
public:
  explicit BufferSource(std::vector<uint8_t> data) : data_(std::move(data)) {}
  uint64_t size() const override { return data_.size(); }
  int read(uint64_t off, uint8_t* buf, size_t n) override;

private:
  std::vector<uint8_t> data_;
};

}
