#pragma once
/*
 * Posix handles
 *
 * Purpose: move-only owners for a file descriptor and a read-only mapping.
 */
#include <cstddef>
#include <string_view>
#include <sys/mman.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { reset(other.fd_); other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }
private:
  int fd_;
};

class MappedFile {
public:
  MappedFile() = default;
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  ~MappedFile() { if (valid()) ::munmap(addr_, size_); }

  // Maps `size` bytes of fd read-only; false leaves the object empty.
  bool map(int fd, size_t size) {
    void* p = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (p == MAP_FAILED) return false;
    addr_ = p;
    size_ = size;
    (void)::madvise(addr_, size_, MADV_SEQUENTIAL);
    return true;
  }
  bool valid() const { return addr_ != nullptr; }
  std::string_view bytes() const { return {static_cast<const char*>(addr_), size_}; }
private:
  void* addr_ = nullptr;
  size_t size_ = 0;
};
