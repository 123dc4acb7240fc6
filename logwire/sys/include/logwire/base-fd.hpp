#pragma once

namespace logwire {

// Owns a file descriptor and closes it on destruction.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  ~BaseFd() { reset(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Give up ownership without closing.
  [[nodiscard]] int release() noexcept;

  // Close the owned descriptor (if any) and take ownership of 'newFd'.
  void reset(int newFd = kClosedFd) noexcept;

  void close() noexcept { reset(); }

 private:
  int _fd;
};

}  // namespace logwire
