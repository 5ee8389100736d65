#ifndef JOURNALKV_UNIQUE_FD_HPP
#define JOURNALKV_UNIQUE_FD_HPP

#include "journalkv/sys.hpp"

namespace journalkv {

/**
 * @brief owns a file descriptor and closes it when it goes out of scope.
 */
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(UniqueFd &&other) : fd_(other.release()) {}
  UniqueFd &operator=(UniqueFd &&other) {
    reset(other.release());
    return *this;
  }
  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  void reset(int fd = -1) {
    if (fd_ >= 0) {
      sys::close(fd_);
    }
    fd_ = fd;
  }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  int release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

private:
  int fd_ = -1;
};

} // namespace journalkv

#endif
