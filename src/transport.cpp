#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/socket.h>
#include <sys/un.h>

#include "journalkv/transport.hpp"

namespace journalkv {

namespace {

bool fill_address(const std::string &path, sockaddr_un *addr, socklen_t *len) {
  memset(addr, 0, sizeof(*addr));
  addr->sun_family = AF_UNIX;
  if (path.empty() || path.size() >= sizeof(addr->sun_path)) {
    return false;
  }
  memcpy(addr->sun_path, path.data(), path.size());
  *len = offsetof(sockaddr_un, sun_path) + path.size() + 1;
  return true;
}

ssize_t sendmsg_retry(int fd, const msghdr *msg) {
  ssize_t rc;
  do {
    rc = sys::sendmsg(fd, msg, MSG_NOSIGNAL);
  } while (rc < 0 && errno == EINTR);
  return rc;
}

// EMSGSIZE is the kernel's answer for a datagram larger than the send buffer; some kernels
// report ENOBUFS for the same condition on very large payloads.
bool is_too_large(int err) { return err == EMSGSIZE || err == ENOBUFS; }

} // namespace

Transport::Transport(TransportOptions options) : options_(std::move(options)) {}

Error Transport::fail(int err) {
  last_errno_ = err;
  return Error::TRANSPORT_UNAVAILABLE;
}

Error Transport::ensure_socket() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_.valid()) {
    return Error::SUCCESS;
  }
  UniqueFd fd(sys::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0));
  if (!fd.valid()) {
    return fail(errno);
  }
  if (options_.send_buffer_size > 0) {
    int size = options_.send_buffer_size;
    // a smaller buffer than requested only means earlier fallback to the memfd path.
    if (setsockopt(fd.get(), SOL_SOCKET, SO_SNDBUF, &size, sizeof(size)) != 0) {
      fprintf(stderr, "could not set journal socket send buffer to %d: %s\n", size,
              strerror(errno));
    }
  }
  fd_ = std::move(fd);
  return Error::SUCCESS;
}

Error Transport::send_datagram(std::string_view payload, int *err) {
  sockaddr_un addr;
  socklen_t addr_len = 0;
  if (!fill_address(options_.socket_path, &addr, &addr_len)) {
    *err = ENAMETOOLONG;
    return Error::TRANSPORT_UNAVAILABLE;
  }
  iovec iov = {.iov_base = const_cast<char *>(payload.data()), .iov_len = payload.size()};
  msghdr msg = {};
  msg.msg_name = &addr;
  msg.msg_namelen = addr_len;
  msg.msg_iov = &iov;
  msg.msg_iovlen = 1;
  if (sendmsg_retry(fd_.get(), &msg) < 0) {
    *err = errno;
    return Error::TRANSPORT_UNAVAILABLE;
  }
  *err = 0;
  return Error::SUCCESS;
}

Error Transport::send_sealed(std::string_view payload) {
  UniqueFd memfd(sys::memfd_create("journal-entry", MFD_ALLOW_SEALING | MFD_CLOEXEC));
  if (!memfd.valid()) {
    return fail(errno);
  }
  size_t written = 0;
  while (written < payload.size()) {
    ssize_t n = sys::write(memfd.get(), payload.data() + written, payload.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return fail(errno);
    }
    written += static_cast<size_t>(n);
  }
  // sealed so the daemon can map the region without racing a writer.
  if (sys::add_seals(memfd.get(), F_SEAL_SHRINK | F_SEAL_GROW | F_SEAL_WRITE | F_SEAL_SEAL) !=
      0) {
    return fail(errno);
  }

  sockaddr_un addr;
  socklen_t addr_len = 0;
  if (!fill_address(options_.socket_path, &addr, &addr_len)) {
    return fail(ENAMETOOLONG);
  }
  alignas(struct cmsghdr) char cmsg_buf[CMSG_SPACE(sizeof(int))];
  memset(cmsg_buf, 0, sizeof(cmsg_buf));
  msghdr msg = {};
  msg.msg_name = &addr;
  msg.msg_namelen = addr_len;
  msg.msg_control = cmsg_buf;
  msg.msg_controllen = sizeof(cmsg_buf);

  struct cmsghdr *cmsg = CMSG_FIRSTHDR(&msg);
  cmsg->cmsg_level = SOL_SOCKET;
  cmsg->cmsg_type = SCM_RIGHTS;
  cmsg->cmsg_len = CMSG_LEN(sizeof(int));
  int fd = memfd.get();
  memcpy(CMSG_DATA(cmsg), &fd, sizeof(fd));

  if (sendmsg_retry(fd_.get(), &msg) < 0) {
    return fail(errno);
  }
  // the daemon holds its own reference now; ours is closed when memfd goes out of scope.
  return Error::SUCCESS;
}

Error Transport::submit(std::string_view payload, Delivery *delivery) {
  if (delivery != nullptr) {
    *delivery = DELIVERY_NONE;
  }
  Error err = ensure_socket();
  if (err != Error::SUCCESS) {
    return err;
  }
  int send_errno = 0;
  if (send_datagram(payload, &send_errno) == Error::SUCCESS) {
    if (delivery != nullptr) {
      *delivery = DELIVERY_DATAGRAM;
    }
    return Error::SUCCESS;
  }
  if (!is_too_large(send_errno)) {
    return fail(send_errno);
  }
  err = send_sealed(payload);
  if (err != Error::SUCCESS) {
    return err;
  }
  if (delivery != nullptr) {
    *delivery = DELIVERY_SEALED_MEMORY;
  }
  return Error::SUCCESS;
}

Error Transport::send(const Entry &entry, Delivery *delivery) {
  if (delivery != nullptr) {
    *delivery = DELIVERY_NONE;
  }
  std::string payload;
  Error err = encode_entry(entry, &payload);
  if (err != Error::SUCCESS) {
    return err;
  }
  return submit(payload, delivery);
}

namespace {

Transport &default_transport() {
  static Transport transport;
  return transport;
}

} // namespace

Error send(const Entry &entry) { return default_transport().send(entry); }

Error print(Priority priority, std::string_view message) {
  return default_transport().send(make_message_entry(priority, message));
}

} // namespace journalkv
