#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <catch2/catch.hpp>

#include "journalkv/transport.hpp"

#include "fake_sys.hpp"
#include "parse_payload.hpp"

using namespace journalkv;

// Plays the journal daemon: a datagram socket bound in a fresh temporary directory.
struct FakeDaemon {
  std::string dir;
  std::string path;
  int fd = -1;

  FakeDaemon() {
    char tmpl[] = "/tmp/journalkv-test-XXXXXX";
    REQUIRE(mkdtemp(tmpl) != nullptr);
    dir = tmpl;
    path = dir + "/socket";
    fd = socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    REQUIRE(fd >= 0);
    sockaddr_un addr = {};
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    REQUIRE(bind(fd, (sockaddr *)(&addr), sizeof(addr)) == 0);
    timeval timeout = {.tv_sec = 5, .tv_usec = 0};
    REQUIRE(setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) == 0);
  }

  ~FakeDaemon() {
    close(fd);
    unlink(path.c_str());
    rmdir(dir.c_str());
  }

  // receives one submission, reading the sealed memfd if one was attached.
  std::string receive(bool *sealed) {
    std::vector<char> buffer(1 << 20);
    iovec iov = {.iov_base = buffer.data(), .iov_len = buffer.size()};
    alignas(struct cmsghdr) char cmsg_buf[CMSG_SPACE(sizeof(int))];
    msghdr msg = {};
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    msg.msg_control = cmsg_buf;
    msg.msg_controllen = sizeof(cmsg_buf);
    ssize_t n = recvmsg(fd, &msg, MSG_CMSG_CLOEXEC);
    REQUIRE(n >= 0);
    cmsghdr *cmsg = CMSG_FIRSTHDR(&msg);
    *sealed = cmsg != nullptr;
    if (cmsg == nullptr) {
      return std::string(buffer.data(), n);
    }
    REQUIRE(n == 0);
    REQUIRE(cmsg->cmsg_level == SOL_SOCKET);
    REQUIRE(cmsg->cmsg_type == SCM_RIGHTS);
    int memfd = -1;
    memcpy(&memfd, CMSG_DATA(cmsg), sizeof(memfd));
    int seals = fcntl(memfd, F_GET_SEALS);
    CHECK((seals & F_SEAL_SHRINK) != 0);
    CHECK((seals & F_SEAL_GROW) != 0);
    CHECK((seals & F_SEAL_WRITE) != 0);
    CHECK((seals & F_SEAL_SEAL) != 0);
    struct stat st;
    REQUIRE(fstat(memfd, &st) == 0);
    std::string payload(st.st_size, '\0');
    REQUIRE(pread(memfd, payload.data(), payload.size(), 0) == (ssize_t)(payload.size()));
    close(memfd);
    return payload;
  }
};

Entry large_entry(size_t size) {
  std::string trace;
  while (trace.size() < size) {
    trace += "  at frame " + std::to_string(trace.size()) + "\n";
  }
  Entry entry;
  REQUIRE(entry.add("MESSAGE", "crashed") == Error::SUCCESS);
  REQUIRE(entry.add("STACK_TRACE", trace) == Error::SUCCESS);
  return entry;
}

void require_same_fields(const std::string &payload, const Entry &entry) {
  std::vector<Field> fields;
  REQUIRE(parse_payload(payload, &fields));
  REQUIRE(fields.size() == entry.size());
  for (size_t i = 0; i < fields.size(); ++i) {
    REQUIRE(fields[i].name == entry.fields()[i].name);
    REQUIRE(fields[i].value == entry.fields()[i].value);
  }
}

TEST_CASE("small entries go out as one datagram", "[transport]") {
  fake_sys::reset();
  FakeDaemon daemon;
  Transport transport(TransportOptions{.socket_path = daemon.path});
  Entry entry = make_message_entry(PRIORITY_INFO, "hello");
  Delivery delivery = DELIVERY_NONE;
  REQUIRE(transport.send(entry, &delivery) == Error::SUCCESS);
  REQUIRE(delivery == DELIVERY_DATAGRAM);
  REQUIRE(fake_sys::memfds_created.empty());
  bool sealed = true;
  std::string payload = daemon.receive(&sealed);
  REQUIRE_FALSE(sealed);
  REQUIRE(payload == "PRIORITY=6\nMESSAGE=hello\n");
}

TEST_CASE("oversized entries go out through a sealed memfd", "[transport]") {
  fake_sys::reset();
  FakeDaemon daemon;
  Transport transport(TransportOptions{.socket_path = daemon.path, .send_buffer_size = 4096});
  Entry entry = large_entry(256 * 1024);
  Delivery delivery = DELIVERY_NONE;
  REQUIRE(transport.send(entry, &delivery) == Error::SUCCESS);
  REQUIRE(delivery == DELIVERY_SEALED_MEMORY);
  bool sealed = false;
  std::string payload = daemon.receive(&sealed);
  REQUIRE(sealed);
  require_same_fields(payload, entry);
  REQUIRE(fake_sys::memfds_created.size() == 1);
  REQUIRE(fake_sys::was_closed(fake_sys::memfds_created[0]));
}

TEST_CASE("both paths deliver the same fields", "[transport]") {
  fake_sys::reset();
  FakeDaemon daemon;
  Entry entry = large_entry(64 * 1024);
  Transport roomy(TransportOptions{.socket_path = daemon.path, .send_buffer_size = 1 << 20});
  Transport cramped(TransportOptions{.socket_path = daemon.path, .send_buffer_size = 4096});
  Delivery delivery = DELIVERY_NONE;
  REQUIRE(roomy.send(entry, &delivery) == Error::SUCCESS);
  REQUIRE(delivery == DELIVERY_DATAGRAM);
  REQUIRE(cramped.send(entry, &delivery) == Error::SUCCESS);
  REQUIRE(delivery == DELIVERY_SEALED_MEMORY);
  bool sealed = false;
  std::string inline_payload = daemon.receive(&sealed);
  REQUIRE_FALSE(sealed);
  std::string sealed_payload = daemon.receive(&sealed);
  REQUIRE(sealed);
  REQUIRE(inline_payload == sealed_payload);
  require_same_fields(sealed_payload, entry);
}

TEST_CASE("a missing socket is unavailable", "[transport]") {
  fake_sys::reset();
  Transport transport(TransportOptions{.socket_path = "/nonexistent/journalkv/socket"});
  Delivery delivery = DELIVERY_DATAGRAM;
  REQUIRE(transport.send(make_message_entry(PRIORITY_INFO, "lost"), &delivery) ==
          Error::TRANSPORT_UNAVAILABLE);
  REQUIRE(delivery == DELIVERY_NONE);
  REQUIRE(transport.last_errno() == ENOENT);
  REQUIRE(fake_sys::memfds_created.empty());
}

TEST_CASE("a socket path too long for sockaddr_un is unavailable", "[transport]") {
  fake_sys::reset();
  Transport transport(TransportOptions{.socket_path = "/" + std::string(200, 'x')});
  REQUIRE(transport.submit("MESSAGE=x\n") == Error::TRANSPORT_UNAVAILABLE);
  REQUIRE(transport.last_errno() == ENAMETOOLONG);
}

TEST_CASE("other send failures are not retried", "[transport]") {
  fake_sys::reset();
  fake_sys::sendmsg_errors = {EACCES};
  FakeDaemon daemon;
  Transport transport(TransportOptions{.socket_path = daemon.path});
  REQUIRE(transport.submit("MESSAGE=x\n") == Error::TRANSPORT_UNAVAILABLE);
  REQUIRE(transport.last_errno() == EACCES);
  REQUIRE(fake_sys::memfds_created.empty());
  // the next submission is independent and succeeds.
  REQUIRE(transport.submit("MESSAGE=y\n") == Error::SUCCESS);
  bool sealed = false;
  REQUIRE(daemon.receive(&sealed) == "MESSAGE=y\n");
}

TEST_CASE("ENOBUFS also falls back to the memfd", "[transport]") {
  fake_sys::reset();
  fake_sys::sendmsg_errors = {ENOBUFS};
  FakeDaemon daemon;
  Transport transport(TransportOptions{.socket_path = daemon.path});
  Delivery delivery = DELIVERY_NONE;
  REQUIRE(transport.submit("MESSAGE=x\n", &delivery) == Error::SUCCESS);
  REQUIRE(delivery == DELIVERY_SEALED_MEMORY);
  bool sealed = false;
  REQUIRE(daemon.receive(&sealed) == "MESSAGE=x\n");
  REQUIRE(sealed);
}

TEST_CASE("the memfd is closed when the fallback send fails", "[transport]") {
  fake_sys::reset();
  fake_sys::sendmsg_errors = {EMSGSIZE, ECONNREFUSED};
  Transport transport(TransportOptions{.socket_path = "/nonexistent/journalkv/socket"});
  Delivery delivery = DELIVERY_DATAGRAM;
  REQUIRE(transport.submit("MESSAGE=x\n", &delivery) == Error::TRANSPORT_UNAVAILABLE);
  REQUIRE(delivery == DELIVERY_NONE);
  REQUIRE(transport.last_errno() == ECONNREFUSED);
  REQUIRE(fake_sys::memfds_created.size() == 1);
  REQUIRE(fake_sys::was_closed(fake_sys::memfds_created[0]));
}

TEST_CASE("the memfd is closed when writing it fails", "[transport]") {
  fake_sys::reset();
  fake_sys::sendmsg_errors = {EMSGSIZE};
  fake_sys::write_errors = {ENOSPC};
  Transport transport(TransportOptions{.socket_path = "/nonexistent/journalkv/socket"});
  REQUIRE(transport.submit("MESSAGE=x\n") == Error::TRANSPORT_UNAVAILABLE);
  REQUIRE(transport.last_errno() == ENOSPC);
  REQUIRE(fake_sys::memfds_created.size() == 1);
  REQUIRE(fake_sys::was_closed(fake_sys::memfds_created[0]));
}

TEST_CASE("the memfd is closed when sealing fails", "[transport]") {
  fake_sys::reset();
  fake_sys::sendmsg_errors = {EMSGSIZE};
  fake_sys::seal_errors = {EPERM};
  Transport transport(TransportOptions{.socket_path = "/nonexistent/journalkv/socket"});
  REQUIRE(transport.submit("MESSAGE=x\n") == Error::TRANSPORT_UNAVAILABLE);
  REQUIRE(transport.last_errno() == EPERM);
  REQUIRE(fake_sys::memfds_created.size() == 1);
  REQUIRE(fake_sys::was_closed(fake_sys::memfds_created[0]));
}

TEST_CASE("concurrent submissions each arrive whole", "[transport]") {
  fake_sys::reset();
  FakeDaemon daemon;
  Transport transport(TransportOptions{.socket_path = daemon.path});
  const int threads = 4;
  const int per_thread = 10;
  std::vector<std::thread> senders;
  for (int t = 0; t < threads; ++t) {
    senders.emplace_back([&transport, t]() {
      for (int i = 0; i < per_thread; ++i) {
        Entry entry;
        (void)entry.add("SENDER", std::to_string(t));
        (void)entry.add("MESSAGE", "line " + std::to_string(i) + "\nof " + std::to_string(t));
        if (transport.send(entry) != Error::SUCCESS) {
          fprintf(stderr, "sender %d failed\n", t);
        }
      }
    });
  }
  std::vector<std::string> payloads;
  for (int i = 0; i < threads * per_thread; ++i) {
    bool sealed = false;
    payloads.push_back(daemon.receive(&sealed));
  }
  for (auto &sender : senders) {
    sender.join();
  }
  for (const auto &payload : payloads) {
    std::vector<Field> fields;
    REQUIRE(parse_payload(payload, &fields));
    REQUIRE(fields.size() == 2);
    REQUIRE(fields[0].name == "SENDER");
    REQUIRE(fields[1].value.find("\nof " + fields[0].value) != std::string::npos);
  }
}
