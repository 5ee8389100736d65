#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include "journalkv/sys.hpp"

namespace journalkv::sys {

int socket(int domain, int type, int protocol) { return ::socket(domain, type, protocol); }

ssize_t sendmsg(int fd, const struct msghdr *msg, int flags) { return ::sendmsg(fd, msg, flags); }

int memfd_create(const char *name, unsigned int flags) { return ::memfd_create(name, flags); }

ssize_t write(int fd, const void *buf, size_t count) { return ::write(fd, buf, count); }

int add_seals(int fd, int seals) { return ::fcntl(fd, F_ADD_SEALS, seals); }

int close(int fd) { return ::close(fd); }

} // namespace journalkv::sys
