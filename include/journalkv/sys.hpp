#ifndef JOURNALKV_SYS_HPP
#define JOURNALKV_SYS_HPP

#include <sys/socket.h>
#include <sys/types.h>

/**
 * The kernel calls made by the transport. They live in their own translation unit so tests can
 * link a replacement that injects failures.
 */
namespace journalkv::sys {

int socket(int domain, int type, int protocol);
ssize_t sendmsg(int fd, const struct msghdr *msg, int flags);
int memfd_create(const char *name, unsigned int flags);
ssize_t write(int fd, const void *buf, size_t count);
int add_seals(int fd, int seals);
int close(int fd);

} // namespace journalkv::sys

#endif
