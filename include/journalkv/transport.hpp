#ifndef JOURNALKV_TRANSPORT_HPP
#define JOURNALKV_TRANSPORT_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

#include "journalkv/entry.hpp"
#include "journalkv/error.hpp"
#include "journalkv/unique_fd.hpp"

namespace journalkv {

/**
 * @brief how a submitted payload reached the journal socket.
 */
enum Delivery {
  DELIVERY_NONE,
  DELIVERY_DATAGRAM,     // sent inline as a single datagram.
  DELIVERY_SEALED_MEMORY, // written to a sealed memfd whose descriptor was sent instead.
};

struct TransportOptions {
  std::string socket_path = "/run/systemd/journal/socket";
  // SO_SNDBUF for the submission socket. The kernel rejects datagrams that do not fit in it, which
  // is what switches a payload to the memfd path. 0 keeps the kernel default.
  int send_buffer_size = 8 * 1024 * 1024;
};

/**
 * @brief submits encoded entries to the journal socket.
 *
 * The socket is opened on first use. submit() and send() may be called concurrently from
 * several threads; each call is delivered as one independent datagram.
 */
class Transport {
public:
  explicit Transport(TransportOptions options = {});

  Transport(const Transport &) = delete;
  Transport &operator=(const Transport &) = delete;

  /**
   * @brief delivers an encoded payload. Payloads the socket will not take in one datagram are
   * written to a sealed memfd and passed by descriptor.
   *
   * @returns Error::TRANSPORT_UNAVAILABLE if the socket cannot be reached or either send fails.
   */
  Error submit(std::string_view payload, Delivery *delivery = nullptr);

  /**
   * @brief encodes `entry` and submits it.
   */
  Error send(const Entry &entry, Delivery *delivery = nullptr);

  const TransportOptions &options() const { return options_; }

  /**
   * @brief the errno behind the most recent TRANSPORT_UNAVAILABLE, or 0.
   */
  int last_errno() const { return last_errno_; }

private:
  Error ensure_socket();
  Error send_datagram(std::string_view payload, int *err);
  Error send_sealed(std::string_view payload);
  Error fail(int err);

  TransportOptions options_;
  std::mutex mutex_;
  UniqueFd fd_;
  std::atomic<int> last_errno_{0};
};

/**
 * @brief submits `entry` through a process-wide Transport with default options.
 */
Error send(const Entry &entry);

/**
 * @brief submits a PRIORITY and MESSAGE entry through the process-wide Transport.
 */
Error print(Priority priority, std::string_view message);

} // namespace journalkv

#endif
