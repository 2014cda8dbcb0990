#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace bacnet {
namespace network {

/**
 * UdpTransport - UDP socket implementation of Transport
 *
 * Wraps boost::asio::ip::udp::socket and provides the blocking, timeout-bounded
 * interface. The socket work itself runs on the factory's IO threads,
 * serialized on a per-transport strand; the calling thread only waits on the
 * completion. Callers must therefore never block an IO thread in read() or
 * write().
 */
class UdpTransport : public Transport {
public:
  UdpTransport(boost::asio::io_context &io_context,
               std::shared_ptr<boost::asio::ip::udp::socket> socket,
               const Endpoint &peer, const std::atomic<bool> &running);
  ~UdpTransport() override;

  // Non-copyable, non-movable (the strand refers to this socket only)
  UdpTransport(const UdpTransport &) = delete;
  UdpTransport &operator=(const UdpTransport &) = delete;
  UdpTransport(UdpTransport &&) = delete;
  UdpTransport &operator=(UdpTransport &&) = delete;

  // Transport interface
  Datagram read(uint8_t *buf, size_t len) override;
  size_t write(const uint8_t *data, size_t len) override;
  void set_timeout(std::chrono::milliseconds timeout) override { timeout_ = timeout; }
  std::chrono::milliseconds timeout() const override { return timeout_; }
  const Endpoint &peer() const override { return peer_; }
  Endpoint local_endpoint() const override;

private:
  struct Completion {
    boost::system::error_code ec;
    size_t bytes = 0;
  };

  // Wait for a posted operation. On timeout the operation is cancelled on the
  // strand and its (aborted) completion is awaited before throwing.
  Completion await(std::future<Completion> &future, const char *what);

  void ensure_running(const char *what) const;

  std::shared_ptr<boost::asio::ip::udp::socket> socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  Endpoint peer_;
  std::chrono::milliseconds timeout_;
  // Owned by the factory, which outlives its transports
  const std::atomic<bool> &running_;
};

/**
 * UdpTransportFactory - boost::asio implementation of TransportFactory
 *
 * Owns the io_context and its IO threads. Must outlive every transport it
 * creates. run() must be called before transports are used.
 */
class UdpTransportFactory : public TransportFactory {
public:
  /**
   * Create factory with specified number of IO threads
   */
  explicit UdpTransportFactory(size_t io_threads = 1);
  ~UdpTransportFactory() override;

  UdpTransportFactory(const UdpTransportFactory &) = delete;
  UdpTransportFactory &operator=(const UdpTransportFactory &) = delete;

  // TransportFactory interface
  std::unique_ptr<Transport> connect(const Endpoint &peer) override;
  std::unique_ptr<Transport> connect_broadcast(const Endpoint &peer) override;

  // Start IO threads (idempotent)
  void run();
  // Stop and join IO threads (idempotent)
  void stop();
  bool is_running() const { return running_; }

  boost::asio::io_context &io_context() { return *io_context_; }

private:
  std::shared_ptr<boost::asio::ip::udp::socket> open_socket(const Endpoint &peer);

  // NOTE: io_context_ is destroyed only in the destructor, after the IO
  // threads have been joined, so strands and sockets never outlive it.
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  size_t desired_io_threads_{1};
};

} // namespace network
} // namespace bacnet
