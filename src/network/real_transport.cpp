// Copyright (c) 2025 The Unicity Foundation
// UDP transport implementation using boost::asio datagram sockets

#include "network/real_transport.hpp"
#include "network/error.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <sys/socket.h>

namespace bacnet {
namespace network {

namespace {

using udp = boost::asio::ip::udp;

#ifdef SO_REUSEPORT
using reuse_port = boost::asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;
#endif

// How often a cancelled operation re-checks that the IO threads still run
constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL{50};

} // namespace

// ============================================================================
// UdpTransport
// ============================================================================

UdpTransport::UdpTransport(boost::asio::io_context &io_context,
                           std::shared_ptr<udp::socket> socket,
                           const Endpoint &peer,
                           const std::atomic<bool> &running)
    : socket_(std::move(socket)), strand_(io_context.get_executor()),
      peer_(peer), timeout_(protocol::DEFAULT_TIMEOUT), running_(running) {}

UdpTransport::~UdpTransport() {
  // A cancel posted by a timed-out operation may still be queued on the
  // strand, so the close goes through the strand as well. Without IO threads
  // nothing else can touch the socket.
  auto socket = socket_;
  if (running_.load()) {
    boost::asio::post(strand_, [socket]() {
      boost::system::error_code ec;
      socket->close(ec);
    });
    return;
  }
  boost::system::error_code ec;
  socket->close(ec);
}

void UdpTransport::ensure_running(const char *what) const {
  if (!running_.load()) {
    throw Error(ErrorKind::Io, std::string(what) + " failed: transport is not running");
  }
}

Datagram UdpTransport::read(uint8_t *buf, size_t len) {
  ensure_running("receive");

  auto result = std::make_shared<std::promise<Completion>>();
  auto future = result->get_future();
  auto sender = std::make_shared<Endpoint>();
  auto socket = socket_;
  auto strand = strand_;

  boost::asio::post(strand_, [socket, strand, buf, len, sender, result]() {
    socket->async_receive_from(
        boost::asio::buffer(buf, len), *sender,
        boost::asio::bind_executor(
            strand, [sender, result](const boost::system::error_code &ec, size_t n) {
              result->set_value(Completion{ec, n});
            }));
  });

  Completion done = await(future, "receive");
  if (done.ec) {
    LOG_NET_TRACE("receive error on {}: {}", util::FormatEndpoint(local_endpoint()),
                  done.ec.message());
    throw Error(ErrorKind::Io, "receive failed: " + done.ec.message());
  }

  LOG_NET_TRACE("received {} bytes from {}", done.bytes, util::FormatEndpoint(*sender));
  return Datagram{done.bytes, *sender};
}

size_t UdpTransport::write(const uint8_t *data, size_t len) {
  ensure_running("send");

  auto result = std::make_shared<std::promise<Completion>>();
  auto future = result->get_future();
  auto socket = socket_;
  auto strand = strand_;
  Endpoint peer = peer_;

  boost::asio::post(strand_, [socket, strand, data, len, peer, result]() {
    socket->async_send_to(
        boost::asio::buffer(data, len), peer,
        boost::asio::bind_executor(
            strand, [result](const boost::system::error_code &ec, size_t n) {
              result->set_value(Completion{ec, n});
            }));
  });

  Completion done = await(future, "send");
  if (done.ec) {
    LOG_NET_TRACE("send to {} failed: {}", util::FormatEndpoint(peer_), done.ec.message());
    throw Error(ErrorKind::Io, "send to " + util::FormatEndpoint(peer_) +
                                   " failed: " + done.ec.message());
  }

  LOG_NET_TRACE("sent {} bytes to {}", done.bytes, util::FormatEndpoint(peer_));
  return done.bytes;
}

UdpTransport::Completion UdpTransport::await(std::future<Completion> &future,
                                             const char *what) {
  if (future.wait_for(timeout_) == std::future_status::ready) {
    return future.get();
  }

  auto socket = socket_;
  boost::asio::post(strand_, [socket]() {
    if (!socket->is_open()) {
      return;
    }
    boost::system::error_code ec;
    socket->cancel(ec);
  });

  while (future.wait_for(CANCEL_POLL_INTERVAL) != std::future_status::ready) {
    if (!running_.load()) {
      throw Error(ErrorKind::Io, std::string(what) + " interrupted: transport stopped");
    }
  }

  Completion done = future.get();
  if (done.ec == boost::asio::error::operation_aborted) {
    throw Error(ErrorKind::Timeout, std::string(what) + " timed out after " +
                                        std::to_string(timeout_.count()) + " ms");
  }
  // Completed before the cancel reached the socket
  return done;
}

Endpoint UdpTransport::local_endpoint() const {
  boost::system::error_code ec;
  auto ep = socket_->local_endpoint(ec);
  return ec ? Endpoint{} : ep;
}

// ============================================================================
// UdpTransportFactory
// ============================================================================

UdpTransportFactory::UdpTransportFactory(size_t io_threads)
    : io_context_(std::make_unique<boost::asio::io_context>()),
      desired_io_threads_(io_threads == 0 ? 1 : io_threads) {}

UdpTransportFactory::~UdpTransportFactory() { stop(); }

std::shared_ptr<udp::socket> UdpTransportFactory::open_socket(const Endpoint &peer) {
  auto socket = std::make_shared<udp::socket>(*io_context_);
  boost::system::error_code ec;
  socket->open(peer.protocol(), ec);
  if (ec) {
    throw Error(ErrorKind::Io, "failed to open socket: " + ec.message());
  }
  return socket;
}

std::unique_ptr<Transport> UdpTransportFactory::connect(const Endpoint &peer) {
  auto socket = open_socket(peer);

  boost::system::error_code ec;
  socket->bind(Endpoint(peer.protocol(), 0), ec);
  if (ec) {
    throw Error(ErrorKind::Io, "failed to bind local socket: " + ec.message());
  }

  auto transport = std::make_unique<UdpTransport>(*io_context_, std::move(socket), peer, running_);
  LOG_NET_DEBUG("bound {} for peer {}", util::FormatEndpoint(transport->local_endpoint()),
                util::FormatEndpoint(peer));
  return transport;
}

std::unique_ptr<Transport> UdpTransportFactory::connect_broadcast(const Endpoint &peer) {
  if (!peer.address().is_v4()) {
    throw Error(ErrorKind::Io, "broadcast requires an IPv4 address, got " +
                                   util::FormatEndpoint(peer));
  }

  auto socket = open_socket(peer);

  boost::system::error_code ec;
  socket->set_option(udp::socket::reuse_address(true), ec);
  if (ec) {
    throw Error(ErrorKind::Io, "failed to set SO_REUSEADDR: " + ec.message());
  }
#ifdef SO_REUSEPORT
  socket->set_option(reuse_port(true), ec);
  if (ec) {
    throw Error(ErrorKind::Io, "failed to set SO_REUSEPORT: " + ec.message());
  }
#endif
  socket->bind(Endpoint(boost::asio::ip::address_v4::any(), peer.port()), ec);
  if (ec) {
    throw Error(ErrorKind::Io, "failed to bind port " + std::to_string(peer.port()) +
                                   ": " + ec.message());
  }
  socket->set_option(boost::asio::socket_base::broadcast(true), ec);
  if (ec) {
    throw Error(ErrorKind::Io, "failed to enable broadcast: " + ec.message());
  }

  LOG_NET_DEBUG("bound broadcast socket on port {} for {}", peer.port(),
                util::FormatEndpoint(peer));
  return std::make_unique<UdpTransport>(*io_context_, std::move(socket), peer, running_);
}

void UdpTransportFactory::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < desired_io_threads_; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
}

void UdpTransportFactory::stop() {
  running_.store(false);

  // Don't log here - this is called from destructor, logger may be shut down

  work_guard_.reset();
  if (io_context_) {
    io_context_->stop();
  }

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
}

} // namespace network
} // namespace bacnet
