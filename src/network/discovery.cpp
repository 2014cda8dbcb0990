// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/discovery.hpp"
#include "network/message.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/threadpool.hpp"
#include <array>

namespace bacnet {
namespace network {

namespace {

// A socket that fails this many times in a row is considered dead
constexpr int MAX_CONSECUTIVE_IO_ERRORS = 16;

} // namespace

Discovery::Discovery(TransportFactory &factory, util::ThreadPool &pool)
    : Discovery(factory, pool, Config{}) {}

Discovery::Discovery(TransportFactory &factory, util::ThreadPool &pool, const Config &config)
    : factory_(factory), pool_(pool), config_(config) {}

util::Receiver<DiscoveryResult>
Discovery::discover(const Endpoint &broadcast,
                    std::optional<std::chrono::milliseconds> window) {
  const auto collect_window = window.value_or(config_.window);

  // Probe: synchronous, so that bind/send failures reach the caller directly
  std::unique_ptr<Transport> transport = factory_.connect_broadcast(broadcast);
  transport->set_timeout(config_.send_timeout);
  std::vector<uint8_t> probe =
      message::Encode(message::MakeUnconfirmedRequest(message::WhoIs{}, true));
  transport->write(probe.data(), probe.size());

  LOG_DISC_INFO("who-is sent to {}, collecting replies (window {} ms)",
                util::FormatEndpoint(broadcast), collect_window.count());

  auto [tx, rx] = util::MakeChannel<DiscoveryResult>(config_.channel_capacity);
  pool_.enqueue([transport = std::move(transport), tx = std::move(tx),
                 collect_window]() mutable {
    try {
      Collect(*transport, tx, collect_window);
    } catch (const std::exception &e) {
      LOG_DISC_ERROR("discovery task failed: {}", e.what());
      if (!tx.Send(Error(ErrorKind::Io, std::string("discovery failed: ") + e.what()))) {
        LOG_DISC_DEBUG("receiver dropped before the failure could be reported");
      }
    }
    // Release the socket and end the stream before the task object goes away
    transport.reset();
    tx.Close();
  });
  return std::move(rx);
}

void Discovery::Collect(Transport &transport, util::Sender<DiscoveryResult> &results,
                        std::chrono::milliseconds window) {
  transport.set_timeout(window);

  std::array<uint8_t, protocol::BUFFER_SIZE> buffer;
  size_t devices = 0;
  int io_errors = 0;

  while (true) {
    buffer.fill(0);

    Datagram datagram;
    try {
      datagram = transport.read(buffer.data(), buffer.size());
      io_errors = 0;
    } catch (const Error &e) {
      if (e.is_timeout()) {
        LOG_DISC_INFO("no reply for {} ms, discovery finished with {} devices",
                      window.count(), devices);
        break;
      }
      LOG_DISC_WARN("receive error during discovery: {}", e.what());
      if (!results.Send(e)) {
        break;
      }
      if (++io_errors >= MAX_CONSECUTIVE_IO_ERRORS) {
        LOG_DISC_WARN("giving up after {} consecutive receive errors", io_errors);
        break;
      }
      continue;
    }

    if (results.IsClosed()) {
      LOG_DISC_DEBUG("receiver dropped, stopping discovery");
      break;
    }

    message::DataLink frame;
    try {
      frame = message::Decode(buffer.data(), datagram.size);
    } catch (const Error &e) {
      LOG_DISC_DEBUG("undecodable datagram from {}: {}",
                     util::FormatEndpoint(datagram.sender), e.what());
      if (!results.Send(e)) {
        break;
      }
      continue;
    }

    const message::Apdu *apdu = message::GetApdu(frame);
    const auto *request = apdu ? std::get_if<message::UnconfirmedRequest>(apdu) : nullptr;
    const auto *i_am = request ? std::get_if<message::IAm>(&request->service) : nullptr;
    if (!i_am) {
      LOG_DISC_TRACE("ignoring non-I-Am datagram from {}",
                     util::FormatEndpoint(datagram.sender));
      continue;
    }

    Device device;
    device.device_id = i_am->device_id.instance;
    device.vendor_id = i_am->vendor_id;
    device.address = datagram.sender;
    device.max_apdu_length = i_am->max_apdu_length;
    device.segmentation = i_am->segmentation;

    LOG_DISC_DEBUG("device {} (vendor {}) at {}", device.device_id, device.vendor_id,
                   util::FormatEndpoint(device.address));
    if (!results.Send(std::move(device))) {
      LOG_DISC_DEBUG("receiver dropped, stopping discovery");
      break;
    }
    ++devices;
  }
}

} // namespace network
} // namespace bacnet
