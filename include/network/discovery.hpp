// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/error.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include "util/channel.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <variant>

namespace bacnet {
namespace util {
class ThreadPool;
}

namespace network {

// One I-Am reply. Replies are not deduplicated.
struct Device {
  uint32_t device_id = 0;
  uint16_t vendor_id = 0;
  Endpoint address;
  uint32_t max_apdu_length = 0;
  protocol::Segmentation segmentation = protocol::Segmentation::None;
};

// Either a discovered device or a per-datagram error. Errors do not end the
// stream; only the end of the channel does.
using DiscoveryResult = std::variant<Device, Error>;

/**
 * Discovery - broadcast Who-Is and collect I-Am replies in the background
 *
 * discover() sends the probe synchronously and then hands the socket to a
 * collection task on the worker pool. The task ends when no datagram arrived
 * for a whole window (each datagram restarts the window) or when the caller
 * drops the receiver; either way the socket is released and the channel
 * closes.
 *
 * The factory and the pool must outlive every discovery started here.
 */
class Discovery {
public:
  struct Config {
    std::chrono::milliseconds window = protocol::DISCOVERY_WINDOW;
    std::chrono::milliseconds send_timeout = protocol::DISCOVERY_SEND_TIMEOUT;
    size_t channel_capacity = protocol::DISCOVERY_CHANNEL_CAPACITY;
  };

  Discovery(TransportFactory &factory, util::ThreadPool &pool);
  Discovery(TransportFactory &factory, util::ThreadPool &pool, const Config &config);

  /**
   * Broadcast a Who-Is to `broadcast` and start collecting replies
   *
   * @param window inactivity window override for this run
   * @throws Error if the broadcast socket cannot be bound or the probe
   *         cannot be sent; no task is started in that case
   * @throws std::runtime_error if the pool no longer accepts tasks
   */
  util::Receiver<DiscoveryResult>
  discover(const Endpoint &broadcast,
           std::optional<std::chrono::milliseconds> window = std::nullopt);

  const Config &config() const { return config_; }

private:
  static void Collect(Transport &transport, util::Sender<DiscoveryResult> &results,
                      std::chrono::milliseconds window);

  TransportFactory &factory_;
  util::ThreadPool &pool_;
  Config config_;
};

} // namespace network
} // namespace bacnet
